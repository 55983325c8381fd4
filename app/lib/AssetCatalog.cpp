#include "AssetCatalog.hpp"
#include "Utils.hpp"

#include <system_error>

namespace {

const std::vector<std::string> kServerLibraryPrefixes = {"libllama.", "libggml"};

std::string current_platform()
{
#ifdef _WIN32
    return "windows";
#elif defined(__APPLE__)
    return "darwin";
#else
    return "linux";
#endif
}

std::string current_architecture()
{
#if defined(__aarch64__) || defined(_M_ARM64)
    return "arm64";
#else
    return "x64";
#endif
}

} // namespace


const std::vector<AssetDescriptor>& model_catalog()
{
    static const std::vector<AssetDescriptor> catalog = {
        {"gemma-2-2b-it-q4",
         "Gemma 2 2B (Q4)",
         "Google's Gemma 2 2B instruction-tuned, quantized to Q4_K_M. Fast and efficient.",
         1500000000ULL,
         "https://huggingface.co/google/gemma-2-2b-it-GGUF/resolve/main/gemma-2-2b-it-q4_k_m.gguf",
         "gemma-2-2b-it-q4_k_m.gguf"},
        {"gemma-2-9b-it-q4",
         "Gemma 2 9B (Q4)",
         "Google's Gemma 2 9B instruction-tuned, quantized to Q4_K_M. Better quality, slower.",
         5400000000ULL,
         "https://huggingface.co/google/gemma-2-9b-it-GGUF/resolve/main/gemma-2-9b-it-q4_k_m.gguf",
         "gemma-2-9b-it-q4_k_m.gguf"},
        {"phi-3-mini-4k-q4",
         "Phi 3 Mini (Q4)",
         "Microsoft's Phi 3 Mini 4K context, quantized to Q4_K_M. Very compact.",
         2200000000ULL,
         "https://huggingface.co/microsoft/Phi-3-mini-4k-instruct-gguf/resolve/main/Phi-3-mini-4k-instruct-q4.gguf",
         "Phi-3-mini-4k-instruct-q4.gguf"},
        {"qwen2.5-1.5b-q4",
         "Qwen 2.5 1.5B (Q4)",
         "Alibaba's Qwen 2.5 1.5B, quantized to Q4_K_M. Very fast, good for simple summaries.",
         1100000000ULL,
         "https://huggingface.co/Qwen/Qwen2.5-1.5B-Instruct-GGUF/resolve/main/qwen2.5-1.5b-instruct-q4_k_m.gguf",
         "qwen2.5-1.5b-instruct-q4_k_m.gguf"},
    };
    return catalog;
}


std::optional<AssetDescriptor> find_model(const std::string& id)
{
    for (const auto& entry : model_catalog()) {
        if (entry.id == id) {
            return entry;
        }
    }
    return std::nullopt;
}


std::vector<ModelListing> list_models(const std::filesystem::path& models_dir)
{
    std::vector<ModelListing> listings;
    listings.reserve(model_catalog().size());
    for (const auto& entry : model_catalog()) {
        ModelListing listing;
        listing.asset = entry;
        listing.size_bytes = entry.expected_size_bytes;

        std::error_code ec;
        const auto path = models_dir / entry.filename;
        if (std::filesystem::is_regular_file(path, ec)) {
            const auto size = std::filesystem::file_size(path, ec);
            listing.downloaded = true;
            if (!ec) {
                listing.size_bytes = size;
            }
        }
        listings.push_back(std::move(listing));
    }
    return listings;
}


std::optional<ServerArchiveDescriptor> server_archive_for(const std::string& platform,
                                                          const std::string& architecture)
{
    if (architecture != "x64" && architecture != "arm64") {
        return std::nullopt;
    }

    std::string flavor;
    std::uint64_t expected_size = 0;
    std::string executable = "llama-server";
    if (platform == "linux") {
        flavor = "ubuntu-" + architecture;
        expected_size = 50000000ULL;
    } else if (platform == "darwin") {
        flavor = "macos-" + architecture;
        expected_size = 30000000ULL;
    } else if (platform == "windows") {
        flavor = "win-" + architecture;
        expected_size = 60000000ULL;
        executable = "llama-server.exe";
    } else {
        return std::nullopt;
    }

    const std::string release = kLlamaCppRelease;
    const std::string archive_name = "llama-" + release + "-bin-" + flavor + ".zip";

    ServerArchiveDescriptor descriptor;
    descriptor.asset.id = "llama-server";
    descriptor.asset.name = "llama.cpp server " + release;
    descriptor.asset.description = "Local completion server used by the bundled engine.";
    descriptor.asset.expected_size_bytes = expected_size;
    descriptor.asset.url = "https://github.com/ggerganov/llama.cpp/releases/download/" + release + "/" + archive_name;
    descriptor.asset.filename = archive_name;
    descriptor.platform = platform;
    descriptor.architecture = architecture;
    descriptor.executable_name = executable;
    descriptor.library_prefixes = kServerLibraryPrefixes;
    descriptor.release = release;
    return descriptor;
}


std::optional<ServerArchiveDescriptor> current_server_archive()
{
    return server_archive_for(current_platform(), current_architecture());
}


std::string server_executable_name()
{
#ifdef _WIN32
    return "llama-server.exe";
#else
    return "llama-server";
#endif
}


std::filesystem::path default_model_path(const std::string& model_id)
{
    const auto model = find_model(model_id);
    const std::string filename = model ? model->filename : find_model(kDefaultModelId)->filename;
    return Utils::get_models_directory() / filename;
}


std::filesystem::path default_server_path()
{
    return Utils::get_server_bin_directory() / server_executable_name();
}
