#include "AppException.hpp"
#include "AssetCatalog.hpp"
#include "AssetDownloader.hpp"
#include "BundledProcessManager.hpp"
#include "InferenceService.hpp"
#include "Logger.hpp"
#include "SessionJson.hpp"
#include "Settings.hpp"
#include "Utils.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <vector>
#include <curl/curl.h>
#include <spdlog/fmt/fmt.h>


bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}


namespace {

struct CurlCleanup {
    ~CurlCleanup() { curl_global_cleanup(); }
};

volatile std::sig_atomic_t g_stop_requested = 0;

extern "C" void handle_stop_signal(int)
{
    g_stop_requested = 1;
}

using Arguments = std::vector<std::string>;
using CommandHandler = std::function<int(const Arguments&)>;

void print_usage()
{
    fmt::print(
        "Usage: traq-inference <command> [arguments]\n"
        "\n"
        "Commands:\n"
        "  status                      Show the active engine and its state\n"
        "  setup                       Check whether the active engine is ready\n"
        "  models                      List downloadable models\n"
        "  download-model <id>         Download a model into the data directory\n"
        "  delete-model <id>           Remove a downloaded model\n"
        "  download-server             Download and install llama-server\n"
        "  start                       Run the bundled server until interrupted\n"
        "  stop                        Stop a bundled server left by another run\n"
        "  summarize <session.json> [output.json]\n"
        "                              Summarize a recorded session\n"
        "  ollama-setup                Inspect the Ollama installation\n"
        "  ollama-pull <model>         Pull a model into Ollama\n");
}

const char* yes_no(bool value)
{
    return value ? "yes" : "no";
}

// Single-line progress on stderr, redrawn in place.
class ProgressPrinter {
public:
    explicit ProgressPrinter(std::string label) : label_(std::move(label)) {}

    void update(long long downloaded, long long total)
    {
        const auto now = std::chrono::steady_clock::now();
        if (downloaded < total && now - last_ < std::chrono::milliseconds(200)) {
            return;
        }
        last_ = now;
        if (total > 0) {
            const double percent = 100.0 * static_cast<double>(downloaded) / static_cast<double>(total);
            std::fprintf(stderr, "\r%s: %5.1f%% (%s / %s)", label_.c_str(), percent,
                         Utils::format_size(static_cast<std::uint64_t>(downloaded)).c_str(),
                         Utils::format_size(static_cast<std::uint64_t>(total)).c_str());
        } else {
            std::fprintf(stderr, "\r%s: %s", label_.c_str(),
                         Utils::format_size(static_cast<std::uint64_t>(downloaded)).c_str());
        }
        std::fflush(stderr);
    }

    void finish() const
    {
        std::fprintf(stderr, "\n");
    }

private:
    std::string label_;
    std::chrono::steady_clock::time_point last_{};
};

Settings load_settings()
{
    Settings settings;
    settings.load();
    return settings;
}

AssetDescriptor require_model(const std::string& id)
{
    auto asset = find_model(id);
    if (!asset) {
        THROW_APP_ERROR(ErrorCodes::Code::DOWNLOAD_UNKNOWN_ASSET, id);
    }
    return *asset;
}

int cmd_status(const Arguments&)
{
    Settings settings = load_settings();
    InferenceService service(settings.to_inference_config());
    const InferenceStatus status = service.get_status();

    fmt::print("Config:            {}\n", settings.get_config_path());
    fmt::print("Engine:            {}\n", status.engine);
    fmt::print("Available:         {}\n", yes_no(status.available));
    fmt::print("Model:             {}\n", status.model_name.empty() ? "-" : status.model_name);
    switch (settings.get_engine()) {
        case BackendKind::Bundled: {
            const BundledStatus bundled = service.get_bundled_status();
            fmt::print("Server running:    {}\n", yes_no(status.bundled_running));
            fmt::print("Server healthy:    {}\n", yes_no(status.bundled_ready));
            fmt::print("Server installed:  {} ({})\n", yes_no(bundled.server_present), bundled.server_path);
            fmt::print("Model downloaded:  {} ({})\n", yes_no(bundled.model_present), bundled.model_path);
            fmt::print("Port:              {}\n", bundled.port);
            break;
        }
        case BackendKind::ExternalLocal:
            fmt::print("Ollama reachable:  {}\n", yes_no(status.external_reachable));
            break;
        case BackendKind::RemoteCloud:
            fmt::print("Cloud configured:  {}\n", yes_no(status.cloud_configured));
            break;
    }
    return 0;
}

int cmd_setup(const Arguments&)
{
    Settings settings = load_settings();
    InferenceService service(settings.to_inference_config());
    const SetupStatus status = service.get_setup_status();
    if (status.ready) {
        fmt::print("{} engine is ready.\n", status.engine);
        return 0;
    }
    fmt::print("{} engine is not ready: {}\n", status.engine, status.issue);
    if (!status.suggestion.empty()) {
        fmt::print("Suggestion: {}\n", status.suggestion);
    }
    return 1;
}

int cmd_models(const Arguments&)
{
    for (const auto& listing : list_models(Utils::get_models_directory())) {
        fmt::print("{:<20} {:>10}  {:<3}  {}\n", listing.asset.id,
                   Utils::format_size(listing.size_bytes),
                   listing.downloaded ? "[x]" : "[ ]",
                   listing.asset.description);
    }
    return 0;
}

int cmd_download_model(const Arguments& args)
{
    if (args.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_REQUIRED_FIELD_MISSING, "Missing model id", "download-model <id>");
    }
    const AssetDescriptor asset = require_model(args[0]);
    AssetDownloader downloader;
    ProgressPrinter progress(asset.name);
    const auto path = downloader.download(asset, Utils::get_models_directory(),
                                          [&progress](long long done, long long total) {
                                              progress.update(done, total);
                                          });
    progress.finish();
    fmt::print("Downloaded {} to {}\n", asset.id, Utils::path_to_utf8(path));

    const Settings settings = load_settings();
    if (asset.id != kDefaultModelId && settings.get_bundled_model_id() != asset.id) {
        fmt::print("Set [Bundled] ModelId = {} in {} to use it.\n", asset.id, settings.get_config_path());
    }
    return 0;
}

int cmd_delete_model(const Arguments& args)
{
    if (args.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_REQUIRED_FIELD_MISSING, "Missing model id", "delete-model <id>");
    }
    const AssetDescriptor asset = require_model(args[0]);
    AssetDownloader::delete_asset(asset, Utils::get_models_directory());
    fmt::print("Deleted {}\n", asset.id);
    return 0;
}

int cmd_download_server(const Arguments&)
{
    const auto descriptor = current_server_archive();
    if (!descriptor) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::DOWNLOAD_UNKNOWN_ASSET,
                            "No prebuilt llama-server for this platform", "llama-server");
    }
    AssetDownloader downloader;
    ProgressPrinter progress(descriptor->asset.name);
    const auto path = downloader.download_server_archive(*descriptor, Utils::get_server_bin_directory(),
                                                         [&progress](long long done, long long total) {
                                                             progress.update(done, total);
                                                         });
    progress.finish();
    fmt::print("Installed llama-server {} at {}\n", descriptor->release, Utils::path_to_utf8(path));
    return 0;
}

int cmd_start(const Arguments&)
{
    Settings settings = load_settings();
    InferenceService service(settings.to_inference_config());

    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    service.start_bundled();
    const BundledStatus status = service.get_bundled_status();
    fmt::print("llama-server listening on http://127.0.0.1:{} (Ctrl+C to stop)\n", status.port);
    std::fflush(stdout);

    while (!g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    service.shutdown();
    fmt::print("llama-server stopped\n");
    return 0;
}

int cmd_stop(const Arguments&)
{
    Settings settings = load_settings();
    BundledProcessManager manager(InferenceService::with_default_paths(settings.get_bundled()));
    if (manager.reclaim_stale_process()) {
        fmt::print("Stopped llama-server\n");
    } else {
        fmt::print("No llama-server started by traq-inference is running\n");
    }
    return 0;
}

int cmd_summarize(const Arguments& args)
{
    if (args.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_REQUIRED_FIELD_MISSING,
                            "Missing session file", "summarize <session.json>");
    }
    const SessionContext session = SessionJson::read_session_file(Utils::utf8_to_path(args[0]));

    Settings settings = load_settings();
    InferenceService service(settings.to_inference_config());
    const SummaryResult result = service.generate_summary(session);
    const std::string json = SessionJson::summary_to_json(result);

    if (args.size() > 1) {
        std::ofstream out(Utils::utf8_to_path(args[1]), std::ios::trunc);
        if (!out.is_open() || !(out << json << "\n")) {
            THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, args[1]);
        }
    } else {
        fmt::print("{}\n", json);
    }
    return 0;
}

int cmd_ollama_setup(const Arguments&)
{
    Settings settings = load_settings();
    InferenceConfig config = settings.to_inference_config();
    config.backend = settings.get_external();
    InferenceService service(config);

    const ExternalSetupInfo info = service.check_external_setup();
    fmt::print("Ollama reachable:  {} ({})\n", yes_no(info.reachable), settings.get_external().host);
    if (!info.reachable) {
        fmt::print("Install Ollama from https://ollama.com and start it with: ollama serve\n");
        return 1;
    }
    fmt::print("Installed models:  {}\n", info.installed_models.empty() ? "none" : "");
    for (const auto& model : info.installed_models) {
        fmt::print("  {}\n", model);
    }
    fmt::print("Recommended:       {}{}\n", info.recommended_model,
               info.has_recommended ? "" : " (not installed)");
    if (info.needs_setup) {
        fmt::print("Run: traq-inference ollama-pull {}\n", info.recommended_model);
        return 1;
    }
    return 0;
}

int cmd_ollama_pull(const Arguments& args)
{
    if (args.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_REQUIRED_FIELD_MISSING, "Missing model name", "ollama-pull <model>");
    }
    Settings settings = load_settings();
    InferenceConfig config = settings.to_inference_config();
    config.backend = settings.get_external();
    InferenceService service(config);

    std::string last_status;
    service.pull_external_model(args[0], [&last_status](const PullProgress& progress) {
        if (progress.total > 0) {
            const double percent = 100.0 * static_cast<double>(progress.completed)
                                   / static_cast<double>(progress.total);
            std::fprintf(stderr, "\r%s: %5.1f%%", progress.status.c_str(), percent);
        } else if (progress.status != last_status) {
            std::fprintf(stderr, "\n%s", progress.status.c_str());
        }
        last_status = progress.status;
        std::fflush(stderr);
    });
    std::fprintf(stderr, "\n");
    fmt::print("Pulled {}\n", args[0]);
    return 0;
}

const std::map<std::string, CommandHandler>& commands()
{
    static const std::map<std::string, CommandHandler> table = {
        {"status", cmd_status},
        {"setup", cmd_setup},
        {"models", cmd_models},
        {"download-model", cmd_download_model},
        {"delete-model", cmd_delete_model},
        {"download-server", cmd_download_server},
        {"start", cmd_start},
        {"stop", cmd_stop},
        {"summarize", cmd_summarize},
        {"ollama-setup", cmd_ollama_setup},
        {"ollama-pull", cmd_ollama_pull},
    };
    return table;
}

} // namespace


int main(int argc, char **argv)
{
    if (argc < 2 || std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0) {
        print_usage();
        return argc < 2 ? 1 : 0;
    }

    const auto& table = commands();
    const auto command = table.find(argv[1]);
    if (command == table.end()) {
        std::fprintf(stderr, "Unknown command: %s\n\n", argv[1]);
        print_usage();
        return 1;
    }

    if (!initialize_loggers()) {
        return 1;
    }
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::fprintf(stderr, "Failed to initialize libcurl\n");
        return 1;
    }
    CurlCleanup curl_cleanup;

    const Arguments args(argv + 2, argv + argc);
    try {
        return command->second(args);
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("{} failed: {}", argv[1], ex.get_full_details());
        }
        std::fprintf(stderr, "\n%s\n", ex.get_full_details().c_str());
        return 1;
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("{} failed: {}", argv[1], ex.what());
        }
        std::fprintf(stderr, "\nError: %s\n", ex.what());
        return 1;
    }
}
