#ifndef ASSETCATALOG_HPP
#define ASSETCATALOG_HPP

#include "Types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

constexpr const char* kDefaultModelId = "gemma-2-2b-it-q4";
constexpr const char* kLlamaCppRelease = "b4547";

/**
 * @brief Returns the downloadable models in display order.
 */
const std::vector<AssetDescriptor>& model_catalog();

/**
 * @brief Looks up a model by id.
 * @return The descriptor, or std::nullopt for unknown ids.
 */
std::optional<AssetDescriptor> find_model(const std::string& id);

struct ModelListing {
    AssetDescriptor asset;
    bool downloaded{false};
    std::uint64_t size_bytes{0}; ///< On-disk size when downloaded, expected size otherwise.
};

/**
 * @brief Annotates every catalog entry with its download state in @p models_dir.
 */
std::vector<ModelListing> list_models(const std::filesystem::path& models_dir);

/**
 * @brief Resolves the llama.cpp release archive for a platform/architecture pair.
 * @param platform "linux", "darwin" or "windows".
 * @param architecture "x64" or "arm64".
 */
std::optional<ServerArchiveDescriptor> server_archive_for(const std::string& platform,
                                                          const std::string& architecture);

/**
 * @brief Archive descriptor for the platform this binary was built for.
 */
std::optional<ServerArchiveDescriptor> current_server_archive();

std::string server_executable_name();

std::filesystem::path default_model_path(const std::string& model_id = kDefaultModelId);
std::filesystem::path default_server_path();

#endif // ASSETCATALOG_HPP
