#include "AssetDownloader.hpp"
#include "AppException.hpp"
#include "ArchiveExtractor.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdio>
#include <fstream>
#include <system_error>
#include <utility>

namespace {

template <typename... Args>
void download_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("download_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

void remove_quietly(const std::filesystem::path& path)
{
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        download_log(spdlog::level::warn, "Failed to remove {}: {}", Utils::path_to_utf8(path), ec.message());
    }
}

bool is_success_status(long status)
{
    return status >= 200 && status < 300;
}

} // namespace


DownloadRegistry::Reservation::Reservation(DownloadRegistry& registry, std::string id)
    : registry_(&registry), id_(std::move(id))
{
}


DownloadRegistry::Reservation::Reservation(Reservation&& other) noexcept
    : registry_(other.registry_), id_(std::move(other.id_))
{
    other.registry_ = nullptr;
}


DownloadRegistry::Reservation::~Reservation()
{
    if (registry_) {
        registry_->release(id_);
    }
}


DownloadRegistry::Reservation DownloadRegistry::reserve(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!in_flight_.insert(id).second) {
        THROW_APP_ERROR(ErrorCodes::Code::DOWNLOAD_IN_PROGRESS, id);
    }
    return Reservation(*this, id);
}


bool DownloadRegistry::contains(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.count(id) > 0;
}


void DownloadRegistry::release(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(id);
}


AssetDownloader::AssetDownloader(StreamingTransport transport)
    : transport_(transport ? std::move(transport) : default_streaming_transport())
{
}


bool AssetDownloader::is_downloading(const std::string& asset_id) const
{
    return registry_.contains(asset_id);
}


void AssetDownloader::prepare_destination(const AssetDescriptor& asset,
                                          const std::filesystem::path& destination_dir) const
{
    std::error_code ec;
    std::filesystem::create_directories(destination_dir, ec);
    if (ec) {
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_CREATE_FAILED,
                        Utils::path_to_utf8(destination_dir) + ": " + ec.message());
    }

    const auto available = Utils::available_disk_space(destination_dir);
    if (!available) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::DOWNLOAD_FAILED,
                            "Failed to check free disk space",
                            Utils::path_to_utf8(destination_dir));
    }
    if (*available < asset.expected_size_bytes) {
        THROW_APP_ERROR(ErrorCodes::Code::DOWNLOAD_INSUFFICIENT_DISK_SPACE,
                        Utils::format_size(*available) + " available, "
                            + Utils::format_size(asset.expected_size_bytes) + " required");
    }
}


void AssetDownloader::fetch_to_file(const AssetDescriptor& asset,
                                    const std::filesystem::path& temp_path,
                                    const ProgressCallback& on_progress) const
{
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, Utils::path_to_utf8(temp_path));
    }

    long status_code = 0;
    bool write_failed = false;
    long long total = static_cast<long long>(asset.expected_size_bytes);
    long long downloaded = 0;

    StreamHandlers handlers;
    handlers.on_headers = [&](long status, long long content_length) {
        status_code = status;
        if (!is_success_status(status)) {
            return false;
        }
        if (content_length > 0) {
            total = content_length;
        }
        return true;
    };
    handlers.on_chunk = [&](const char* data, std::size_t size) {
        out.write(data, static_cast<std::streamsize>(size));
        if (!out) {
            write_failed = true;
            return false;
        }
        downloaded += static_cast<long long>(size);
        if (on_progress) {
            on_progress(downloaded, total);
        }
        return true;
    };

    HttpRequest request;
    request.method = "GET";
    request.url = asset.url;

    download_log(spdlog::level::info, "Downloading {} from {}", asset.id, asset.url);
    const HttpResponse response = transport_(request, handlers);
    out.close();

    if (status_code == 0) {
        status_code = response.status_code;
    }
    if (write_failed || (out.fail() && response.error.empty())) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, Utils::path_to_utf8(temp_path));
    }
    if (status_code != 0 && !is_success_status(status_code)) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::DOWNLOAD_HTTP_STATUS,
                            "Download failed with status: " + std::to_string(status_code),
                            asset.url);
    }
    if (!response.error.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::NETWORK_ERROR,
                            "Download error: " + response.error,
                            asset.url);
    }
    download_log(spdlog::level::info, "Fetched {} ({})", asset.id,
                 Utils::format_size(static_cast<std::uint64_t>(downloaded)));
}


std::filesystem::path AssetDownloader::download(const AssetDescriptor& asset,
                                                const std::filesystem::path& destination_dir,
                                                const ProgressCallback& on_progress)
{
    auto reservation = registry_.reserve(asset.id);
    prepare_destination(asset, destination_dir);

    const auto final_path = destination_dir / asset.filename;
    auto temp_path = final_path;
    temp_path += ".download";

    try {
        fetch_to_file(asset, temp_path, on_progress);
        std::error_code ec;
        std::filesystem::rename(temp_path, final_path, ec);
        if (ec) {
            THROW_APP_ERROR(ErrorCodes::Code::FILE_RENAME_FAILED,
                            Utils::path_to_utf8(final_path) + ": " + ec.message());
        }
    } catch (const std::exception& ex) {
        download_log(spdlog::level::warn, "Download of {} failed: {}", asset.id, ex.what());
        remove_quietly(temp_path);
        throw;
    }

    download_log(spdlog::level::info, "Saved {} to {}", asset.id, Utils::path_to_utf8(final_path));
    return final_path;
}


std::filesystem::path AssetDownloader::download_server_archive(const ServerArchiveDescriptor& descriptor,
                                                               const std::filesystem::path& destination_dir,
                                                               const ProgressCallback& on_progress)
{
    const AssetDescriptor& asset = descriptor.asset;
    auto reservation = registry_.reserve(asset.id);
    prepare_destination(asset, destination_dir);

    auto archive_path = destination_dir / asset.filename;
    archive_path += ".download";
    const auto staging_dir = destination_dir / (".staging-" + descriptor.release);
    remove_quietly(staging_dir);

    try {
        fetch_to_file(asset, archive_path, on_progress);

        ArchiveExtractor extractor(descriptor.executable_name, descriptor.library_prefixes);
        const auto staged = extractor.extract(archive_path, staging_dir);

        for (const auto& staged_file : staged) {
            const auto target = destination_dir / staged_file.filename();
            std::error_code ec;
            std::filesystem::remove(target, ec);
            std::filesystem::rename(staged_file, target, ec);
            if (ec) {
                THROW_APP_ERROR(ErrorCodes::Code::FILE_RENAME_FAILED,
                                Utils::path_to_utf8(target) + ": " + ec.message());
            }
        }
    } catch (const std::exception& ex) {
        download_log(spdlog::level::warn, "Server download failed: {}", ex.what());
        remove_quietly(staging_dir);
        remove_quietly(archive_path);
        throw;
    }

    remove_quietly(staging_dir);
    remove_quietly(archive_path);

    const auto executable = destination_dir / descriptor.executable_name;
    download_log(spdlog::level::info, "Installed {} {} at {}", asset.name, descriptor.release,
                 Utils::path_to_utf8(executable));
    return executable;
}


void AssetDownloader::delete_asset(const AssetDescriptor& asset, const std::filesystem::path& directory)
{
    const auto path = directory / asset.filename;
    std::error_code ec;
    const bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::FILE_WRITE_FAILED,
                            "Failed to delete " + asset.id,
                            Utils::path_to_utf8(path) + ": " + ec.message());
    }
    download_log(spdlog::level::info, removed ? "Deleted {}" : "{} was not downloaded", asset.id);
}
