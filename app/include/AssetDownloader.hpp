#ifndef ASSETDOWNLOADER_HPP
#define ASSETDOWNLOADER_HPP

#include "HttpClient.hpp"
#include "Types.hpp"

#include <filesystem>
#include <functional>
#include <mutex>
#include <set>
#include <string>

/**
 * @brief Tracks which asset ids have a download in flight.
 */
class DownloadRegistry
{
public:
    /**
     * @brief Releases its id when destroyed.
     */
    class Reservation
    {
    public:
        Reservation(DownloadRegistry& registry, std::string id);
        Reservation(Reservation&& other) noexcept;
        Reservation(const Reservation&) = delete;
        Reservation& operator=(const Reservation&) = delete;
        Reservation& operator=(Reservation&&) = delete;
        ~Reservation();

    private:
        DownloadRegistry* registry_;
        std::string id_;
    };

    /**
     * @brief Claims @p id for the caller.
     * @throws ErrorCodes::AppException DOWNLOAD_IN_PROGRESS when already claimed.
     */
    Reservation reserve(const std::string& id);
    bool contains(const std::string& id) const;

private:
    void release(const std::string& id);

    mutable std::mutex mutex_;
    std::set<std::string> in_flight_;
};


/**
 * @brief Streams model weights and the server archive into the data directory.
 *
 * Files are written to "<name>.download" and renamed into place only after
 * the transfer finished, so a partially downloaded file never carries the
 * final name.
 */
class AssetDownloader
{
public:
    using ProgressCallback = std::function<void(long long downloaded, long long total)>;

    explicit AssetDownloader(StreamingTransport transport = nullptr);

    /**
     * @brief Downloads @p asset into @p destination_dir.
     * @param on_progress Called after every received chunk; total falls back
     *        to the expected size when the server sends no Content-Length.
     * @return Final path of the downloaded file.
     */
    std::filesystem::path download(const AssetDescriptor& asset,
                                   const std::filesystem::path& destination_dir,
                                   const ProgressCallback& on_progress = nullptr);

    /**
     * @brief Downloads the server release archive and extracts the executable
     *        and its shared libraries into @p destination_dir.
     * @return Path of the extracted executable.
     */
    std::filesystem::path download_server_archive(const ServerArchiveDescriptor& descriptor,
                                                  const std::filesystem::path& destination_dir,
                                                  const ProgressCallback& on_progress = nullptr);

    bool is_downloading(const std::string& asset_id) const;

    /**
     * @brief Removes a downloaded asset. A missing file is not an error.
     */
    static void delete_asset(const AssetDescriptor& asset, const std::filesystem::path& directory);

private:
    void prepare_destination(const AssetDescriptor& asset, const std::filesystem::path& destination_dir) const;
    void fetch_to_file(const AssetDescriptor& asset,
                       const std::filesystem::path& temp_path,
                       const ProgressCallback& on_progress) const;

    StreamingTransport transport_;
    DownloadRegistry registry_;
};

#endif // ASSETDOWNLOADER_HPP
