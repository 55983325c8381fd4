#ifndef ARCHIVEEXTRACTOR_HPP
#define ARCHIVEEXTRACTOR_HPP

#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Pulls the server executable and its shared libraries out of a release archive.
 *
 * Entries are matched on their base name and written flat into the
 * destination directory; everything else in the archive is skipped.
 */
class ArchiveExtractor
{
public:
    ArchiveExtractor(std::string executable_name, std::vector<std::string> library_prefixes);

    /**
     * @brief Extracts matching entries of @p archive_path into @p destination_dir.
     * @return Paths of the files written.
     * @throws ErrorCodes::AppException DOWNLOAD_EXTRACTION_FAILED when the archive
     *         is unreadable or lacks the executable (the message lists the
     *         file names that were found).
     */
    std::vector<std::filesystem::path> extract(const std::filesystem::path& archive_path,
                                               const std::filesystem::path& destination_dir) const;

    bool is_wanted(const std::string& base_name) const;

private:
    std::string executable_name_;
    std::vector<std::string> library_prefixes_;
};

#endif // ARCHIVEEXTRACTOR_HPP
