#include "ArchiveExtractor.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/fmt/fmt.h>

#include <fstream>
#include <memory>
#include <system_error>
#include <utility>

namespace {

template <typename... Args>
void extract_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    if (auto logger = Logger::get_logger("download_logger")) {
        logger->log(level, "{}", fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
    }
}

struct ArchiveReadDeleter {
    void operator()(archive* handle) const { archive_read_free(handle); }
};

using ArchiveReader = std::unique_ptr<archive, ArchiveReadDeleter>;

std::string join_names(const std::vector<std::string>& names)
{
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined.empty() ? "<none>" : joined;
}

void copy_entry_data(archive* reader, const std::filesystem::path& out_path)
{
    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, Utils::path_to_utf8(out_path));
    }

    const void* block = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;
    for (;;) {
        const int rc = archive_read_data_block(reader, &block, &size, &offset);
        if (rc == ARCHIVE_EOF) {
            break;
        }
        if (rc < ARCHIVE_WARN) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::DOWNLOAD_EXTRACTION_FAILED,
                                "Failed to read archive entry",
                                archive_error_string(reader) ? archive_error_string(reader) : "");
        }
        out.seekp(static_cast<std::streamoff>(offset));
        out.write(static_cast<const char*>(block), static_cast<std::streamsize>(size));
        if (!out) {
            THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, Utils::path_to_utf8(out_path));
        }
    }
}

void write_symlink(const std::filesystem::path& out_path, const char* target)
{
    std::error_code ec;
    std::filesystem::remove(out_path, ec);
    // Libraries land flat, so only the target's base name is meaningful.
    const auto link_target = std::filesystem::path(target).filename();
    std::filesystem::create_symlink(link_target, out_path, ec);
    if (ec) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::DOWNLOAD_EXTRACTION_FAILED,
                            "Failed to create library symlink",
                            Utils::path_to_utf8(out_path) + ": " + ec.message());
    }
}

} // namespace


ArchiveExtractor::ArchiveExtractor(std::string executable_name, std::vector<std::string> library_prefixes)
    : executable_name_(std::move(executable_name)),
      library_prefixes_(std::move(library_prefixes))
{
}


bool ArchiveExtractor::is_wanted(const std::string& base_name) const
{
    if (base_name == executable_name_) {
        return true;
    }
    for (const auto& prefix : library_prefixes_) {
        if (Utils::starts_with(base_name, prefix)) {
            return true;
        }
    }
    return false;
}


std::vector<std::filesystem::path> ArchiveExtractor::extract(const std::filesystem::path& archive_path,
                                                             const std::filesystem::path& destination_dir) const
{
    ArchiveReader reader(archive_read_new());
    if (!reader) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::DOWNLOAD_EXTRACTION_FAILED,
                            "Failed to allocate archive reader", "");
    }
    archive_read_support_format_zip(reader.get());
    archive_read_support_format_tar(reader.get());
    archive_read_support_filter_all(reader.get());

    const std::string archive_utf8 = Utils::path_to_utf8(archive_path);
    if (archive_read_open_filename(reader.get(), archive_utf8.c_str(), 64 * 1024) != ARCHIVE_OK) {
        const char* reason = archive_error_string(reader.get());
        THROW_APP_ERROR_MSG(ErrorCodes::Code::DOWNLOAD_EXTRACTION_FAILED,
                            "Failed to open archive " + archive_utf8,
                            reason ? reason : "");
    }

    std::error_code ec;
    std::filesystem::create_directories(destination_dir, ec);
    if (ec) {
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_CREATE_FAILED,
                        Utils::path_to_utf8(destination_dir) + ": " + ec.message());
    }

    std::vector<std::filesystem::path> written;
    std::vector<std::string> seen_names;
    bool executable_found = false;

    archive_entry* entry = nullptr;
    for (;;) {
        const int rc = archive_read_next_header(reader.get(), &entry);
        if (rc == ARCHIVE_EOF) {
            break;
        }
        if (rc < ARCHIVE_WARN) {
            const char* reason = archive_error_string(reader.get());
            THROW_APP_ERROR_MSG(ErrorCodes::Code::DOWNLOAD_EXTRACTION_FAILED,
                                "Corrupted archive " + archive_utf8,
                                reason ? reason : "");
        }

        const char* raw_name = archive_entry_pathname(entry);
        const auto type = archive_entry_filetype(entry);
        if (!raw_name || type == AE_IFDIR) {
            continue;
        }
        const std::string base_name = std::filesystem::path(raw_name).filename().string();
        if (base_name.empty()) {
            continue;
        }
        seen_names.push_back(base_name);
        if (!is_wanted(base_name)) {
            continue;
        }

        const auto out_path = destination_dir / base_name;
        if (type == AE_IFLNK && archive_entry_symlink(entry)) {
            write_symlink(out_path, archive_entry_symlink(entry));
        } else {
            copy_entry_data(reader.get(), out_path);
        }
        written.push_back(out_path);
        extract_log(spdlog::level::debug, "Extracted {}", Utils::path_to_utf8(out_path));

        if (base_name == executable_name_) {
            executable_found = true;
#ifndef _WIN32
            std::filesystem::permissions(out_path,
                                         std::filesystem::perms::owner_all
                                             | std::filesystem::perms::group_read
                                             | std::filesystem::perms::group_exec
                                             | std::filesystem::perms::others_read
                                             | std::filesystem::perms::others_exec,
                                         std::filesystem::perm_options::replace, ec);
            if (ec) {
                THROW_APP_ERROR_MSG(ErrorCodes::Code::DOWNLOAD_EXTRACTION_FAILED,
                                    "Failed to mark server executable",
                                    Utils::path_to_utf8(out_path) + ": " + ec.message());
            }
#endif
        }
    }

    if (!executable_found) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::DOWNLOAD_EXTRACTION_FAILED,
                            executable_name_ + " not found in archive",
                            "Files found: " + join_names(seen_names));
    }

    extract_log(spdlog::level::info, "Extracted {} file(s) from {}", written.size(), archive_utf8);
    return written;
}
