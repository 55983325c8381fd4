#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace Utils {

// Root of the per-user data directory; TRAQ_DATA_DIR overrides it.
std::filesystem::path get_data_directory();
std::filesystem::path get_models_directory();
std::filesystem::path get_server_bin_directory();
std::filesystem::path get_pid_file_path();
std::filesystem::path get_server_log_path();

// Free bytes on the volume holding path (or its nearest existing parent).
std::optional<std::uint64_t> available_disk_space(const std::filesystem::path& path);

// "1.5 GB", "120.0 MB", "512 B"
std::string format_size(std::uint64_t bytes);

std::string path_to_utf8(const std::filesystem::path& path);
std::filesystem::path utf8_to_path(const std::string& value);

std::string trim(const std::string& value);
std::string to_lower_copy(std::string value);
bool contains(const std::string& haystack, const std::string& needle);
bool starts_with(const std::string& value, const std::string& prefix);
bool ends_with(const std::string& value, const std::string& suffix);

// Drops trailing slashes so endpoint paths can be appended.
std::string strip_trailing_slashes(std::string url);

std::string get_env(const char* name, const std::string& fallback = "");

// Converts a JSON number to int64, saturating at the type's bounds. NaN yields 0.
std::int64_t saturating_int64(double value);

} // namespace Utils

#endif // UTILS_HPP
