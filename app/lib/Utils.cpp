#include "Utils.hpp"
#include "TestHooks.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <system_error>

namespace {

constexpr const char* kAppDirName = "traq";

std::filesystem::path home_directory()
{
#ifdef _WIN32
    if (const char* profile = std::getenv("USERPROFILE")) {
        return profile;
    }
#endif
    if (const char* home = std::getenv("HOME")) {
        return home;
    }
    return std::filesystem::current_path();
}

std::filesystem::path nearest_existing(std::filesystem::path path)
{
    std::error_code ec;
    while (!path.empty() && !std::filesystem::exists(path, ec)) {
        const auto parent = path.parent_path();
        if (parent == path) {
            break;
        }
        path = parent;
    }
    return path.empty() ? std::filesystem::current_path() : path;
}

} // namespace

namespace Utils {

std::filesystem::path get_data_directory()
{
    if (const char* override_root = std::getenv("TRAQ_DATA_DIR"); override_root && *override_root) {
        return utf8_to_path(override_root);
    }
#ifdef _WIN32
    if (const char* local = std::getenv("LOCALAPPDATA"); local && *local) {
        return std::filesystem::path(local) / kAppDirName;
    }
    return home_directory() / "AppData" / "Local" / kAppDirName;
#elif defined(__APPLE__)
    return home_directory() / "Library" / "Application Support" / kAppDirName;
#else
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / kAppDirName;
    }
    return home_directory() / ".local" / "share" / kAppDirName;
#endif
}


std::filesystem::path get_models_directory()
{
    return get_data_directory() / "models";
}


std::filesystem::path get_server_bin_directory()
{
    return get_data_directory() / "bin";
}


std::filesystem::path get_pid_file_path()
{
    return get_data_directory() / "llama-server.pid";
}


std::filesystem::path get_server_log_path()
{
    return get_data_directory() / "logs" / "llama-server.log";
}


std::optional<std::uint64_t> available_disk_space(const std::filesystem::path& path)
{
    if (auto probed = TestHooks::probe_disk_space(path)) {
        return probed;
    }
    std::error_code ec;
    const auto info = std::filesystem::space(nearest_existing(path), ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(info.available);
}


std::string format_size(std::uint64_t bytes)
{
    constexpr double kKb = 1024.0;
    constexpr double kMb = kKb * 1024.0;
    constexpr double kGb = kMb * 1024.0;

    char buffer[32];
    const double value = static_cast<double>(bytes);
    if (value >= kGb) {
        std::snprintf(buffer, sizeof(buffer), "%.1f GB", value / kGb);
    } else if (value >= kMb) {
        std::snprintf(buffer, sizeof(buffer), "%.1f MB", value / kMb);
    } else if (value >= kKb) {
        std::snprintf(buffer, sizeof(buffer), "%.1f KB", value / kKb);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%llu B", static_cast<unsigned long long>(bytes));
    }
    return buffer;
}


std::string path_to_utf8(const std::filesystem::path& path)
{
#ifdef _WIN32
    const auto u8 = path.u8string();
    return std::string(u8.begin(), u8.end());
#else
    return path.string();
#endif
}


std::filesystem::path utf8_to_path(const std::string& value)
{
#ifdef _WIN32
    return std::filesystem::path(std::u8string(value.begin(), value.end()));
#else
    return std::filesystem::path(value);
#endif
}


std::string trim(const std::string& value)
{
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}


std::string to_lower_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}


bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}


bool starts_with(const std::string& value, const std::string& prefix)
{
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}


bool ends_with(const std::string& value, const std::string& suffix)
{
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}


std::string strip_trailing_slashes(std::string url)
{
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}


std::string get_env(const char* name, const std::string& fallback)
{
    const char* value = std::getenv(name);
    if (value && *value) {
        return value;
    }
    return fallback;
}


std::int64_t saturating_int64(double value)
{
    if (std::isnan(value)) {
        return 0;
    }
    // 2^63 is exactly representable; anything at or beyond it would overflow.
    constexpr double kLimit = 9223372036854775808.0;
    if (value >= kLimit) {
        return std::numeric_limits<std::int64_t>::max();
    }
    if (value <= -kLimit) {
        return std::numeric_limits<std::int64_t>::min();
    }
    return static_cast<std::int64_t>(value);
}

} // namespace Utils
