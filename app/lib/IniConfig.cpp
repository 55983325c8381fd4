#include "IniConfig.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <cstdio>
#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace {
template <typename... Args>
void ini_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

bool is_comment_or_blank(const std::string& line)
{
    return line.empty() || line.front() == ';' || line.front() == '#';
}

std::optional<std::string> section_name(const std::string& line)
{
    if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
        return Utils::trim(line.substr(1, line.size() - 2));
    }
    return std::nullopt;
}

// Strips one pair of matching surrounding quotes so values may carry leading spaces.
std::string unquote(std::string value)
{
    if (value.size() >= 2 && value.front() == value.back() && (value.front() == '"' || value.front() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::optional<std::pair<std::string, std::string>> key_value(const std::string& line)
{
    const auto delimiter = line.find('=');
    if (delimiter == std::string::npos) {
        return std::nullopt;
    }
    std::string key = Utils::trim(line.substr(0, delimiter));
    if (key.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::move(key), unquote(Utils::trim(line.substr(delimiter + 1))));
}
}


bool IniConfig::load(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        ini_log(spdlog::level::debug, "Config file not found: {}", filename);
        return false;
    }

    data.clear();
    std::string raw_line;
    std::string section;
    int line_number = 0;
    while (std::getline(file, raw_line)) {
        ++line_number;
        const std::string line = Utils::trim(raw_line);
        if (is_comment_or_blank(line)) {
            continue;
        }
        if (auto name = section_name(line)) {
            section = *name;
            continue;
        }
        if (auto entry = key_value(line)) {
            data[section][entry->first] = entry->second;
        } else {
            ini_log(spdlog::level::warn, "Ignoring malformed line {} in {}", line_number, filename);
        }
    }
    return true;
}


bool IniConfig::save(const std::string& filename) const
{
    std::error_code ec;
    const auto parent = std::filesystem::path(filename).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(filename, std::ios::trunc);
    if (!file.is_open()) {
        ini_log(spdlog::level::err, "Failed to open config file for writing: {}", filename);
        return false;
    }

    for (const auto& [section, values] : data) {
        file << "[" << section << "]\n";
        for (const auto& [key, value] : values) {
            const bool needs_quotes = !value.empty() && (value.front() == ' ' || value.back() == ' ');
            file << key << " = " << (needs_quotes ? "\"" + value + "\"" : value) << "\n";
        }
        file << "\n";
    }
    return static_cast<bool>(file);
}


std::string IniConfig::getValue(const std::string& section, const std::string& key,
                                const std::string& default_value) const
{
    const auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return default_value;
    }
    const auto key_it = sec_it->second.find(key);
    return key_it == sec_it->second.end() ? default_value : key_it->second;
}


void IniConfig::setValue(const std::string& section, const std::string& key, const std::string& value)
{
    data[section][key] = value;
}


bool IniConfig::hasValue(const std::string& section, const std::string& key) const
{
    const auto sec_it = data.find(section);
    return sec_it != data.end() && sec_it->second.count(key) > 0;
}


void IniConfig::removeValue(const std::string& section, const std::string& key)
{
    auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return;
    }
    sec_it->second.erase(key);
    if (sec_it->second.empty()) {
        data.erase(sec_it);
    }
}


std::vector<std::string> IniConfig::sections() const
{
    std::vector<std::string> names;
    names.reserve(data.size());
    for (const auto& entry : data) {
        names.push_back(entry.first);
    }
    return names;
}


void IniConfig::clear()
{
    data.clear();
}
