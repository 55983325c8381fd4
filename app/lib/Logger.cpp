#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {
constexpr const char* kLogFileName = "traq-inference.log";
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
const char* const kLoggerNames[] = {"core_logger", "inference_logger", "download_logger"};
}


std::string Logger::get_log_directory()
{
    return (Utils::get_data_directory() / "logs").string();
}


spdlog::level::level_enum Logger::resolve_level()
{
    const char* value = std::getenv("TRAQ_LOG_LEVEL");
    if (!value || *value == '\0') {
        return spdlog::level::info;
    }
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    const auto level = spdlog::level::from_str(lowered);
    // from_str() maps unknown names to off; only honor it when asked for.
    if (level == spdlog::level::off && lowered != "off") {
        return spdlog::level::info;
    }
    return level;
}


void Logger::setup_loggers()
{
    const std::filesystem::path log_dir = get_log_directory();
    std::filesystem::create_directories(log_dir);

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (log_dir / kLogFileName).string(), kMaxLogFileSize, kMaxLogFiles);

    const auto level = resolve_level();
    for (const char* name : kLoggerNames) {
        if (spdlog::get(name)) {
            continue;
        }
        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}
