#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

/**
 * @brief Owns the named spdlog loggers used across the inference layer.
 *
 * Library code must tolerate get_logger() returning nullptr: tests and
 * embedding callers are free to skip setup_loggers().
 */
class Logger
{
public:
    /**
     * @brief Creates core_logger, inference_logger and download_logger.
     *
     * All three share a console sink and a rotating file sink under
     * the data directory's logs/ folder. Throws spdlog::spdlog_ex when
     * the file sink cannot be created.
     */
    static void setup_loggers();

    /**
     * @brief Returns a registered logger or nullptr when absent.
     * @param name Logger name.
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    /**
     * @brief Directory holding the rotating log files.
     */
    static std::string get_log_directory();

private:
    static spdlog::level::level_enum resolve_level();
};

#endif // LOGGER_HPP
