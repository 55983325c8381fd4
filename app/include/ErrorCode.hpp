#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>

namespace ErrorCodes {

// Numeric ranges group related failures:
//   Network 1000, Backend 1100, File system 1200, Process 1300,
//   Inference 1400, Configuration 1500, Download 1900
enum class Code : int {
    UNKNOWN_ERROR = 1,

    // Network
    NETWORK_ERROR = 1000,
    NETWORK_TIMEOUT = 1001,
    NETWORK_CURL_INIT_FAILED = 1002,

    // Backend HTTP dependencies
    BACKEND_HTTP_ERROR = 1100,
    BACKEND_RESPONSE_INVALID = 1101,
    BACKEND_RESPONSE_EMPTY = 1102,
    BACKEND_UNREACHABLE = 1103,

    // File system
    FILE_NOT_FOUND = 1200,
    FILE_WRITE_FAILED = 1201,
    FILE_RENAME_FAILED = 1202,
    DIRECTORY_CREATE_FAILED = 1203,
    FILE_PARSE_FAILED = 1204,

    // Bundled process
    PROCESS_PORT_IN_USE = 1300,
    PROCESS_STARTUP_TIMEOUT = 1301,
    PROCESS_NOT_RUNNING = 1302,
    PROCESS_SPAWN_FAILED = 1303,
    PROCESS_EXITED_EARLY = 1304,

    // Inference orchestration
    INFERENCE_NOT_CONFIGURED = 1400,
    INFERENCE_UNKNOWN_PROVIDER = 1401,

    // Configuration
    CONFIG_INVALID = 1500,
    CONFIG_REQUIRED_FIELD_MISSING = 1501,

    // Asset downloads
    DOWNLOAD_FAILED = 1900,
    DOWNLOAD_IN_PROGRESS = 1901,
    DOWNLOAD_INSUFFICIENT_DISK_SPACE = 1902,
    DOWNLOAD_HTTP_STATUS = 1903,
    DOWNLOAD_EXTRACTION_FAILED = 1904,
    DOWNLOAD_UNKNOWN_ASSET = 1905,
};

struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string technical_details;

    ErrorInfo() = default;
    ErrorInfo(Code code,
              std::string message,
              std::string resolution,
              std::string technical_details = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          technical_details(std::move(technical_details)) {}

    // Message followed by the resolution hint
    std::string get_user_message() const;

    // Code, message, resolution and technical details
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
    static const char* code_name(Code code);
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
