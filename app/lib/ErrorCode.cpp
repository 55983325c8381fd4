#include "ErrorCode.hpp"

#include <sstream>

namespace ErrorCodes {

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return message + " " + resolution;
}


std::string ErrorInfo::get_full_details() const
{
    std::ostringstream oss;
    oss << "Error " << static_cast<int>(code) << " (" << ErrorCatalog::code_name(code) << "): "
        << message;
    if (!resolution.empty()) {
        oss << "\nResolution: " << resolution;
    }
    if (!technical_details.empty()) {
        oss << "\nDetails: " << technical_details;
    }
    return oss.str();
}


ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    switch (code) {
        case Code::NETWORK_ERROR:
            return {code, "A network request failed.",
                    "Check your network connection and that the target service is reachable.", context};
        case Code::NETWORK_TIMEOUT:
            return {code, "A network request timed out.",
                    "The backend may be overloaded or running on slow hardware; try again.", context};
        case Code::NETWORK_CURL_INIT_FAILED:
            return {code, "Failed to initialize the HTTP client.",
                    "Restart the application.", context};

        case Code::BACKEND_HTTP_ERROR:
            return {code, "The inference backend returned an error status.",
                    "Check the backend logs and your model or API key settings.", context};
        case Code::BACKEND_RESPONSE_INVALID:
            return {code, "The inference backend returned a malformed response.",
                    "Make sure the configured endpoint speaks the expected API.", context};
        case Code::BACKEND_RESPONSE_EMPTY:
            return {code, "The inference backend returned no text.",
                    "Try again or select a different model.", context};
        case Code::BACKEND_UNREACHABLE:
            return {code, "The inference backend could not be reached.",
                    "Start the backend service and check the configured host.", context};

        case Code::FILE_NOT_FOUND:
            return {code, "A required file was not found.", "", context};
        case Code::FILE_WRITE_FAILED:
            return {code, "Failed to write a file.",
                    "Check disk space and permissions of the data directory.", context};
        case Code::FILE_RENAME_FAILED:
            return {code, "Failed to move a downloaded file into place.",
                    "Check permissions of the data directory.", context};
        case Code::FILE_PARSE_FAILED:
            return {code, "A file could not be parsed.",
                    "Check that the file is valid JSON with the expected fields.", context};
        case Code::DIRECTORY_CREATE_FAILED:
            return {code, "Failed to create a directory.",
                    "Check permissions of the data directory.", context};

        case Code::PROCESS_PORT_IN_USE:
            return {code, "The configured port is already used by another process.",
                    "Stop the other process or choose a different port.", context};
        case Code::PROCESS_STARTUP_TIMEOUT:
            return {code, "The bundled inference server did not become ready in time.",
                    "Increase the startup timeout or choose a smaller model.", context};
        case Code::PROCESS_NOT_RUNNING:
            return {code, "The bundled inference server is not running.",
                    "Start the bundled engine before sending requests.", context};
        case Code::PROCESS_SPAWN_FAILED:
            return {code, "Failed to launch the bundled inference server.",
                    "Re-download the bundled engine.", context};
        case Code::PROCESS_EXITED_EARLY:
            return {code, "The bundled inference server exited during startup.",
                    "Check the server log; the model file may be corrupted.", context};

        case Code::INFERENCE_NOT_CONFIGURED:
            return {code, "AI inference is not configured.",
                    "Configure an inference engine in the settings.", context};
        case Code::INFERENCE_UNKNOWN_PROVIDER:
            return {code, "Unknown cloud provider.",
                    "Use one of: anthropic, openai, gemini.", context};

        case Code::CONFIG_INVALID:
            return {code, "The inference configuration is invalid.",
                    "Review the inference settings.", context};
        case Code::CONFIG_REQUIRED_FIELD_MISSING:
            return {code, "A required configuration value is missing.",
                    "Fill in the missing value in the inference settings.", context};

        case Code::DOWNLOAD_FAILED:
            return {code, "The download failed.", "Try again later.", context};
        case Code::DOWNLOAD_IN_PROGRESS:
            return {code, "This asset is already being downloaded.",
                    "Wait for the current download to finish.", context};
        case Code::DOWNLOAD_INSUFFICIENT_DISK_SPACE:
            return {code, "Not enough free disk space for the download.",
                    "Free up disk space and try again.", context};
        case Code::DOWNLOAD_HTTP_STATUS:
            return {code, "The download server returned an error status.",
                    "The asset URL may have moved; try again later.", context};
        case Code::DOWNLOAD_EXTRACTION_FAILED:
            return {code, "Failed to extract the downloaded archive.",
                    "Re-download the bundled engine.", context};
        case Code::DOWNLOAD_UNKNOWN_ASSET:
            return {code, "Unknown asset identifier.",
                    "List the available models and pick one of their ids.", context};

        case Code::UNKNOWN_ERROR:
        default:
            return {Code::UNKNOWN_ERROR, "An unknown error occurred.", "", context};
    }
}


const char* ErrorCatalog::code_name(Code code)
{
    switch (code) {
        case Code::NETWORK_ERROR: return "NETWORK_ERROR";
        case Code::NETWORK_TIMEOUT: return "NETWORK_TIMEOUT";
        case Code::NETWORK_CURL_INIT_FAILED: return "NETWORK_CURL_INIT_FAILED";
        case Code::BACKEND_HTTP_ERROR: return "BACKEND_HTTP_ERROR";
        case Code::BACKEND_RESPONSE_INVALID: return "BACKEND_RESPONSE_INVALID";
        case Code::BACKEND_RESPONSE_EMPTY: return "BACKEND_RESPONSE_EMPTY";
        case Code::BACKEND_UNREACHABLE: return "BACKEND_UNREACHABLE";
        case Code::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case Code::FILE_WRITE_FAILED: return "FILE_WRITE_FAILED";
        case Code::FILE_RENAME_FAILED: return "FILE_RENAME_FAILED";
        case Code::DIRECTORY_CREATE_FAILED: return "DIRECTORY_CREATE_FAILED";
        case Code::FILE_PARSE_FAILED: return "FILE_PARSE_FAILED";
        case Code::PROCESS_PORT_IN_USE: return "PROCESS_PORT_IN_USE";
        case Code::PROCESS_STARTUP_TIMEOUT: return "PROCESS_STARTUP_TIMEOUT";
        case Code::PROCESS_NOT_RUNNING: return "PROCESS_NOT_RUNNING";
        case Code::PROCESS_SPAWN_FAILED: return "PROCESS_SPAWN_FAILED";
        case Code::PROCESS_EXITED_EARLY: return "PROCESS_EXITED_EARLY";
        case Code::INFERENCE_NOT_CONFIGURED: return "INFERENCE_NOT_CONFIGURED";
        case Code::INFERENCE_UNKNOWN_PROVIDER: return "INFERENCE_UNKNOWN_PROVIDER";
        case Code::CONFIG_INVALID: return "CONFIG_INVALID";
        case Code::CONFIG_REQUIRED_FIELD_MISSING: return "CONFIG_REQUIRED_FIELD_MISSING";
        case Code::DOWNLOAD_FAILED: return "DOWNLOAD_FAILED";
        case Code::DOWNLOAD_IN_PROGRESS: return "DOWNLOAD_IN_PROGRESS";
        case Code::DOWNLOAD_INSUFFICIENT_DISK_SPACE: return "DOWNLOAD_INSUFFICIENT_DISK_SPACE";
        case Code::DOWNLOAD_HTTP_STATUS: return "DOWNLOAD_HTTP_STATUS";
        case Code::DOWNLOAD_EXTRACTION_FAILED: return "DOWNLOAD_EXTRACTION_FAILED";
        case Code::DOWNLOAD_UNKNOWN_ASSET: return "DOWNLOAD_UNKNOWN_ASSET";
        case Code::UNKNOWN_ERROR:
        default: return "UNKNOWN_ERROR";
    }
}

} // namespace ErrorCodes
