#ifndef SESSIONJSON_HPP
#define SESSIONJSON_HPP

#include "Types.hpp"

#include <filesystem>
#include <string>

// JSON form of session input and summary output, keyed in camelCase.
namespace SessionJson {

/**
 * @brief Parses a session document.
 * @throws ErrorCodes::AppException (FILE_PARSE_FAILED) for malformed JSON or a non-object root.
 */
SessionContext parse_session(const std::string& text);

/**
 * @brief Reads and parses a session file.
 * @throws ErrorCodes::AppException (FILE_NOT_FOUND, FILE_PARSE_FAILED).
 */
SessionContext read_session_file(const std::filesystem::path& path);

std::string summary_to_json(const SummaryResult& result);

} // namespace SessionJson

#endif // SESSIONJSON_HPP
