#ifndef PROMPTCODEC_HPP
#define PROMPTCODEC_HPP

#include "Types.hpp"

#include <string>

namespace PromptCodec {

/**
 * @brief Renders a session as the summarization prompt sent to every backend.
 *
 * Applications are ranked by total focus time, each listing its top five
 * windows; meetings, git commits, shell commands, file and browser activity
 * follow, then the fixed JSON response instructions.
 */
std::string build_prompt(const SessionContext& context);

/**
 * @brief Decodes a model reply into a SummaryResult.
 *
 * The JSON object between the first '{' and the last '}' is decoded and each
 * project's activities are run through is_low_information(). When decoding
 * fails the trimmed reply (max 200 chars) becomes the summary. Never throws.
 */
SummaryResult parse_response(const std::string& raw);

// True for generic activity descriptions that carry no useful detail.
bool is_low_information(const std::string& activity);

} // namespace PromptCodec

#endif // PROMPTCODEC_HPP
