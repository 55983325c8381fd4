#include "CloudApiClient.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <exception>
#include <sstream>
#include <utility>

namespace {

constexpr int kMaxOutputTokens = 1024;
constexpr const char* kAnthropicVersion = "2023-06-01";

std::string to_json_string(const Json::Value& value)
{
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

Json::Value parse_body(const std::string& body, const std::string& provider)
{
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(body);
    bool parsed = false;
    try {
        parsed = Json::parseFromStream(builder, stream, &root, &errors);
    } catch (const std::exception& ex) {
        errors = ex.what();
    }
    if (!parsed || !root.isObject()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::BACKEND_RESPONSE_INVALID,
                            "Failed to parse " + provider + " response", errors);
    }
    return root;
}

const Json::Value& member(const Json::Value& value, const char* key)
{
    static const Json::Value null_value;
    return value.isObject() ? value[key] : null_value;
}

Json::Value user_message(const std::string& prompt)
{
    Json::Value message;
    message["role"] = "user";
    message["content"] = prompt;
    return message;
}

[[noreturn]] void throw_empty(const std::string& provider)
{
    THROW_APP_ERROR_MSG(ErrorCodes::Code::BACKEND_RESPONSE_EMPTY,
                        "Empty response from " + provider, "");
}

} // namespace


CloudApiClient::CloudApiClient(RemoteCloudParameters params, HttpTransport transport)
    : params_(std::move(params)),
      transport_(transport ? std::move(transport) : default_http_transport())
{
}


std::string CloudApiClient::endpoint() const
{
    return params_.endpoint.empty() ? default_endpoint() : params_.endpoint;
}


std::string CloudApiClient::complete(const std::string& prompt, std::chrono::milliseconds timeout) const
{
    if (params_.api_key.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_REQUIRED_FIELD_MISSING,
                            "API key not configured", display_name());
    }

    HttpRequest request = make_request(prompt);
    request.method = "POST";
    request.timeout_ms = static_cast<long>(timeout.count());

    if (auto logger = Logger::get_logger("inference_logger")) {
        logger->debug("Calling {} model {} at {}", display_name(), params_.model, request.url);
    }

    const HttpResponse response = transport_(request);
    if (!response.error.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::NETWORK_ERROR,
                            "Failed to call " + display_name() + ": " + response.error, request.url);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::BACKEND_HTTP_ERROR,
                            display_name() + " returned status " + std::to_string(response.status_code)
                                + ": " + response.body,
                            request.url);
    }
    return extract_text(response.body);
}


std::string AnthropicClient::default_endpoint() const
{
    return "https://api.anthropic.com/v1/messages";
}


HttpRequest AnthropicClient::make_request(const std::string& prompt) const
{
    Json::Value payload;
    payload["model"] = params_.model;
    payload["max_tokens"] = kMaxOutputTokens;
    payload["messages"] = Json::Value(Json::arrayValue);
    payload["messages"].append(user_message(prompt));

    HttpRequest request;
    request.url = endpoint();
    request.body = to_json_string(payload);
    request.headers = {
        {"Content-Type", "application/json"},
        {"x-api-key", params_.api_key},
        {"anthropic-version", kAnthropicVersion},
    };
    return request;
}


std::string AnthropicClient::extract_text(const std::string& body) const
{
    const Json::Value root = parse_body(body, display_name());
    const Json::Value& content = root["content"];
    if (!content.isArray() || content.empty()) {
        throw_empty(display_name());
    }
    const Json::Value& text = member(content[0], "text");
    return text.isString() ? text.asString() : std::string();
}


std::string OpenAIClient::default_endpoint() const
{
    return "https://api.openai.com/v1/chat/completions";
}


HttpRequest OpenAIClient::make_request(const std::string& prompt) const
{
    Json::Value payload;
    payload["model"] = params_.model;
    payload["messages"] = Json::Value(Json::arrayValue);
    payload["messages"].append(user_message(prompt));

    HttpRequest request;
    request.url = endpoint();
    request.body = to_json_string(payload);
    request.headers = {
        {"Content-Type", "application/json"},
        {"Authorization", "Bearer " + params_.api_key},
    };
    return request;
}


std::string OpenAIClient::extract_text(const std::string& body) const
{
    const Json::Value root = parse_body(body, display_name());
    const Json::Value& choices = root["choices"];
    if (!choices.isArray() || choices.empty()) {
        throw_empty(display_name());
    }
    const Json::Value& text = member(member(choices[0], "message"), "content");
    return text.isString() ? text.asString() : std::string();
}


std::string GeminiClient::default_endpoint() const
{
    const std::string model = params_.model.empty() ? "gemini-1.5-flash" : params_.model;
    return "https://generativelanguage.googleapis.com/v1beta/models/" + model + ":generateContent";
}


HttpRequest GeminiClient::make_request(const std::string& prompt) const
{
    Json::Value part;
    part["text"] = prompt;
    Json::Value content;
    content["role"] = "user";
    content["parts"] = Json::Value(Json::arrayValue);
    content["parts"].append(part);

    Json::Value payload;
    payload["contents"] = Json::Value(Json::arrayValue);
    payload["contents"].append(content);
    payload["generationConfig"]["maxOutputTokens"] = kMaxOutputTokens;

    HttpRequest request;
    request.url = endpoint();
    request.body = to_json_string(payload);
    request.headers = {
        {"Content-Type", "application/json"},
        {"x-goog-api-key", params_.api_key},
    };
    return request;
}


std::string GeminiClient::extract_text(const std::string& body) const
{
    const Json::Value root = parse_body(body, display_name());
    const Json::Value& candidates = root["candidates"];
    if (!candidates.isArray() || candidates.empty()) {
        throw_empty(display_name());
    }
    const Json::Value& parts = member(member(candidates[0], "content"), "parts");
    if (!parts.isArray() || parts.empty()) {
        throw_empty(display_name());
    }
    const Json::Value& text = member(parts[0], "text");
    return text.isString() ? text.asString() : std::string();
}


std::unique_ptr<CloudApiClient> make_cloud_client(const RemoteCloudParameters& params, HttpTransport transport)
{
    const std::string provider = Utils::to_lower_copy(Utils::trim(params.provider));
    if (provider == "anthropic") {
        return std::make_unique<AnthropicClient>(params, std::move(transport));
    }
    if (provider == "openai") {
        return std::make_unique<OpenAIClient>(params, std::move(transport));
    }
    if (provider == "gemini") {
        return std::make_unique<GeminiClient>(params, std::move(transport));
    }
    THROW_APP_ERROR(ErrorCodes::Code::INFERENCE_UNKNOWN_PROVIDER, params.provider);
}
