#include "LocalServiceClient.hpp"
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

bool parse_json(const std::string& text, Json::Value& root, std::string* errors = nullptr)
{
    Json::CharReaderBuilder builder;
    std::istringstream stream(text);
    std::string ignored;
    try {
        return Json::parseFromStream(builder, stream, &root, errors ? errors : &ignored);
    } catch (const std::exception& ex) {
        (errors ? *errors : ignored) = ex.what();
        return false;
    }
}

std::string to_json_string(const Json::Value& value)
{
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

std::int64_t int64_field(const Json::Value& object, const char* key)
{
    const Json::Value& value = object[key];
    if (value.isInt64()) {
        return value.asInt64();
    }
    return value.isNumeric() ? Utils::saturating_int64(value.asDouble()) : 0;
}

} // namespace


LocalServiceClient::LocalServiceClient(ExternalLocalParameters params,
                                       HttpTransport transport,
                                       StreamingTransport streaming)
    : params_(std::move(params)),
      transport_(transport ? std::move(transport) : default_http_transport()),
      streaming_(streaming ? std::move(streaming) : default_streaming_transport())
{
    if (params_.host.empty()) {
        params_.host = kDefaultOllamaHost;
    }
}


std::string LocalServiceClient::endpoint(const std::string& path) const
{
    return Utils::strip_trailing_slashes(params_.host) + path;
}


std::string LocalServiceClient::generate(const std::string& prompt, std::chrono::milliseconds timeout) const
{
    Json::Value payload;
    payload["model"] = params_.model;
    payload["prompt"] = prompt;
    payload["stream"] = false;

    HttpRequest request;
    request.method = "POST";
    request.url = endpoint("/api/generate");
    request.body = to_json_string(payload);
    request.headers = {{"Content-Type", "application/json"}};
    request.timeout_ms = static_cast<long>(timeout.count());

    const HttpResponse response = transport_(request);
    if (!response.error.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::NETWORK_ERROR,
                            "Failed to call Ollama: " + response.error, request.url);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::BACKEND_HTTP_ERROR,
                            "Ollama returned status " + std::to_string(response.status_code) + ": " + response.body,
                            request.url);
    }

    Json::Value root;
    std::string errors;
    if (!parse_json(response.body, root, &errors) || !root.isObject()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::BACKEND_RESPONSE_INVALID,
                            "Failed to parse Ollama response", errors);
    }
    const Json::Value& text = root["response"];
    return text.isString() ? text.asString() : std::string();
}


TagsProbe LocalServiceClient::probe_tags(std::chrono::milliseconds timeout) const
{
    TagsProbe probe;

    HttpRequest request;
    request.method = "GET";
    request.url = endpoint("/api/tags");
    request.timeout_ms = static_cast<long>(timeout.count());

    HttpResponse response;
    try {
        response = transport_(request);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("inference_logger")) {
            logger->debug("Ollama tags request threw: {}", ex.what());
        }
        return probe;
    }
    if (!response.error.empty()) {
        return probe;
    }
    probe.reachable = true;
    probe.status_code = response.status_code;
    if (!response.success()) {
        return probe;
    }

    Json::Value root;
    if (!parse_json(response.body, root) || !root.isObject()) {
        return probe;
    }
    probe.parsed = true;
    const Json::Value& models = root["models"];
    if (models.isArray()) {
        for (const auto& item : models) {
            if (item.isObject() && item["name"].isString() && !item["name"].asString().empty()) {
                probe.models.push_back(item["name"].asString());
            }
        }
    }
    return probe;
}


bool LocalServiceClient::is_reachable(std::chrono::milliseconds timeout) const
{
    const TagsProbe probe = probe_tags(timeout);
    return probe.reachable && probe.status_code >= 200 && probe.status_code < 300;
}


void LocalServiceClient::pull_model(const std::string& model, const PullCallback& on_progress) const
{
    Json::Value payload;
    payload["name"] = model;

    HttpRequest request;
    request.method = "POST";
    request.url = endpoint("/api/pull");
    request.body = to_json_string(payload);
    request.headers = {{"Content-Type", "application/json"}};

    long status_code = 0;
    std::string pending;
    std::string error_body;
    std::string stream_error;

    auto handle_line = [&](const std::string& line) {
        if (Utils::trim(line).empty()) {
            return;
        }
        Json::Value root;
        if (!parse_json(line, root) || !root.isObject()) {
            return;
        }
        if (root["error"].isString()) {
            stream_error = root["error"].asString();
            return;
        }
        PullProgress progress;
        progress.status = root["status"].isString() ? root["status"].asString() : std::string();
        progress.digest = root["digest"].isString() ? root["digest"].asString() : std::string();
        progress.total = int64_field(root, "total");
        progress.completed = int64_field(root, "completed");
        if (on_progress) {
            on_progress(progress);
        }
    };

    StreamHandlers handlers;
    handlers.on_headers = [&](long status, long long) {
        status_code = status;
        return true;
    };
    handlers.on_chunk = [&](const char* data, std::size_t size) {
        if (status_code < 200 || status_code >= 300) {
            error_body.append(data, size);
            return true;
        }
        pending.append(data, size);
        std::size_t newline = 0;
        while ((newline = pending.find('\n')) != std::string::npos) {
            handle_line(pending.substr(0, newline));
            pending.erase(0, newline + 1);
        }
        return true;
    };

    if (auto logger = Logger::get_logger("inference_logger")) {
        logger->info("Pulling Ollama model {} from {}", model, params_.host);
    }
    const HttpResponse response = streaming_(request, handlers);
    if (status_code == 0) {
        status_code = response.status_code;
    }

    if (status_code != 0 && (status_code < 200 || status_code >= 300)) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::BACKEND_HTTP_ERROR,
                            "Pull failed: " + error_body, request.url);
    }
    if (!response.error.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::NETWORK_ERROR,
                            "Failed to start pull: " + response.error, request.url);
    }
    handle_line(pending);
    if (!stream_error.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::BACKEND_HTTP_ERROR,
                            "Pull failed: " + stream_error, request.url);
    }
}
