#include "HttpClient.hpp"
#include "Logger.hpp"

#include <curl/curl.h>
#include <spdlog/fmt/fmt.h>

#include <cstdio>
#include <memory>
#include <utility>

namespace {

template <typename... Args>
void http_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t buffer_write_callback(void* contents, size_t size, size_t nmemb, std::string* response) {
    const size_t total = size * nmemb;
    response->append(static_cast<const char*>(contents), total);
    return total;
}

struct StreamState {
    CURL* curl{nullptr};
    const StreamHandlers* handlers{nullptr};
    bool headers_reported{false};
    bool aborted{false};
};

bool report_headers(StreamState& state)
{
    if (state.headers_reported) {
        return true;
    }
    state.headers_reported = true;
    long status = 0;
    curl_off_t length = -1;
    curl_easy_getinfo(state.curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_getinfo(state.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    if (state.handlers->on_headers
        && !state.handlers->on_headers(status, static_cast<long long>(length))) {
        state.aborted = true;
        return false;
    }
    return true;
}

size_t stream_write_callback(char* contents, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<StreamState*>(userdata);
    const size_t total = size * nmemb;
    if (!report_headers(*state)) {
        return 0;
    }
    if (state->handlers->on_chunk && !state->handlers->on_chunk(contents, total)) {
        state->aborted = true;
        return 0;
    }
    return total;
}

HeaderList build_headers(const HttpRequest& request)
{
    curl_slist* list = nullptr;
    for (const auto& [name, value] : request.headers) {
        const std::string line = name + ": " + value;
        list = curl_slist_append(list, line.c_str());
    }
    return HeaderList(list);
}

void apply_common_options(CURL* curl, const HttpRequest& request, curl_slist* headers)
{
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeout_ms);
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }
    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        }
    }
}

} // namespace


HttpResponse perform_http_request(const HttpRequest& request)
{
    HttpResponse response;
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        response.error = "Failed to initialize cURL";
        http_log(spdlog::level::err, "{} for {} {}", response.error, request.method, request.url);
        return response;
    }

    HeaderList headers = build_headers(request);
    apply_common_options(curl.get(), request, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, buffer_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    http_log(spdlog::level::debug, "HTTP {} {}", request.method, request.url);
    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        http_log(spdlog::level::debug, "HTTP {} {} failed: {}", request.method, request.url, response.error);
        return response;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    http_log(spdlog::level::debug, "HTTP {} {} returned {}", request.method, request.url, response.status_code);
    return response;
}


HttpResponse perform_streaming_request(const HttpRequest& request, const StreamHandlers& handlers)
{
    HttpResponse response;
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        response.error = "Failed to initialize cURL";
        http_log(spdlog::level::err, "{} for {} {}", response.error, request.method, request.url);
        return response;
    }

    StreamState state;
    state.curl = curl.get();
    state.handlers = &handlers;

    HeaderList headers = build_headers(request);
    apply_common_options(curl.get(), request, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, stream_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    // Abort stalled transfers: less than 1 byte/s for a minute.
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, 60L);

    http_log(spdlog::level::debug, "HTTP stream {} {}", request.method, request.url);
    const CURLcode res = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);

    if (res == CURLE_OK && !state.headers_reported) {
        // Empty body: headers were never handed to the callbacks.
        if (!report_headers(state)) {
            response.error = "Transfer aborted";
        }
        return response;
    }
    if (state.aborted) {
        response.error = "Transfer aborted";
        return response;
    }
    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        http_log(spdlog::level::warn, "HTTP stream {} failed: {}", request.url, response.error);
    }
    return response;
}


HttpTransport default_http_transport()
{
    return [](const HttpRequest& request) { return perform_http_request(request); };
}


StreamingTransport default_streaming_transport()
{
    return [](const HttpRequest& request, const StreamHandlers& handlers) {
        return perform_streaming_request(request, handlers);
    };
}
