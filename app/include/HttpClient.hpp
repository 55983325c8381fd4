#ifndef HTTPCLIENT_HPP
#define HTTPCLIENT_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;
    long timeout_ms{0}; ///< 0 disables the overall transfer timeout.
};

struct HttpResponse {
    long status_code{0};
    std::string body;
    std::string error; ///< Transport failure text; empty when a response arrived.

    bool success() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

/**
 * @brief Callbacks driven while a response body streams in.
 *
 * on_headers runs once before the first chunk with the status code and the
 * advertised Content-Length (-1 when unknown). Returning false from either
 * callback aborts the transfer.
 */
struct StreamHandlers {
    std::function<bool(long status_code, long long content_length)> on_headers;
    std::function<bool(const char* data, std::size_t size)> on_chunk;
};

using HttpTransport = std::function<HttpResponse(const HttpRequest&)>;
using StreamingTransport = std::function<HttpResponse(const HttpRequest&, const StreamHandlers&)>;

/**
 * @brief Performs a buffered request with libcurl.
 *
 * Never throws for transport problems; they are reported through
 * HttpResponse::error.
 */
HttpResponse perform_http_request(const HttpRequest& request);

/**
 * @brief Performs a request whose body is handed to @p handlers chunk by chunk.
 *
 * The returned response carries the status code and transport error; its
 * body stays empty. An abort requested by a handler is reported as an error.
 */
HttpResponse perform_streaming_request(const HttpRequest& request, const StreamHandlers& handlers);

HttpTransport default_http_transport();
StreamingTransport default_streaming_transport();

#endif // HTTPCLIENT_HPP
