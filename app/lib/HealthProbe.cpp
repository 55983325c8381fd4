#include "HealthProbe.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <exception>
#include <utility>

HealthProbe::HealthProbe(HttpTransport transport)
    : transport_(transport ? std::move(transport) : default_http_transport())
{
}


bool HealthProbe::is_healthy(const std::string& base_url, std::chrono::milliseconds timeout) const
{
    HttpRequest request;
    request.method = "GET";
    request.url = Utils::strip_trailing_slashes(base_url) + "/health";
    request.timeout_ms = static_cast<long>(timeout.count());

    try {
        const HttpResponse response = transport_(request);
        return response.success();
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("Health probe for {} threw: {}", base_url, ex.what());
        }
        return false;
    }
}
