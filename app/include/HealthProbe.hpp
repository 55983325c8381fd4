#ifndef HEALTHPROBE_HPP
#define HEALTHPROBE_HPP

#include "HttpClient.hpp"

#include <chrono>
#include <string>

// Liveness check against GET {base_url}/health. Every failure reads as "not healthy".
class HealthProbe
{
public:
    explicit HealthProbe(HttpTransport transport = nullptr);

    bool is_healthy(const std::string& base_url,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) const;

private:
    HttpTransport transport_;
};

#endif // HEALTHPROBE_HPP
