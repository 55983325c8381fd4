#ifndef LOCALSERVICECLIENT_HPP
#define LOCALSERVICECLIENT_HPP

#include "HttpClient.hpp"
#include "Types.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

constexpr const char* kRecommendedOllamaModel = "qwen2.5:7b";

// Outcome of GET /api/tags. Never an exception: setup diagnostics read it field by field.
struct TagsProbe {
    bool reachable{false};
    long status_code{0};
    bool parsed{false};
    std::vector<std::string> models;
};

/**
 * @brief Client for an Ollama-compatible service the user runs themselves.
 */
class LocalServiceClient
{
public:
    using PullCallback = std::function<void(const PullProgress&)>;

    explicit LocalServiceClient(ExternalLocalParameters params,
                                HttpTransport transport = nullptr,
                                StreamingTransport streaming = nullptr);

    /**
     * @brief POST /api/generate without streaming.
     * @return The "response" field of the reply.
     * @throws ErrorCodes::AppException NETWORK_ERROR, BACKEND_HTTP_ERROR or
     *         BACKEND_RESPONSE_INVALID.
     */
    std::string generate(const std::string& prompt, std::chrono::milliseconds timeout) const;

    TagsProbe probe_tags(std::chrono::milliseconds timeout) const;

    bool is_reachable(std::chrono::milliseconds timeout) const;

    /**
     * @brief Pulls a model through POST /api/pull, reporting each progress line.
     */
    void pull_model(const std::string& model, const PullCallback& on_progress) const;

    const ExternalLocalParameters& parameters() const { return params_; }

private:
    std::string endpoint(const std::string& path) const;

    ExternalLocalParameters params_;
    HttpTransport transport_;
    StreamingTransport streaming_;
};

#endif // LOCALSERVICECLIENT_HPP
