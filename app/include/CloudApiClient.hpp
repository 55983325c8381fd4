#ifndef CLOUDAPICLIENT_HPP
#define CLOUDAPICLIENT_HPP

#include "HttpClient.hpp"
#include "Types.hpp"

#include <chrono>
#include <memory>
#include <string>

// Remote chat/completion provider; each subclass owns one wire format.
class CloudApiClient {
public:
    CloudApiClient(RemoteCloudParameters params, HttpTransport transport);
    virtual ~CloudApiClient() = default;

    /**
     * @brief Sends @p prompt as a single user message.
     * @return The generated text.
     * @throws ErrorCodes::AppException NETWORK_ERROR, BACKEND_HTTP_ERROR,
     *         BACKEND_RESPONSE_INVALID or BACKEND_RESPONSE_EMPTY.
     */
    std::string complete(const std::string& prompt, std::chrono::milliseconds timeout) const;

    virtual std::string display_name() const = 0;
    virtual std::string default_endpoint() const = 0;

    const RemoteCloudParameters& parameters() const { return params_; }

protected:
    virtual HttpRequest make_request(const std::string& prompt) const = 0;
    virtual std::string extract_text(const std::string& body) const = 0;

    std::string endpoint() const;

    RemoteCloudParameters params_;

private:
    HttpTransport transport_;
};

class AnthropicClient : public CloudApiClient {
public:
    using CloudApiClient::CloudApiClient;
    std::string display_name() const override { return "Anthropic"; }
    std::string default_endpoint() const override;

protected:
    HttpRequest make_request(const std::string& prompt) const override;
    std::string extract_text(const std::string& body) const override;
};

class OpenAIClient : public CloudApiClient {
public:
    using CloudApiClient::CloudApiClient;
    std::string display_name() const override { return "OpenAI"; }
    std::string default_endpoint() const override;

protected:
    HttpRequest make_request(const std::string& prompt) const override;
    std::string extract_text(const std::string& body) const override;
};

class GeminiClient : public CloudApiClient {
public:
    using CloudApiClient::CloudApiClient;
    std::string display_name() const override { return "Gemini"; }
    std::string default_endpoint() const override;

protected:
    HttpRequest make_request(const std::string& prompt) const override;
    std::string extract_text(const std::string& body) const override;
};

/**
 * @brief Builds the client for params.provider ("anthropic", "openai", "gemini").
 * @throws ErrorCodes::AppException INFERENCE_UNKNOWN_PROVIDER for anything else.
 */
std::unique_ptr<CloudApiClient> make_cloud_client(const RemoteCloudParameters& params,
                                                  HttpTransport transport = nullptr);

#endif // CLOUDAPICLIENT_HPP
