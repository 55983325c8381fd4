#include "InferenceService.hpp"
#include "AppException.hpp"
#include "AssetCatalog.hpp"
#include "CloudApiClient.hpp"
#include "Logger.hpp"
#include "PromptCodec.hpp"
#include "Utils.hpp"

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <utility>

namespace {

template <typename... Args>
void service_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("inference_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string model_file_name(const std::string& model_path)
{
    return std::filesystem::path(model_path).filename().string();
}

bool file_exists(const std::string& path)
{
    std::error_code ec;
    return !path.empty() && std::filesystem::exists(path, ec);
}

bool is_recommended_model(const std::string& name)
{
    return Utils::starts_with(name, "qwen2.5:7b") || Utils::starts_with(name, "qwen2.5-7b")
        || Utils::starts_with(name, "llama3") || Utils::starts_with(name, "mistral");
}

SetupStatus not_ready(const std::string& engine, std::string issue, std::string suggestion)
{
    SetupStatus status;
    status.engine = engine;
    status.issue = std::move(issue);
    status.suggestion = std::move(suggestion);
    return status;
}

} // namespace


InferenceService::InferenceService(InferenceConfig config)
    : InferenceService(std::move(config), Dependencies{})
{
}


InferenceService::InferenceService(InferenceConfig config, Dependencies dependencies)
    : deps_(std::move(dependencies))
{
    if (!deps_.transport) {
        deps_.transport = default_http_transport();
    }
    if (!deps_.streaming) {
        deps_.streaming = default_streaming_transport();
    }
    if (!deps_.make_manager) {
        HttpTransport transport = deps_.transport;
        deps_.make_manager = [transport](const BundledParameters& params, const InferenceTimeouts& timeouts) {
            BundledProcessManager::Options options;
            options.transport = transport;
            options.timeouts = timeouts;
            return std::make_unique<BundledProcessManager>(params, options);
        };
    }

    if (auto* bundled = std::get_if<BundledParameters>(&config.backend)) {
        *bundled = with_default_paths(*bundled);
        manager_ = deps_.make_manager(*bundled, config.timeouts);
    }
    config_ = std::move(config);
    service_log(spdlog::level::info, "Inference engine: {}", to_string(config_.kind()));
}


InferenceService::~InferenceService()
{
    shutdown();
}


BundledParameters InferenceService::with_default_paths(BundledParameters params)
{
    if (params.server_path.empty()) {
        params.server_path = Utils::path_to_utf8(default_server_path());
    }
    if (params.model_path.empty()) {
        params.model_path = Utils::path_to_utf8(default_model_path());
    }
    return params;
}


InferenceConfig InferenceService::config() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}


std::shared_ptr<BundledProcessManager> InferenceService::current_manager() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return manager_;
}


std::shared_ptr<BundledProcessManager> InferenceService::require_manager() const
{
    auto manager = current_manager();
    if (!manager) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::INFERENCE_NOT_CONFIGURED,
                            "Bundled engine not configured", "");
    }
    return manager;
}


SummaryResult InferenceService::generate_summary(const SessionContext& context)
{
    InferenceConfig config;
    std::shared_ptr<BundledProcessManager> manager;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config = config_;
        manager = manager_;
    }

    const std::string prompt = PromptCodec::build_prompt(context);
    const auto generation_timeout = config.timeouts.generation;
    std::string model_used;

    const auto started = std::chrono::steady_clock::now();
    const std::string reply = std::visit(overloaded{
        [&](const BundledParameters& params) {
            if (!manager) {
                THROW_APP_ERROR_MSG(ErrorCodes::Code::INFERENCE_NOT_CONFIGURED,
                                    "Bundled engine not initialized", "");
            }
            if (!manager->is_running()) {
                manager->start();
            }
            model_used = "bundled:" + model_file_name(params.model_path);
            return manager->complete(prompt);
        },
        [&](const ExternalLocalParameters& params) {
            if (params.model.empty()) {
                THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_REQUIRED_FIELD_MISSING,
                                    "Ollama model not configured", "[Ollama] Model");
            }
            model_used = params.model;
            LocalServiceClient client(params, deps_.transport, deps_.streaming);
            return client.generate(prompt, generation_timeout);
        },
        [&](const RemoteCloudParameters& params) {
            model_used = params.model;
            return make_cloud_client(params, deps_.transport)->complete(prompt, generation_timeout);
        },
    }, config.backend);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    SummaryResult result = PromptCodec::parse_response(reply);
    result.model_used = model_used;
    result.inference_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    service_log(spdlog::level::info, "Summary generated by {} in {} ms", model_used, result.inference_time_ms);
    return result;
}


void InferenceService::update_config(InferenceConfig config)
{
    std::shared_ptr<BundledProcessManager> restart;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::shared_ptr<BundledProcessManager> previous = manager_;
        const bool was_running = previous && previous->is_running();

        if (auto* bundled = std::get_if<BundledParameters>(&config.backend)) {
            *bundled = with_default_paths(*bundled);
            const bool unchanged = previous && previous->parameters() == *bundled;
            if (unchanged) {
                if (config_.timeouts != config.timeouts) {
                    previous->set_timeouts(config.timeouts);
                }
            } else {
                if (previous) {
                    previous->stop();
                }
                manager_ = deps_.make_manager(*bundled, config.timeouts);
                if (was_running) {
                    restart = manager_;
                }
            }
        } else if (previous) {
            previous->stop();
            manager_.reset();
        }

        config_ = std::move(config);
        service_log(spdlog::level::info, "Inference configuration updated, engine: {}", to_string(config_.kind()));
    }

    if (restart) {
        try {
            restart->start();
        } catch (const ErrorCodes::AppException& ex) {
            service_log(spdlog::level::err, "Failed to restart bundled engine: {}", ex.get_full_details());
            throw;
        }
    }
}


void InferenceService::start_bundled()
{
    require_manager()->start();
}


void InferenceService::stop_bundled()
{
    if (auto manager = current_manager()) {
        manager->stop();
    }
}


void InferenceService::shutdown()
{
    stop_bundled();
}


std::string InferenceService::get_model_info() const
{
    return require_manager()->get_model_info();
}


BundledStatus InferenceService::get_bundled_status() const
{
    if (auto manager = current_manager()) {
        return manager->get_status();
    }
    return BundledStatus{};
}


std::string InferenceService::external_host() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto* external = std::get_if<ExternalLocalParameters>(&config_.backend)) {
        return external->host;
    }
    return kDefaultOllamaHost;
}


SetupStatus InferenceService::get_setup_status() const
{
    const InferenceConfig config = this->config();
    const std::string engine = to_string(config.kind());

    return std::visit(overloaded{
        [&](const BundledParameters& params) {
            if (!file_exists(params.server_path)) {
                return not_ready(engine, "llama-server binary not found",
                                 "Download the bundled engine: traq-inference download-server");
            }
            if (!file_exists(params.model_path)) {
                return not_ready(engine, "Model file not found",
                                 "Download a bundled model: traq-inference download-model <id>");
            }
            SetupStatus ready;
            ready.ready = true;
            ready.engine = engine;
            return ready;
        },
        [&](const ExternalLocalParameters& params) {
            LocalServiceClient client(params, deps_.transport, deps_.streaming);
            const TagsProbe probe = client.probe_tags(config.timeouts.status_probe);
            if (!probe.reachable) {
                return not_ready(engine, "Cannot reach Ollama server",
                                 "Install and start Ollama from https://ollama.com");
            }
            if (probe.status_code < 200 || probe.status_code >= 300) {
                return not_ready(engine, "Ollama server returned status " + std::to_string(probe.status_code),
                                 "Check Ollama server status");
            }
            if (probe.parsed) {
                bool found = false;
                for (const auto& name : probe.models) {
                    found = found || name == params.model;
                }
                if (!found) {
                    return not_ready(engine, "Model '" + params.model + "' not found in Ollama",
                                     "Run: ollama pull " + params.model);
                }
            }
            SetupStatus ready;
            ready.ready = true;
            ready.engine = engine;
            return ready;
        },
        [&](const RemoteCloudParameters& params) {
            if (params.api_key.empty()) {
                return not_ready(engine, "API key not configured",
                                 "Set [Cloud] APIKey in the config file or TRAQ_CLOUD_API_KEY");
            }
            const std::string provider = Utils::to_lower_copy(Utils::trim(params.provider));
            if (provider != "anthropic" && provider != "openai" && provider != "gemini") {
                return not_ready(engine, "Unknown cloud provider: " + params.provider,
                                 "Use one of: anthropic, openai, gemini");
            }
            SetupStatus ready;
            ready.ready = true;
            ready.engine = engine;
            return ready;
        },
    }, config.backend);
}


InferenceStatus InferenceService::get_status() const
{
    InferenceConfig config;
    std::shared_ptr<BundledProcessManager> manager;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config = config_;
        manager = manager_;
    }

    InferenceStatus status;
    status.engine = to_string(config.kind());
    std::visit(overloaded{
        [&](const BundledParameters& params) {
            if (manager) {
                const BundledStatus bundled = manager->get_status();
                status.bundled_running = bundled.running;
                status.bundled_ready = bundled.available;
                status.available = bundled.available;
            }
            status.model_name = model_file_name(params.model_path);
        },
        [&](const ExternalLocalParameters& params) {
            LocalServiceClient client(params, deps_.transport, deps_.streaming);
            status.external_reachable = client.is_reachable(config.timeouts.status_probe);
            status.available = status.external_reachable;
            status.model_name = params.model;
        },
        [&](const RemoteCloudParameters& params) {
            status.cloud_configured = !params.api_key.empty();
            status.available = status.cloud_configured;
            status.model_name = params.model;
        },
    }, config.backend);
    return status;
}


ExternalSetupInfo InferenceService::check_external_setup() const
{
    ExternalLocalParameters params;
    params.host = external_host();
    LocalServiceClient client(params, deps_.transport, deps_.streaming);
    const TagsProbe probe = client.probe_tags(config().timeouts.status_probe);

    ExternalSetupInfo info;
    info.recommended_model = kRecommendedOllamaModel;
    info.reachable = probe.reachable && probe.status_code >= 200 && probe.status_code < 300;
    info.installed_models = probe.models;
    for (const auto& name : info.installed_models) {
        info.has_recommended = info.has_recommended || is_recommended_model(name);
    }
    info.needs_setup = !info.reachable || info.installed_models.empty();
    return info;
}


void InferenceService::pull_external_model(const std::string& model,
                                           const LocalServiceClient::PullCallback& on_progress) const
{
    ExternalLocalParameters params;
    params.host = external_host();
    LocalServiceClient client(params, deps_.transport, deps_.streaming);
    client.pull_model(model, on_progress);
}
