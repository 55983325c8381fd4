#include "Settings.hpp"
#include "AppException.hpp"
#include "AssetCatalog.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <system_error>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#ifdef _WIN32
    #include <shlobj.h>
    #include <windows.h>
#endif


namespace {
template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

constexpr const char* kInferenceSection = "Inference";
constexpr const char* kBundledSection = "Bundled";
constexpr const char* kOllamaSection = "Ollama";
constexpr const char* kCloudSection = "Cloud";

int parse_int_or(const std::string& value, int fallback) {
    if (Utils::trim(value).empty()) {
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != Utils::trim(value).size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        return fallback;
    }
}

// Integer setting that must parse and stay within range; a bad value is a configuration error.
int read_int(const IniConfig& config, const char* section, const char* key,
             int fallback, int min_value, int max_value)
{
    const std::string raw = Utils::trim(config.getValue(section, key, ""));
    if (raw.empty()) {
        return fallback;
    }
    constexpr int kSentinel = -2147483647 - 1;
    const int value = parse_int_or(raw, kSentinel);
    if (value == kSentinel || value < min_value || value > max_value) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID,
                            fmt::format("Invalid value '{}' for [{}] {}", raw, section, key),
                            fmt::format("expected an integer between {} and {}", min_value, max_value));
    }
    return value;
}

std::chrono::milliseconds read_ms(const IniConfig& config, const char* key, std::chrono::milliseconds fallback)
{
    return std::chrono::milliseconds(
        read_int(config, kInferenceSection, key, static_cast<int>(fallback.count()), 1, 24 * 60 * 60 * 1000));
}

void write_ms(IniConfig& config, const char* key, std::chrono::milliseconds value)
{
    config.setValue(kInferenceSection, key, std::to_string(value.count()));
}
}


BackendKind parse_backend_kind(const std::string& value)
{
    const std::string normalized = Utils::to_lower_copy(Utils::trim(value));
    if (normalized.empty() || normalized == "bundled") {
        return BackendKind::Bundled;
    }
    if (normalized == "ollama" || normalized == "external") {
        return BackendKind::ExternalLocal;
    }
    if (normalized == "cloud") {
        return BackendKind::RemoteCloud;
    }
    THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID,
                        fmt::format("Unknown inference engine '{}'", value),
                        "expected bundled, ollama or cloud");
}


Settings::Settings()
{
    config_path = define_config_path();
    config_dir = std::filesystem::path(config_path).parent_path();

    std::error_code ec;
    std::filesystem::create_directories(config_dir, ec);
    if (ec) {
        settings_log(spdlog::level::err, "Error creating configuration directory {}: {}",
                     config_dir.string(), ec.message());
    }
}


std::string Settings::define_config_path()
{
    const std::string app_dir = "traq";
    const std::string file_name = "inference.ini";
    if (const char* override_root = std::getenv("TRAQ_CONFIG_DIR")) {
        std::filesystem::path base = override_root;
        return (base / app_dir / file_name).string();
    }
#ifdef _WIN32
    char appDataPath[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_APPDATA, NULL, 0, appDataPath))) {
        return std::string(appDataPath) + "\\" + app_dir + "\\" + file_name;
    }
#elif defined(__APPLE__)
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/Library/Application Support/" + app_dir + "/" + file_name;
    }
#else
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/" + app_dir + "/" + file_name;
    }
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/.config/" + app_dir + "/" + file_name;
    }
#endif
    return file_name;
}


std::string Settings::get_config_dir()
{
    return config_dir.string();
}


std::string Settings::get_config_path() const
{
    return config_path;
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    engine = parse_backend_kind(config.getValue(kInferenceSection, "Engine", "bundled"));

    InferenceTimeouts defaults;
    timeouts.status_probe = read_ms(config, "StatusTimeoutMs", defaults.status_probe);
    timeouts.startup = read_ms(config, "StartupTimeoutMs", defaults.startup);
    timeouts.startup_poll = read_ms(config, "StartupPollMs", defaults.startup_poll);
    timeouts.stop_grace = read_ms(config, "StopGraceMs", defaults.stop_grace);
    timeouts.generation = read_ms(config, "GenerationTimeoutMs", defaults.generation);

    bundled.model_path = config.getValue(kBundledSection, "ModelPath", "");
    bundled.server_path = config.getValue(kBundledSection, "ServerPath", "");
    bundled.port = read_int(config, kBundledSection, "Port", kDefaultBundledPort, 1, 65535);
    bundled.context_size = read_int(config, kBundledSection, "ContextSize", kDefaultContextSize, 128, 1 << 20);
    bundled.gpu_layers = read_int(config, kBundledSection, "GPULayers", 0, 0, 1000);
    bundled_model_id = config.getValue(kBundledSection, "ModelId", "");
    if (!bundled_model_id.empty() && !find_model(bundled_model_id)) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID,
                            fmt::format("Unknown model id '{}'", bundled_model_id), "[Bundled] ModelId");
    }

    external.host = config.getValue(kOllamaSection, "Host", kDefaultOllamaHost);
    external.model = config.getValue(kOllamaSection, "Model", "");

    cloud.provider = Utils::to_lower_copy(config.getValue(kCloudSection, "Provider", ""));
    cloud.api_key = config.getValue(kCloudSection, "APIKey", "");
    cloud.model = config.getValue(kCloudSection, "Model", "");
    cloud.endpoint = config.getValue(kCloudSection, "Endpoint", "");

    settings_log(spdlog::level::debug, "Loaded inference settings from {} (engine={})",
                 config_path, to_string(engine));
    return true;
}


bool Settings::save()
{
    config.setValue(kInferenceSection, "Engine", to_string(engine));
    write_ms(config, "StatusTimeoutMs", timeouts.status_probe);
    write_ms(config, "StartupTimeoutMs", timeouts.startup);
    write_ms(config, "StartupPollMs", timeouts.startup_poll);
    write_ms(config, "StopGraceMs", timeouts.stop_grace);
    write_ms(config, "GenerationTimeoutMs", timeouts.generation);

    config.setValue(kBundledSection, "ModelPath", bundled.model_path);
    config.setValue(kBundledSection, "ServerPath", bundled.server_path);
    config.setValue(kBundledSection, "Port", std::to_string(bundled.port));
    config.setValue(kBundledSection, "ContextSize", std::to_string(bundled.context_size));
    config.setValue(kBundledSection, "GPULayers", std::to_string(bundled.gpu_layers));
    config.setValue(kBundledSection, "ModelId", bundled_model_id);

    config.setValue(kOllamaSection, "Host", external.host);
    config.setValue(kOllamaSection, "Model", external.model);

    config.setValue(kCloudSection, "Provider", cloud.provider);
    config.setValue(kCloudSection, "APIKey", cloud.api_key);
    config.setValue(kCloudSection, "Model", cloud.model);
    config.setValue(kCloudSection, "Endpoint", cloud.endpoint);

    if (!config.save(config_path)) {
        settings_log(spdlog::level::err, "Failed to save settings to {}", config_path);
        return false;
    }
    return true;
}


BackendKind Settings::get_engine() const { return engine; }
void Settings::set_engine(BackendKind value) { engine = value; }

BundledParameters Settings::get_bundled() const { return bundled; }
void Settings::set_bundled(const BundledParameters& params) { bundled = params; }

std::string Settings::get_bundled_model_id() const { return bundled_model_id; }
void Settings::set_bundled_model_id(const std::string& model_id) { bundled_model_id = model_id; }

ExternalLocalParameters Settings::get_external() const { return external; }
void Settings::set_external(const ExternalLocalParameters& params) { external = params; }

RemoteCloudParameters Settings::get_cloud() const { return cloud; }
void Settings::set_cloud(const RemoteCloudParameters& params) { cloud = params; }

InferenceTimeouts Settings::get_timeouts() const { return timeouts; }
void Settings::set_timeouts(const InferenceTimeouts& value) { timeouts = value; }


InferenceConfig Settings::to_inference_config() const
{
    InferenceConfig result;
    result.timeouts = timeouts;

    switch (engine) {
        case BackendKind::Bundled: {
            BundledParameters params = bundled;
            if (params.model_path.empty()) {
                const std::string model_id = bundled_model_id.empty()
                    ? std::string(kDefaultModelId) : bundled_model_id;
                params.model_path = Utils::path_to_utf8(default_model_path(model_id));
            }
            if (params.server_path.empty()) {
                params.server_path = Utils::path_to_utf8(default_server_path());
            }
            result.backend = params;
            break;
        }
        case BackendKind::ExternalLocal: {
            ExternalLocalParameters params = external;
            if (Utils::trim(params.host).empty()) {
                params.host = kDefaultOllamaHost;
            }
            result.backend = params;
            break;
        }
        case BackendKind::RemoteCloud: {
            RemoteCloudParameters params = cloud;
            if (params.api_key.empty()) {
                params.api_key = Utils::get_env("TRAQ_CLOUD_API_KEY");
            }
            result.backend = params;
            break;
        }
    }
    return result;
}
