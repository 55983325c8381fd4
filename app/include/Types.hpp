#ifndef TYPES_HPP
#define TYPES_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

enum class BackendKind {
    Bundled,
    ExternalLocal, ///< Ollama-compatible service started by the user.
    RemoteCloud
};

inline std::string to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::Bundled: return "bundled";
        case BackendKind::ExternalLocal: return "ollama";
        case BackendKind::RemoteCloud: return "cloud";
        default: return "unknown";
    }
}

constexpr int kDefaultBundledPort = 18080;
constexpr int kDefaultContextSize = 2048;
constexpr const char* kDefaultOllamaHost = "http://localhost:11434";

struct BundledParameters {
    std::string model_path;
    std::string server_path;
    int port{kDefaultBundledPort};
    int context_size{kDefaultContextSize};
    int gpu_layers{0}; ///< 0 keeps inference on the CPU.

    bool operator==(const BundledParameters&) const = default;
};

struct ExternalLocalParameters {
    std::string host{kDefaultOllamaHost};
    std::string model;

    bool operator==(const ExternalLocalParameters&) const = default;
};

struct RemoteCloudParameters {
    std::string provider; ///< "anthropic", "openai" or "gemini"
    std::string api_key;
    std::string model;
    std::string endpoint; ///< Empty selects the provider default.

    bool operator==(const RemoteCloudParameters&) const = default;
};

struct InferenceTimeouts {
    std::chrono::milliseconds status_probe{2000};
    std::chrono::milliseconds startup{30000};
    std::chrono::milliseconds startup_poll{500};
    std::chrono::milliseconds stop_grace{5000};
    std::chrono::milliseconds generation{120000};

    bool operator==(const InferenceTimeouts&) const = default;
};

using BackendParameters = std::variant<BundledParameters, ExternalLocalParameters, RemoteCloudParameters>;

struct InferenceConfig {
    BackendParameters backend{BundledParameters{}};
    InferenceTimeouts timeouts;

    BackendKind kind() const {
        switch (backend.index()) {
            case 0: return BackendKind::Bundled;
            case 1: return BackendKind::ExternalLocal;
            default: return BackendKind::RemoteCloud;
        }
    }
};

struct FocusEvent {
    std::string app_name;
    std::string window_title;
    double duration_seconds{0.0};
};

struct SessionContext {
    std::int64_t start_time{0};
    std::int64_t end_time{0};
    std::int64_t duration_seconds{0};
    int screenshot_count{0};
    std::vector<std::string> top_apps;
    std::vector<FocusEvent> focus_events;
    std::vector<std::string> shell_commands;
    std::vector<std::string> git_commits;
    std::vector<std::string> file_changes;
    std::vector<std::string> browser_visits;
};

struct ProjectBreakdown {
    std::string name;
    int time_minutes{0};
    std::vector<std::string> activities;
    std::string confidence;
};

struct SummaryResult {
    std::string summary;
    std::string explanation;
    std::vector<std::string> tags;
    std::string confidence{"medium"};
    std::vector<ProjectBreakdown> projects;
    std::string model_used;
    std::int64_t inference_time_ms{0};
};

struct AssetDescriptor {
    std::string id;
    std::string name;
    std::string description;
    std::uint64_t expected_size_bytes{0};
    std::string url;
    std::string filename;
};

struct ServerArchiveDescriptor {
    AssetDescriptor asset;
    std::string platform;
    std::string architecture;
    std::string executable_name;
    std::vector<std::string> library_prefixes;
    std::string release;
};

struct ProcessHandle {
    std::int64_t pid{0};
    bool managed_by_us{false};
    bool running{false};
};

struct BundledStatus {
    bool available{false};
    bool running{false};
    bool model_present{false};
    bool server_present{false};
    std::string model_path;
    std::string server_path;
    int port{0};
};

struct SetupStatus {
    bool ready{false};
    std::string engine;
    std::string issue;
    std::string suggestion;
};

struct InferenceStatus {
    std::string engine;
    bool available{false};
    std::string model_name;
    bool bundled_running{false};
    bool bundled_ready{false};
    bool external_reachable{false};
    bool cloud_configured{false};
};

struct ExternalSetupInfo {
    bool reachable{false};
    std::vector<std::string> installed_models;
    std::string recommended_model;
    bool has_recommended{false};
    bool needs_setup{true};
};

struct PullProgress {
    std::string status;
    std::string digest;
    std::int64_t total{0};
    std::int64_t completed{0};
};

#endif // TYPES_HPP
