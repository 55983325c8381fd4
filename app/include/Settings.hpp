#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include "IniConfig.hpp"
#include "Types.hpp"

#include <filesystem>
#include <string>

/**
 * @brief Persisted inference settings backed by an INI file.
 *
 * The file lives at `<config dir>/traq/inference.ini`; `TRAQ_CONFIG_DIR` overrides the base directory.
 */
class Settings
{
public:
    Settings();

    /**
     * @brief Reads the INI file. Returns false when no file exists and defaults remain in effect.
     * @throws ErrorCodes::AppException with CONFIG_INVALID when a stored value cannot be used.
     */
    bool load();
    bool save();

    BackendKind get_engine() const;
    void set_engine(BackendKind engine);

    BundledParameters get_bundled() const;
    void set_bundled(const BundledParameters& params);
    std::string get_bundled_model_id() const;
    void set_bundled_model_id(const std::string& model_id);

    ExternalLocalParameters get_external() const;
    void set_external(const ExternalLocalParameters& params);

    RemoteCloudParameters get_cloud() const;
    void set_cloud(const RemoteCloudParameters& params);

    InferenceTimeouts get_timeouts() const;
    void set_timeouts(const InferenceTimeouts& timeouts);

    /**
     * @brief Builds the runtime configuration for the active engine.
     *
     * Empty bundled paths resolve to the catalog defaults for the selected model id.
     * An empty cloud API key falls back to `TRAQ_CLOUD_API_KEY`.
     */
    InferenceConfig to_inference_config() const;

    std::string define_config_path();
    std::string get_config_dir();
    std::string get_config_path() const;

private:
    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    BackendKind engine{BackendKind::Bundled};
    BundledParameters bundled;
    std::string bundled_model_id;
    ExternalLocalParameters external;
    RemoteCloudParameters cloud;
    InferenceTimeouts timeouts;
};

BackendKind parse_backend_kind(const std::string& value);

#endif
