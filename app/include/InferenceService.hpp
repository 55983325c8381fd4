#ifndef INFERENCESERVICE_HPP
#define INFERENCESERVICE_HPP

#include "BundledProcessManager.hpp"
#include "HttpClient.hpp"
#include "LocalServiceClient.hpp"
#include "Types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Routes summary requests to the configured backend.
 *
 * Owns at most one BundledProcessManager. The configuration can be swapped
 * at runtime; the manager is only rebuilt when the bundled parameters change.
 */
class InferenceService
{
public:
    using ManagerFactory = std::function<std::unique_ptr<BundledProcessManager>(
        const BundledParameters& params, const InferenceTimeouts& timeouts)>;

    struct Dependencies {
        HttpTransport transport;      ///< nullptr selects libcurl.
        StreamingTransport streaming; ///< nullptr selects libcurl.
        ManagerFactory make_manager;  ///< nullptr builds a BundledProcessManager with the defaults.
    };

    explicit InferenceService(InferenceConfig config);
    InferenceService(InferenceConfig config, Dependencies dependencies);
    ~InferenceService();

    InferenceService(const InferenceService&) = delete;
    InferenceService& operator=(const InferenceService&) = delete;

    /**
     * @brief Builds the prompt, calls the active backend and parses its reply.
     *
     * The bundled server is started on demand.
     */
    SummaryResult generate_summary(const SessionContext& context);

    /**
     * @brief Applies a new configuration.
     *
     * Leaving the bundled engine stops its server. Changed bundled parameters
     * replace the manager, and the new one is started only when the old one
     * was running; a failure of that restart is rethrown after the new
     * configuration is in place.
     */
    void update_config(InferenceConfig config);

    InferenceConfig config() const;

    SetupStatus get_setup_status() const;
    InferenceStatus get_status() const;
    BundledStatus get_bundled_status() const;

    void start_bundled();
    void stop_bundled();
    void shutdown();

    std::string get_model_info() const;

    /**
     * @brief Reports the external service's installed models and whether a
     *        usable one is present.
     */
    ExternalSetupInfo check_external_setup() const;

    void pull_external_model(const std::string& model, const LocalServiceClient::PullCallback& on_progress) const;

    static BundledParameters with_default_paths(BundledParameters params);

private:
    std::shared_ptr<BundledProcessManager> current_manager() const;
    std::shared_ptr<BundledProcessManager> require_manager() const;
    std::string external_host() const;

    Dependencies deps_;
    mutable std::mutex mutex_;
    InferenceConfig config_;
    std::shared_ptr<BundledProcessManager> manager_;
};

#endif // INFERENCESERVICE_HPP
