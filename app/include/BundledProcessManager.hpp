#ifndef BUNDLEDPROCESSMANAGER_HPP
#define BUNDLEDPROCESSMANAGER_HPP

#include "HealthProbe.hpp"
#include "HttpClient.hpp"
#include "Types.hpp"

#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <variant>

/**
 * @brief Owns the lifecycle of a llama-server subprocess.
 *
 * A server already answering /health on the configured port is adopted
 * instead of spawned; adopted servers are never signalled. A marker file
 * records the pid of every spawned server so that a later run can reclaim
 * a process left behind by a crash.
 */
class BundledProcessManager
{
public:
    struct Options {
        HttpTransport transport;               ///< nullptr selects libcurl.
        InferenceTimeouts timeouts;
        std::filesystem::path marker_path;     ///< Empty selects the data directory default.
        std::filesystem::path server_log_path; ///< Empty selects the data directory default.
    };

    explicit BundledProcessManager(BundledParameters params);
    BundledProcessManager(BundledParameters params, Options options);
    ~BundledProcessManager();

    BundledProcessManager(const BundledProcessManager&) = delete;
    BundledProcessManager& operator=(const BundledProcessManager&) = delete;

    /**
     * @brief Brings the server up; returns immediately when already running.
     * @throws ErrorCodes::AppException PROCESS_PORT_IN_USE, CONFIG_INVALID,
     *         PROCESS_SPAWN_FAILED, PROCESS_EXITED_EARLY or PROCESS_STARTUP_TIMEOUT.
     */
    void start();

    /**
     * @brief Stops a spawned server (interrupt, bounded wait, kill) or forgets
     *        an adopted one. Idempotent.
     */
    void stop();

    /**
     * @brief Stops a server recorded in the marker file by an earlier process.
     *
     * Only acts while this manager is stopped. The recorded pid is signalled
     * only if it still runs the recorded executable.
     * @return true when a process was signalled.
     */
    bool reclaim_stale_process();

    /**
     * @brief Runs a completion against the running server.
     * @return The generated text.
     */
    std::string complete(const std::string& prompt) const;

    /**
     * @brief Raw JSON from GET /props.
     */
    std::string get_model_info() const;

    BundledStatus get_status() const;
    ProcessHandle handle() const;

    // A spawned server that has exited since startup is reaped and reported stopped.
    bool is_running() const;
    const BundledParameters& parameters() const { return params_; }
    std::string base_url() const;

    // Applies to requests and lifecycle waits started after the call.
    void set_timeouts(const InferenceTimeouts& timeouts);
    InferenceTimeouts timeouts() const;

private:
    struct Stopped {};
    struct Starting {};
    struct RunningManaged { pid_t pid; };
    struct RunningUnmanaged {};
    struct Stopping { pid_t pid; };
    using State = std::variant<Stopped, Starting, RunningManaged, RunningUnmanaged, Stopping>;

    static bool is_transitional(const State& state);
    static bool is_running_state(const State& state);

    State bootstrap();
    void reap_if_exited() const;
    bool cleanup_stale_process() const;
    bool port_is_free() const;
    void validate_paths() const;
    pid_t spawn_server() const;
    void wait_until_healthy(pid_t pid) const;
    void terminate(pid_t pid) const;
    void write_marker(pid_t pid) const;
    void remove_marker() const;
    HttpResponse send(const HttpRequest& request) const;

    BundledParameters params_;
    Options options_;
    HealthProbe probe_;

    mutable std::mutex timeouts_mutex_;
    InferenceTimeouts timeouts_;

    mutable std::mutex mutex_;
    mutable std::condition_variable state_changed_;
    mutable State state_{Stopped{}};
};

#endif // BUNDLEDPROCESSMANAGER_HPP
