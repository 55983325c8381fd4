#include "BundledProcessManager.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif
#include <spdlog/fmt/fmt.h>

#include <arpa/inet.h>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <future>
#include <netinet/in.h>
#include <optional>
#include <sstream>
#include <sys/socket.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

extern char **environ;

namespace {

template <typename... Args>
void process_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("inference_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

constexpr auto kStaleShutdownWait = std::chrono::milliseconds(500);
constexpr auto kReapPollInterval = std::chrono::milliseconds(50);
constexpr int kMaxTokens = 1024;
constexpr double kTemperature = 0.7;

struct MarkerRecord {
    pid_t pid{0};
    std::string executable;
};

std::optional<MarkerRecord> read_marker(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    MarkerRecord record;
    std::string pid_line;
    std::getline(in, pid_line);
    std::getline(in, record.executable);
    try {
        record.pid = static_cast<pid_t>(std::stol(Utils::trim(pid_line)));
    } catch (const std::exception&) {
        record.pid = 0;
    }
    return record;
}

bool process_alive(pid_t pid)
{
    return pid > 0 && ::kill(pid, 0) == 0;
}

// On Linux the recorded executable must match /proc/<pid>/exe so a recycled pid is left alone.
bool process_matches_executable(pid_t pid, const std::string& executable)
{
#ifdef __linux__
    if (executable.empty()) {
        return false;
    }
    std::error_code ec;
    const auto proc_exe = std::filesystem::read_symlink("/proc/" + std::to_string(pid) + "/exe", ec);
    if (ec) {
        return false;
    }
    std::string actual = proc_exe.string();
    const std::string deleted_suffix = " (deleted)";
    if (Utils::ends_with(actual, deleted_suffix)) {
        actual.resize(actual.size() - deleted_suffix.size());
    }
    const auto expected = std::filesystem::weakly_canonical(executable, ec);
    return actual == (ec ? executable : expected.string());
#else
    (void)pid;
    (void)executable;
    return true;
#endif
}

std::string to_json_string(const Json::Value& value)
{
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

bool parse_json(const std::string& text, Json::Value& root, std::string& errors)
{
    Json::CharReaderBuilder builder;
    std::istringstream stream(text);
    try {
        return Json::parseFromStream(builder, stream, &root, &errors);
    } catch (const std::exception& ex) {
        errors = ex.what();
        return false;
    }
}

std::vector<std::string> build_environment(const std::string& library_dir)
{
    std::vector<std::string> env_vars;
    for (char** env = environ; env && *env != nullptr; ++env) {
        env_vars.emplace_back(*env);
    }
    const std::string ld_prefix = "LD_LIBRARY_PATH=";
    bool found = false;
    for (auto& entry : env_vars) {
        if (entry.rfind(ld_prefix, 0) == 0) {
            entry = ld_prefix + library_dir;
            found = true;
            break;
        }
    }
    if (!found) {
        env_vars.push_back(ld_prefix + library_dir);
    }
    return env_vars;
}

std::vector<char*> to_c_array(std::vector<std::string>& storage)
{
    std::vector<char*> pointers;
    pointers.reserve(storage.size() + 1);
    for (auto& value : storage) {
        pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

// Returns true once pid has been reaped (or was not our child).
bool try_reap(pid_t pid)
{
    int status = 0;
    const pid_t rc = ::waitpid(pid, &status, WNOHANG);
    return rc == pid || (rc < 0 && errno == ECHILD);
}

} // namespace


BundledProcessManager::BundledProcessManager(BundledParameters params)
    : BundledProcessManager(std::move(params), Options{})
{
}


BundledProcessManager::BundledProcessManager(BundledParameters params, Options options)
    : params_(std::move(params)),
      options_(std::move(options)),
      probe_(options_.transport),
      timeouts_(options_.timeouts)
{
    if (!options_.transport) {
        options_.transport = default_http_transport();
    }
    if (options_.marker_path.empty()) {
        options_.marker_path = Utils::get_pid_file_path();
    }
    if (options_.server_log_path.empty()) {
        options_.server_log_path = Utils::get_server_log_path();
    }
}


BundledProcessManager::~BundledProcessManager()
{
    try {
        stop();
    } catch (const std::exception& ex) {
        process_log(spdlog::level::err, "Failed to stop llama-server during shutdown: {}", ex.what());
    }
}


std::string BundledProcessManager::base_url() const
{
    return "http://127.0.0.1:" + std::to_string(params_.port);
}


bool BundledProcessManager::is_transitional(const State& state)
{
    return std::holds_alternative<Starting>(state) || std::holds_alternative<Stopping>(state);
}


bool BundledProcessManager::is_running_state(const State& state)
{
    return std::holds_alternative<RunningManaged>(state) || std::holds_alternative<RunningUnmanaged>(state);
}


void BundledProcessManager::start()
{
    std::unique_lock<std::mutex> lock(mutex_);
    state_changed_.wait(lock, [this] { return !is_transitional(state_); });
    if (is_running_state(state_)) {
        return;
    }
    state_ = Starting{};
    lock.unlock();

    // Falls back to Stopped unless bootstrap() hands over a running state.
    struct StartingGuard {
        BundledProcessManager& owner;
        State outcome{Stopped{}};
        ~StartingGuard() {
            std::lock_guard<std::mutex> guard(owner.mutex_);
            owner.state_ = outcome;
            owner.state_changed_.notify_all();
        }
    } guard{*this};

    guard.outcome = bootstrap();
}


BundledProcessManager::State BundledProcessManager::bootstrap()
{
    cleanup_stale_process();

    if (!port_is_free()) {
        if (probe_.is_healthy(base_url(), timeouts().status_probe)) {
            process_log(spdlog::level::info,
                        "Reusing healthy llama-server already listening on port {}", params_.port);
            return RunningUnmanaged{};
        }
        THROW_APP_ERROR(ErrorCodes::Code::PROCESS_PORT_IN_USE, "port " + std::to_string(params_.port));
    }

    validate_paths();
    const pid_t pid = spawn_server();
    wait_until_healthy(pid);
    process_log(spdlog::level::info, "llama-server (pid {}) is ready on port {}", pid, params_.port);
    return RunningManaged{pid};
}


bool BundledProcessManager::cleanup_stale_process() const
{
    const auto marker = read_marker(options_.marker_path);
    if (!marker) {
        return false;
    }

    bool signalled = false;
    if (process_alive(marker->pid) && process_matches_executable(marker->pid, marker->executable)) {
        signalled = true;
        process_log(spdlog::level::warn, "Stopping stale llama-server (pid {}) from a previous run", marker->pid);
        ::kill(marker->pid, SIGINT);
        std::this_thread::sleep_for(kStaleShutdownWait);
        if (process_alive(marker->pid)) {
            ::kill(marker->pid, SIGKILL);
        }
    }
    remove_marker();
    return signalled;
}


bool BundledProcessManager::reclaim_stale_process()
{
    std::unique_lock<std::mutex> lock(mutex_);
    state_changed_.wait(lock, [this] { return !is_transitional(state_); });
    if (!std::holds_alternative<Stopped>(state_)) {
        return false;
    }
    return cleanup_stale_process();
}


bool BundledProcessManager::port_is_free() const
{
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        process_log(spdlog::level::warn, "socket() failed while checking port {}: {}",
                    params_.port, std::strerror(errno));
        return false;
    }
    int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_ANY);
    address.sin_port = htons(static_cast<uint16_t>(params_.port));

    const bool bound = ::bind(fd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) == 0
                       && ::listen(fd, 1) == 0;
    ::close(fd);
    return bound;
}


void BundledProcessManager::validate_paths() const
{
    std::error_code ec;
    if (params_.server_path.empty() || !std::filesystem::exists(params_.server_path, ec)) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID,
                            "llama-server binary not found",
                            params_.server_path + " (run: traq-inference download-server)");
    }
    if (params_.model_path.empty() || !std::filesystem::exists(params_.model_path, ec)) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID,
                            "Model file not found",
                            params_.model_path + " (run: traq-inference download-model <id>)");
    }
}


pid_t BundledProcessManager::spawn_server() const
{
    std::error_code ec;
    std::filesystem::create_directories(options_.server_log_path.parent_path(), ec);
    const int log_fd = ::open(options_.server_log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (log_fd < 0) {
        process_log(spdlog::level::warn, "Cannot open server log {}: {}",
                    options_.server_log_path.string(), std::strerror(errno));
    }

    std::vector<std::string> args = {
        params_.server_path,
        "-m", params_.model_path,
        "--port", std::to_string(params_.port),
        "-c", std::to_string(params_.context_size),
    };
    if (params_.gpu_layers > 0) {
        args.push_back("-ngl");
        args.push_back(std::to_string(params_.gpu_layers));
    }
    const std::string server_dir = std::filesystem::path(params_.server_path).parent_path().string();
    std::vector<std::string> env_vars = build_environment(server_dir);
    std::vector<char*> argv = to_c_array(args);
    std::vector<char*> envp = to_c_array(env_vars);

    int exec_pipe[2];
    if (::pipe(exec_pipe) != 0) {
        if (log_fd >= 0) {
            ::close(log_fd);
        }
        THROW_APP_ERROR(ErrorCodes::Code::PROCESS_SPAWN_FAILED, std::string("pipe: ") + std::strerror(errno));
    }
    // The write end closes on a successful exec, which the parent sees as EOF.
    ::fcntl(exec_pipe[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

    // Phase one: record the intent before the child exists.
    write_marker(0);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(exec_pipe[0]);
        ::close(exec_pipe[1]);
        if (log_fd >= 0) {
            ::close(log_fd);
        }
        remove_marker();
        THROW_APP_ERROR(ErrorCodes::Code::PROCESS_SPAWN_FAILED, std::string("fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        ::close(exec_pipe[0]);
        if (log_fd >= 0) {
            ::dup2(log_fd, STDOUT_FILENO);
            ::dup2(log_fd, STDERR_FILENO);
        }
        ::execve(argv[0], argv.data(), envp.data());
        const int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Phase two: the pid is known before the server is declared started.
    write_marker(pid);

    ::close(exec_pipe[1]);
    if (log_fd >= 0) {
        ::close(log_fd);
    }
    int child_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        remove_marker();
        THROW_APP_ERROR(ErrorCodes::Code::PROCESS_SPAWN_FAILED,
                        params_.server_path + ": " + std::strerror(child_errno));
    }

    process_log(spdlog::level::info, "Started llama-server (pid {}) with model {}", pid, params_.model_path);
    return pid;
}


void BundledProcessManager::wait_until_healthy(pid_t pid) const
{
    enum class Outcome { Ready, Exited, TimedOut };

    const InferenceTimeouts limits = timeouts();
    const auto poll_interval = limits.startup_poll;
    const auto ceiling = limits.startup;
    const auto probe_timeout = limits.status_probe;
    const std::string url = base_url();

    auto poller = std::async(std::launch::async, [this, pid, poll_interval, ceiling, probe_timeout, url] {
        const auto deadline = std::chrono::steady_clock::now() + ceiling;
        while (std::chrono::steady_clock::now() < deadline) {
            if (probe_.is_healthy(url, probe_timeout)) {
                return Outcome::Ready;
            }
            if (try_reap(pid)) {
                return Outcome::Exited;
            }
            std::this_thread::sleep_for(poll_interval);
        }
        return Outcome::TimedOut;
    });

    switch (poller.get()) {
        case Outcome::Ready:
            return;
        case Outcome::Exited:
            remove_marker();
            THROW_APP_ERROR(ErrorCodes::Code::PROCESS_EXITED_EARLY,
                            "see " + options_.server_log_path.string());
        case Outcome::TimedOut:
            terminate(pid);
            remove_marker();
            THROW_APP_ERROR(ErrorCodes::Code::PROCESS_STARTUP_TIMEOUT,
                            "no healthy response within " + std::to_string(ceiling.count()) + " ms");
    }
}


void BundledProcessManager::terminate(pid_t pid) const
{
    if (try_reap(pid)) {
        return;
    }
    ::kill(pid, SIGINT);

    const auto deadline = std::chrono::steady_clock::now() + timeouts().stop_grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (try_reap(pid)) {
            return;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }

    process_log(spdlog::level::warn, "llama-server (pid {}) ignored SIGINT, killing it", pid);
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}


void BundledProcessManager::stop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    state_changed_.wait(lock, [this] { return !is_transitional(state_); });

    if (std::holds_alternative<Stopped>(state_)) {
        return;
    }
    if (std::holds_alternative<RunningUnmanaged>(state_)) {
        process_log(spdlog::level::info, "Releasing adopted llama-server on port {}", params_.port);
        state_ = Stopped{};
        state_changed_.notify_all();
        return;
    }

    const pid_t pid = std::get<RunningManaged>(state_).pid;
    state_ = Stopping{pid};
    lock.unlock();

    terminate(pid);
    remove_marker();
    process_log(spdlog::level::info, "Stopped llama-server (pid {})", pid);

    lock.lock();
    state_ = Stopped{};
    state_changed_.notify_all();
}


// Caller holds mutex_.
void BundledProcessManager::reap_if_exited() const
{
    const auto* managed = std::get_if<RunningManaged>(&state_);
    if (!managed || !try_reap(managed->pid)) {
        return;
    }
    process_log(spdlog::level::warn, "llama-server (pid {}) exited unexpectedly, see {}",
                managed->pid, options_.server_log_path.string());
    remove_marker();
    state_ = Stopped{};
    state_changed_.notify_all();
}


bool BundledProcessManager::is_running() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    reap_if_exited();
    return is_running_state(state_);
}


void BundledProcessManager::set_timeouts(const InferenceTimeouts& timeouts)
{
    std::lock_guard<std::mutex> lock(timeouts_mutex_);
    timeouts_ = timeouts;
}


InferenceTimeouts BundledProcessManager::timeouts() const
{
    std::lock_guard<std::mutex> lock(timeouts_mutex_);
    return timeouts_;
}


ProcessHandle BundledProcessManager::handle() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    reap_if_exited();
    ProcessHandle result;
    if (const auto* managed = std::get_if<RunningManaged>(&state_)) {
        result.pid = managed->pid;
        result.managed_by_us = true;
        result.running = true;
    } else if (std::holds_alternative<RunningUnmanaged>(state_)) {
        result.running = true;
    } else if (const auto* stopping = std::get_if<Stopping>(&state_)) {
        result.pid = stopping->pid;
        result.managed_by_us = true;
    }
    return result;
}


BundledStatus BundledProcessManager::get_status() const
{
    BundledStatus status;
    std::error_code ec;
    status.server_present = !params_.server_path.empty() && std::filesystem::exists(params_.server_path, ec);
    status.model_present = !params_.model_path.empty() && std::filesystem::exists(params_.model_path, ec);
    status.available = status.server_present && status.model_present;
    status.running = is_running();
    status.model_path = params_.model_path;
    status.server_path = params_.server_path;
    status.port = params_.port;
    return status;
}


HttpResponse BundledProcessManager::send(const HttpRequest& request) const
{
    HttpResponse response = options_.transport(request);
    if (!response.error.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::NETWORK_ERROR,
                            "Failed to call bundled server: " + response.error,
                            request.url);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::BACKEND_HTTP_ERROR,
                            "Bundled server returned status " + std::to_string(response.status_code)
                                + ": " + response.body,
                            request.url);
    }
    return response;
}


std::string BundledProcessManager::complete(const std::string& prompt) const
{
    if (!is_running()) {
        THROW_APP_ERROR(ErrorCodes::Code::PROCESS_NOT_RUNNING, base_url());
    }

    Json::Value payload;
    payload["prompt"] = prompt;
    payload["max_tokens"] = kMaxTokens;
    payload["temperature"] = kTemperature;
    payload["stop"] = Json::Value(Json::arrayValue);
    payload["stop"].append("\n\n\n");

    HttpRequest request;
    request.method = "POST";
    request.url = base_url() + "/completion";
    request.body = to_json_string(payload);
    request.headers = {{"Content-Type", "application/json"}};
    request.timeout_ms = static_cast<long>(timeouts().generation.count());

    const HttpResponse response = send(request);

    Json::Value root;
    std::string errors;
    if (!parse_json(response.body, root, errors) || !root.isObject()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::BACKEND_RESPONSE_INVALID,
                            "Failed to parse bundled server response",
                            errors);
    }
    const Json::Value& content = root["content"];
    if (!content.isString()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::BACKEND_RESPONSE_INVALID,
                            "Bundled server response has no content", response.body);
    }
    return content.asString();
}


std::string BundledProcessManager::get_model_info() const
{
    if (!is_running()) {
        THROW_APP_ERROR(ErrorCodes::Code::PROCESS_NOT_RUNNING, base_url());
    }

    HttpRequest request;
    request.method = "GET";
    request.url = base_url() + "/props";
    request.timeout_ms = static_cast<long>(timeouts().status_probe.count());
    return send(request).body;
}


void BundledProcessManager::write_marker(pid_t pid) const
{
    std::error_code ec;
    std::filesystem::create_directories(options_.marker_path.parent_path(), ec);

    std::string executable = params_.server_path;
    const auto canonical = std::filesystem::weakly_canonical(params_.server_path, ec);
    if (!ec) {
        executable = canonical.string();
    }

    std::ofstream out(options_.marker_path, std::ios::trunc);
    out << pid << "\n" << executable << "\n";
    if (!out) {
        process_log(spdlog::level::warn, "Failed to write process marker {}", options_.marker_path.string());
    }
}


void BundledProcessManager::remove_marker() const
{
    std::error_code ec;
    std::filesystem::remove(options_.marker_path, ec);
    if (ec) {
        process_log(spdlog::level::warn, "Failed to remove process marker {}: {}",
                    options_.marker_path.string(), ec.message());
    }
}
