#include <catch2/catch_test_macros.hpp>

#include <csignal>
#include <filesystem>
#include <future>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

#include "AppException.hpp"
#include "BundledProcessManager.hpp"
#include "TestHelpers.hpp"

namespace {

struct FakeServer {
    TempDir dir;
    std::filesystem::path script;
    std::filesystem::path model;
    std::filesystem::path args_file;
    std::filesystem::path env_file;
    std::filesystem::path starts_file;
    int port{find_free_port()};

    explicit FakeServer(const std::string& tail = "exec sleep 30\n")
    {
        script = dir.path() / "bin" / "llama-server";
        model = dir.path() / "models" / "tiny.gguf";
        args_file = dir.path() / "args.txt";
        env_file = dir.path() / "env.txt";
        starts_file = dir.path() / "starts.txt";
        write_text_file(model, "weights");
        write_text_file(script,
                        "#!/bin/sh\n"
                        "echo started >> '" + starts_file.string() + "'\n"
                        "echo \"$LD_LIBRARY_PATH\" > '" + env_file.string() + "'\n"
                        "echo \"$@\" > '" + args_file.string() + ".tmp'\n"
                        "mv '" + args_file.string() + ".tmp' '" + args_file.string() + "'\n" + tail);
        std::filesystem::permissions(script, std::filesystem::perms::owner_all);
    }

    BundledParameters params() const
    {
        BundledParameters p;
        p.model_path = model.string();
        p.server_path = script.string();
        p.port = port;
        p.context_size = 4096;
        return p;
    }

    BundledProcessManager::Options options(HttpTransport transport) const
    {
        BundledProcessManager::Options o;
        o.transport = std::move(transport);
        o.timeouts.status_probe = std::chrono::milliseconds(200);
        o.timeouts.startup = std::chrono::milliseconds(5000);
        o.timeouts.startup_poll = std::chrono::milliseconds(50);
        o.timeouts.stop_grace = std::chrono::milliseconds(1000);
        o.marker_path = dir.path() / "llama-server.pid";
        o.server_log_path = dir.path() / "logs" / "llama-server.log";
        return o;
    }
};

// Healthy once the fake server has written its arguments.
RecordingTransport::Handler healthy_after_launch(const FakeServer& server,
                                                 std::string completion_body = R"({"content":"done"})")
{
    const auto args_file = server.args_file;
    return [args_file, completion_body](const HttpRequest& request) {
        if (request.url.find("/health") != std::string::npos) {
            return std::filesystem::exists(args_file) ? make_response(200, R"({"status":"ok"})")
                                                      : make_network_failure("Connection refused");
        }
        if (request.url.find("/completion") != std::string::npos) {
            return make_response(200, completion_body);
        }
        if (request.url.find("/props") != std::string::npos) {
            return make_response(200, R"({"model":"tiny"})");
        }
        return make_response(404, "");
    };
}

ErrorCodes::Code code_of(const std::function<void()>& action)
{
    try {
        action();
    } catch (const ErrorCodes::AppException& ex) {
        return ex.get_error_code();
    }
    return ErrorCodes::Code::UNKNOWN_ERROR;
}

bool pid_alive(pid_t pid)
{
    return ::kill(pid, 0) == 0;
}

std::filesystem::path sleep_executable()
{
    std::error_code ec;
    return std::filesystem::weakly_canonical("/bin/sleep", ec);
}

// Forks /bin/sleep and waits until the child has actually exec'd it.
pid_t spawn_sleeper()
{
    const pid_t pid = ::fork();
    if (pid == 0) {
        ::execl("/bin/sleep", "sleep", "30", static_cast<char*>(nullptr));
        ::_exit(127);
    }
    const auto proc_exe = "/proc/" + std::to_string(pid) + "/exe";
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        std::error_code ec;
        if (std::filesystem::read_symlink(proc_exe, ec) == sleep_executable()) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pid;
}

} // namespace

TEST_CASE("BundledProcessManager spawns the server and stops it") {
    FakeServer server;
    RecordingTransport transport(healthy_after_launch(server));
    BundledProcessManager manager(server.params(), server.options(transport.transport()));

    manager.start();

    const ProcessHandle handle = manager.handle();
    REQUIRE(handle.running);
    REQUIRE(handle.managed_by_us);
    REQUIRE(handle.pid > 0);
    REQUIRE(manager.is_running());

    const std::string args = read_text_file(server.args_file);
    REQUIRE(args.find("-m " + server.model.string()) != std::string::npos);
    REQUIRE(args.find("--port " + std::to_string(server.port)) != std::string::npos);
    REQUIRE(args.find("-c 4096") != std::string::npos);
    REQUIRE(args.find("-ngl") == std::string::npos);
    REQUIRE(read_text_file(server.env_file) == server.script.parent_path().string() + "\n");

    const std::string marker = read_text_file(server.dir.path() / "llama-server.pid");
    REQUIRE(marker.rfind(std::to_string(handle.pid) + "\n", 0) == 0);

    manager.stop();
    REQUIRE_FALSE(manager.is_running());
    REQUIRE_FALSE(manager.handle().running);
    REQUIRE_FALSE(pid_alive(static_cast<pid_t>(handle.pid)));
    REQUIRE_FALSE(std::filesystem::exists(server.dir.path() / "llama-server.pid"));

    // A second stop is a no-op.
    manager.stop();
}

TEST_CASE("BundledProcessManager passes GPU layers when configured") {
    FakeServer server;
    RecordingTransport transport(healthy_after_launch(server));
    BundledParameters params = server.params();
    params.gpu_layers = 33;
    BundledProcessManager manager(params, server.options(transport.transport()));

    manager.start();
    REQUIRE(read_text_file(server.args_file).find("-ngl 33") != std::string::npos);
    manager.stop();
}

TEST_CASE("BundledProcessManager starts only once under concurrent callers") {
    FakeServer server;
    RecordingTransport transport(healthy_after_launch(server));
    BundledProcessManager manager(server.params(), server.options(transport.transport()));

    auto first = std::async(std::launch::async, [&] { manager.start(); });
    auto second = std::async(std::launch::async, [&] { manager.start(); });
    first.get();
    second.get();
    manager.start();

    REQUIRE(read_text_file(server.starts_file) == "started\n");
    manager.stop();
}

TEST_CASE("BundledProcessManager adopts a healthy server on a busy port") {
    FakeServer server;
    PortBlocker blocker(server.port);
    REQUIRE(blocker.bound());
    RecordingTransport transport([](const HttpRequest& request) {
        if (request.url.find("/completion") != std::string::npos) {
            return make_response(200, R"({"content":"adopted"})");
        }
        return make_response(200, R"({"status":"ok"})");
    });
    BundledProcessManager manager(server.params(), server.options(transport.transport()));

    manager.start();

    const ProcessHandle handle = manager.handle();
    REQUIRE(handle.running);
    REQUIRE_FALSE(handle.managed_by_us);
    REQUIRE_FALSE(std::filesystem::exists(server.starts_file));

    REQUIRE(manager.complete("hello") == "adopted");
    manager.stop();
    REQUIRE_FALSE(manager.is_running());
}

TEST_CASE("BundledProcessManager refuses a busy port without a healthy server") {
    FakeServer server;
    PortBlocker blocker(server.port);
    REQUIRE(blocker.bound());
    RecordingTransport transport([](const HttpRequest&) { return make_network_failure("Connection refused"); });
    BundledProcessManager manager(server.params(), server.options(transport.transport()));

    REQUIRE(code_of([&] { manager.start(); }) == ErrorCodes::Code::PROCESS_PORT_IN_USE);
    REQUIRE_FALSE(manager.is_running());
    REQUIRE_FALSE(std::filesystem::exists(server.starts_file));
}

TEST_CASE("BundledProcessManager validates paths before spawning") {
    FakeServer server;
    RecordingTransport transport(healthy_after_launch(server));

    SECTION("missing server binary") {
        BundledParameters params = server.params();
        params.server_path = (server.dir.path() / "nope" / "llama-server").string();
        BundledProcessManager manager(params, server.options(transport.transport()));
        REQUIRE(code_of([&] { manager.start(); }) == ErrorCodes::Code::CONFIG_INVALID);
    }

    SECTION("missing model") {
        BundledParameters params = server.params();
        params.model_path = (server.dir.path() / "missing.gguf").string();
        BundledProcessManager manager(params, server.options(transport.transport()));
        REQUIRE(code_of([&] { manager.start(); }) == ErrorCodes::Code::CONFIG_INVALID);
    }

    REQUIRE_FALSE(std::filesystem::exists(server.starts_file));
}

TEST_CASE("BundledProcessManager reports a server that exits during startup") {
    FakeServer server("exit 3\n");
    RecordingTransport transport([](const HttpRequest&) { return make_network_failure("Connection refused"); });
    BundledProcessManager manager(server.params(), server.options(transport.transport()));

    REQUIRE(code_of([&] { manager.start(); }) == ErrorCodes::Code::PROCESS_EXITED_EARLY);
    REQUIRE_FALSE(manager.is_running());
    REQUIRE_FALSE(std::filesystem::exists(server.dir.path() / "llama-server.pid"));
}

TEST_CASE("BundledProcessManager kills a server that never becomes healthy") {
    FakeServer server;
    RecordingTransport transport([](const HttpRequest&) { return make_response(503, "loading"); });
    auto options = server.options(transport.transport());
    options.timeouts.startup = std::chrono::milliseconds(400);
    BundledProcessManager manager(server.params(), options);

    REQUIRE(code_of([&] { manager.start(); }) == ErrorCodes::Code::PROCESS_STARTUP_TIMEOUT);
    REQUIRE_FALSE(manager.is_running());
    REQUIRE_FALSE(std::filesystem::exists(server.dir.path() / "llama-server.pid"));
}

TEST_CASE("BundledProcessManager completion requires a running server") {
    FakeServer server;
    RecordingTransport transport(healthy_after_launch(server));
    BundledProcessManager manager(server.params(), server.options(transport.transport()));

    REQUIRE(code_of([&] { manager.complete("hi"); }) == ErrorCodes::Code::PROCESS_NOT_RUNNING);
    REQUIRE(code_of([&] { manager.get_model_info(); }) == ErrorCodes::Code::PROCESS_NOT_RUNNING);
    REQUIRE(transport.count_path("/completion") == 0);
}

TEST_CASE("BundledProcessManager sends completions to the server") {
    FakeServer server;
    RecordingTransport transport(healthy_after_launch(server, R"({"content":"{\"summary\":\"ok\"}"})"));
    BundledProcessManager manager(server.params(), server.options(transport.transport()));
    manager.start();

    REQUIRE(manager.complete("Summarize this") == R"({"summary":"ok"})");
    REQUIRE(manager.get_model_info() == R"({"model":"tiny"})");

    HttpRequest sent;
    for (const auto& request : transport.requests()) {
        if (request.url.find("/completion") != std::string::npos) {
            sent = request;
        }
    }
    REQUIRE(sent.method == "POST");
    REQUIRE(sent.url == "http://127.0.0.1:" + std::to_string(server.port) + "/completion");
    REQUIRE(sent.body.find(R"("prompt":"Summarize this")") != std::string::npos);
    REQUIRE(sent.body.find(R"("max_tokens":1024)") != std::string::npos);
    manager.stop();
}

TEST_CASE("BundledProcessManager notices a server that crashed after startup") {
    FakeServer server;
    RecordingTransport transport(healthy_after_launch(server));
    BundledProcessManager manager(server.params(), server.options(transport.transport()));
    manager.start();

    const pid_t pid = static_cast<pid_t>(manager.handle().pid);
    REQUIRE(pid > 0);
    REQUIRE(::kill(pid, SIGKILL) == 0);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (manager.is_running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    REQUIRE_FALSE(manager.get_status().running);
    REQUIRE_FALSE(manager.handle().running);
    REQUIRE_FALSE(std::filesystem::exists(server.dir.path() / "llama-server.pid"));
    REQUIRE(code_of([&] { manager.complete("hi"); }) == ErrorCodes::Code::PROCESS_NOT_RUNNING);

    // A crashed server can be started again.
    manager.start();
    REQUIRE(manager.is_running());
    REQUIRE(manager.handle().pid != pid);
    manager.stop();
}

TEST_CASE("BundledProcessManager uses updated timeouts for later requests") {
    FakeServer server;
    RecordingTransport transport(healthy_after_launch(server));
    BundledProcessManager manager(server.params(), server.options(transport.transport()));
    manager.start();

    InferenceTimeouts timeouts = manager.timeouts();
    timeouts.generation = std::chrono::milliseconds(777);
    manager.set_timeouts(timeouts);
    REQUIRE(manager.timeouts().generation == std::chrono::milliseconds(777));

    manager.complete("hi");
    REQUIRE(transport.requests().back().timeout_ms == 777);
    manager.stop();
}

TEST_CASE("BundledProcessManager rejects malformed completion replies") {
    FakeServer server;
    RecordingTransport transport(healthy_after_launch(server, "not json"));
    BundledProcessManager manager(server.params(), server.options(transport.transport()));
    manager.start();

    REQUIRE(code_of([&] { manager.complete("x"); }) == ErrorCodes::Code::BACKEND_RESPONSE_INVALID);
    manager.stop();
}

TEST_CASE("BundledProcessManager reclaims a server recorded by an earlier run") {
    FakeServer server;
    RecordingTransport transport(healthy_after_launch(server));
    const auto marker = server.dir.path() / "llama-server.pid";
    const pid_t sleeper = spawn_sleeper();
    REQUIRE(sleeper > 0);

    SECTION("matching executable is stopped") {
        write_text_file(marker, std::to_string(sleeper) + "\n" + sleep_executable().string() + "\n");

        BundledProcessManager manager(server.params(), server.options(transport.transport()));
        REQUIRE(manager.reclaim_stale_process());

        int status = 0;
        REQUIRE(::waitpid(sleeper, &status, 0) == sleeper);
        REQUIRE(WIFSIGNALED(status));
    }

    SECTION("a recycled pid is left alone") {
        write_text_file(marker, std::to_string(sleeper) + "\n/opt/elsewhere/llama-server\n");

        BundledProcessManager manager(server.params(), server.options(transport.transport()));
        REQUIRE_FALSE(manager.reclaim_stale_process());
        REQUIRE(pid_alive(sleeper));

        ::kill(sleeper, SIGKILL);
        int status = 0;
        ::waitpid(sleeper, &status, 0);
    }

    REQUIRE_FALSE(std::filesystem::exists(marker));
}

TEST_CASE("BundledProcessManager reports paths and port in its status") {
    FakeServer server;
    RecordingTransport transport(healthy_after_launch(server));
    BundledParameters params = server.params();
    params.model_path = (server.dir.path() / "models" / "absent.gguf").string();
    BundledProcessManager manager(params, server.options(transport.transport()));

    const BundledStatus status = manager.get_status();
    REQUIRE(status.server_present);
    REQUIRE_FALSE(status.model_present);
    REQUIRE_FALSE(status.available);
    REQUIRE_FALSE(status.running);
    REQUIRE(status.port == server.port);
    REQUIRE(manager.base_url() == "http://127.0.0.1:" + std::to_string(server.port));
}
