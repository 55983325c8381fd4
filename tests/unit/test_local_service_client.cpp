#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "AppException.hpp"
#include "LocalServiceClient.hpp"
#include "TestHelpers.hpp"

namespace {

ErrorCodes::Code code_of(const std::function<void()>& action)
{
    try {
        action();
    } catch (const ErrorCodes::AppException& ex) {
        return ex.get_error_code();
    }
    return ErrorCodes::Code::UNKNOWN_ERROR;
}

constexpr std::chrono::milliseconds kTimeout{3000};

} // namespace

TEST_CASE("LocalServiceClient generates without streaming") {
    RecordingTransport recorder([](const HttpRequest&) {
        return make_response(200, R"({"model":"qwen2.5:7b","response":"Reply text","done":true})");
    });
    LocalServiceClient client({"http://gpu-box:11434/", "qwen2.5:7b"}, recorder.transport());

    REQUIRE(client.generate("prompt", kTimeout) == "Reply text");

    const auto request = recorder.requests().at(0);
    REQUIRE(request.method == "POST");
    REQUIRE(request.url == "http://gpu-box:11434/api/generate");
    REQUIRE(request.timeout_ms == 3000);
    REQUIRE(request.body.find("\"stream\":false") != std::string::npos);
    REQUIRE(request.body.find("\"model\":\"qwen2.5:7b\"") != std::string::npos);
}

TEST_CASE("LocalServiceClient falls back to the default host") {
    RecordingTransport recorder([](const HttpRequest&) { return make_response(200, R"({"response":""})"); });
    LocalServiceClient client({"", "qwen2.5:7b"}, recorder.transport());

    REQUIRE(client.generate("prompt", kTimeout).empty());
    REQUIRE(recorder.requests().at(0).url == std::string(kDefaultOllamaHost) + "/api/generate");
}

TEST_CASE("LocalServiceClient maps generate failures") {
    SECTION("network") {
        LocalServiceClient client({kDefaultOllamaHost, "m"},
                                  [](const HttpRequest&) { return make_network_failure("Connection refused"); });
        REQUIRE(code_of([&] { client.generate("p", kTimeout); }) == ErrorCodes::Code::NETWORK_ERROR);
    }
    SECTION("status") {
        LocalServiceClient client({kDefaultOllamaHost, "m"},
                                  [](const HttpRequest&) { return make_response(404, R"({"error":"model not found"})"); });
        REQUIRE(code_of([&] { client.generate("p", kTimeout); }) == ErrorCodes::Code::BACKEND_HTTP_ERROR);
    }
    SECTION("invalid body") {
        LocalServiceClient client({kDefaultOllamaHost, "m"},
                                  [](const HttpRequest&) { return make_response(200, "not json"); });
        REQUIRE(code_of([&] { client.generate("p", kTimeout); }) == ErrorCodes::Code::BACKEND_RESPONSE_INVALID);
    }
}

TEST_CASE("probe_tags reports each stage of the tags request") {
    SECTION("unreachable") {
        LocalServiceClient client({kDefaultOllamaHost, ""},
                                  [](const HttpRequest&) { return make_network_failure("Connection refused"); });
        const TagsProbe probe = client.probe_tags(kTimeout);
        REQUIRE_FALSE(probe.reachable);
        REQUIRE_FALSE(client.is_reachable(kTimeout));
    }
    SECTION("error status") {
        LocalServiceClient client({kDefaultOllamaHost, ""},
                                  [](const HttpRequest&) { return make_response(500, ""); });
        const TagsProbe probe = client.probe_tags(kTimeout);
        REQUIRE(probe.reachable);
        REQUIRE(probe.status_code == 500);
        REQUIRE_FALSE(probe.parsed);
        REQUIRE_FALSE(client.is_reachable(kTimeout));
    }
    SECTION("model list") {
        RecordingTransport recorder([](const HttpRequest&) {
            return make_response(200, R"({"models":[{"name":"qwen2.5:7b"},{"name":""},{"size":12},{"name":"llama3.2:3b"}]})");
        });
        LocalServiceClient client({kDefaultOllamaHost, ""}, recorder.transport());
        const TagsProbe probe = client.probe_tags(kTimeout);
        REQUIRE(probe.parsed);
        REQUIRE(probe.models == std::vector<std::string>{"qwen2.5:7b", "llama3.2:3b"});
        REQUIRE(recorder.requests().at(0).method == "GET");
        REQUIRE(recorder.count_path("/api/tags") == 1);
    }
}

TEST_CASE("pull_model reports progress lines split across chunks") {
    const std::string stream =
        "{\"status\":\"pulling manifest\"}\n"
        "{\"status\":\"downloading\",\"digest\":\"sha256:abc\",\"total\":1000,\"completed\":250}\n"
        "\n"
        "garbage line\n"
        "{\"status\":\"success\"}";
    LocalServiceClient client({kDefaultOllamaHost, ""}, nullptr, make_streaming_body(200, stream, 7));

    std::vector<PullProgress> updates;
    client.pull_model("qwen2.5:7b", [&](const PullProgress& progress) { updates.push_back(progress); });

    REQUIRE(updates.size() == 3);
    REQUIRE(updates[0].status == "pulling manifest");
    REQUIRE(updates[1].digest == "sha256:abc");
    REQUIRE(updates[1].total == 1000);
    REQUIRE(updates[1].completed == 250);
    REQUIRE(updates[2].status == "success");
}

TEST_CASE("pull_model surfaces errors") {
    SECTION("error line in the stream") {
        LocalServiceClient client({kDefaultOllamaHost, ""}, nullptr,
                                  make_streaming_body(200, "{\"status\":\"pulling manifest\"}\n"
                                                           "{\"error\":\"pull model manifest: file does not exist\"}\n"));
        try {
            client.pull_model("no-such-model", nullptr);
            FAIL("expected pull to fail");
        } catch (const ErrorCodes::AppException& ex) {
            REQUIRE(ex.get_error_code() == ErrorCodes::Code::BACKEND_HTTP_ERROR);
            REQUIRE(std::string(ex.what()).find("file does not exist") != std::string::npos);
        }
    }
    SECTION("HTTP status") {
        LocalServiceClient client({kDefaultOllamaHost, ""}, nullptr, make_streaming_body(500, "internal"));
        REQUIRE(code_of([&] { client.pull_model("m", nullptr); }) == ErrorCodes::Code::BACKEND_HTTP_ERROR);
    }
    SECTION("connection failure") {
        LocalServiceClient client({kDefaultOllamaHost, ""}, nullptr,
                                  [](const HttpRequest&, const StreamHandlers&) {
                                      return make_network_failure("Connection refused");
                                  });
        REQUIRE(code_of([&] { client.pull_model("m", nullptr); }) == ErrorCodes::Code::NETWORK_ERROR);
    }
}

TEST_CASE("pull_model saturates oversized progress counters") {
    const std::string stream =
        "{\"status\":\"downloading\",\"total\":1e30,\"completed\":-1e30}\n"
        "{\"status\":\"verifying\",\"detail\":" + std::string(1500, '[') + "\n"
        "{\"status\":\"success\"}\n";
    LocalServiceClient client({kDefaultOllamaHost, ""}, nullptr, make_streaming_body(200, stream));

    std::vector<PullProgress> updates;
    REQUIRE_NOTHROW(client.pull_model("m", [&](const PullProgress& progress) { updates.push_back(progress); }));

    REQUIRE(updates.size() == 2);
    REQUIRE(updates[0].total == std::numeric_limits<std::int64_t>::max());
    REQUIRE(updates[0].completed == std::numeric_limits<std::int64_t>::min());
    REQUIRE(updates[1].status == "success");
}
