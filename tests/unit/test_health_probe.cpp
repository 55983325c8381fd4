#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "HealthProbe.hpp"
#include "TestHelpers.hpp"

TEST_CASE("HealthProbe issues GET /health with the given timeout") {
    RecordingTransport recorder([](const HttpRequest&) { return make_response(200, "{\"status\":\"ok\"}"); });
    HealthProbe probe(recorder.transport());

    REQUIRE(probe.is_healthy("http://127.0.0.1:18080/", std::chrono::milliseconds(750)));

    const auto requests = recorder.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].method == "GET");
    REQUIRE(requests[0].url == "http://127.0.0.1:18080/health");
    REQUIRE(requests[0].timeout_ms == 750);
}

TEST_CASE("HealthProbe only accepts 2xx replies") {
    long status = 503;
    HealthProbe probe([&](const HttpRequest&) { return make_response(status, ""); });

    REQUIRE_FALSE(probe.is_healthy("http://127.0.0.1:18080"));
    status = 204;
    REQUIRE(probe.is_healthy("http://127.0.0.1:18080"));
    status = 301;
    REQUIRE_FALSE(probe.is_healthy("http://127.0.0.1:18080"));
}

TEST_CASE("HealthProbe reads transport failures as unhealthy") {
    SECTION("connection error") {
        HealthProbe probe([](const HttpRequest&) { return make_network_failure("Connection refused"); });
        REQUIRE_FALSE(probe.is_healthy("http://127.0.0.1:18080"));
    }
    SECTION("transport throws") {
        HealthProbe probe([](const HttpRequest&) -> HttpResponse { throw std::runtime_error("boom"); });
        REQUIRE_FALSE(probe.is_healthy("http://127.0.0.1:18080"));
    }
}
