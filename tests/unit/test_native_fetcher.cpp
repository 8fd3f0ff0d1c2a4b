// Waypoint Native Fetcher Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/upstream/native_fetcher.hpp"
#include "fakes.hpp"

using namespace waypoint;
using namespace waypoint::upstream;

namespace {

constexpr const char* kPrimary = "http://traefik:8080";
constexpr const char* kFallback = "http://traefik-fallback:8080";

constexpr const char* kRouters = R"([
    {"name": "whoami@docker", "rule": "Host(`whoami.example.com`)", "service": "whoami@docker",
     "provider": "docker", "status": "enabled", "entryPoints": ["web", "websecure"],
     "priority": 42, "tls": {"certResolver": "le"}},
    {"name": "plain@file", "rule": "Host(`plain.example.com`)", "service": "plain@file",
     "provider": "file", "status": "enabled"},
    {"name": "api@internal", "rule": "PathPrefix(`/api`)", "service": "api@internal",
     "provider": "internal"},
    {"name": "dashboard@file", "rule": "Host(`traefik.example.com`)", "service": "dashboard@file",
     "provider": "file"}
])";

control::UpstreamConfig native_config() {
    control::UpstreamConfig config;
    config.type = "traefik";
    config.url = kPrimary;
    config.fallback_urls = {kFallback, std::string(kPrimary) + "/"};
    return config;
}

void serve_all(testing::FakeHttpClient& http, const std::string& base) {
    for (const auto& spec : kNativeEndpoints) {
        std::string body = "[]";
        if (spec.name == "http_routers") {
            body = kRouters;
        } else if (spec.name == "http_services") {
            body = R"({"whoami@docker": {"loadBalancer": {"servers": [{"url": "http://172.17.0.2"}]},
                       "provider": "docker", "status": "enabled"}})";
        } else if (spec.name == "version") {
            body = R"({"Version": "3.1.0"})";
        } else if (spec.name == "overview") {
            body = R"({"http": {"routers": {"total": 4}}})";
        }
        http.respond(base + std::string(spec.path), 200, body);
    }
}

}  // namespace

TEST_CASE("Native fetch assembles a snapshot", "[upstream][native]") {
    testing::FakeHttpClient http;
    serve_all(http, kPrimary);
    NativeFetcher fetcher(native_config(), http);
    core::FetchContext ctx(std::chrono::seconds(5));

    auto result = fetcher.fetch(ctx);
    REQUIRE(result.ok());
    const auto& snapshot = *result.snapshot;

    REQUIRE(snapshot.source_type == model::kSourceTraefik);
    REQUIRE(snapshot.http.routers.size() == 4);
    REQUIRE(snapshot.http.services.size() == 1);
    REQUIRE(snapshot.http.services[0].name == "whoami@docker");
    REQUIRE(snapshot.http.services[0].type == "loadBalancer");
    REQUIRE(snapshot.version["Version"] == "3.1.0");
    REQUIRE(http.calls().size() == kNativeEndpoints.size());
    REQUIRE(http.count_prefix(kFallback) == 0);

    SECTION("Runtime fields are not published") {
        const auto& config = snapshot.http.routers[0].config;
        REQUIRE_FALSE(config.contains("status"));
        REQUIRE_FALSE(config.contains("provider"));
        REQUIRE(config.contains("rule"));
    }
}

TEST_CASE("Native endpoint failures", "[upstream][native]") {
    testing::FakeHttpClient http;
    serve_all(http, kPrimary);
    serve_all(http, kFallback);
    NativeFetcher fetcher(native_config(), http);
    core::FetchContext ctx(std::chrono::seconds(5));

    SECTION("Critical endpoint answering 500 fails without fallback") {
        http.respond(std::string(kPrimary) + "/api/http/routers", 500, "internal error");

        auto result = fetcher.fetch(ctx);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error.is(core::Errc::critical_endpoints_failed));
        REQUIRE(result.error.message.find("http_routers") != std::string::npos);
        REQUIRE(http.count_prefix(kFallback) == 0);
    }

    SECTION("Non-critical endpoint answering 404 yields an empty collection") {
        http.respond(std::string(kPrimary) + "/api/tcp/services", 404, "not found");

        auto result = fetcher.fetch(ctx);
        REQUIRE(result.ok());
        REQUIRE(result.snapshot->tcp.services.empty());
        REQUIRE(result.snapshot->http.routers.size() == 4);
    }

    SECTION("Malformed critical payload") {
        http.respond(std::string(kPrimary) + "/api/version", 200, "not json");

        auto result = fetcher.fetch(ctx);
        REQUIRE(result.error.is(core::Errc::critical_endpoints_failed));
        REQUIRE(http.count_prefix(kFallback) == 0);
    }
}

TEST_CASE("Native fallback URLs", "[upstream][native]") {
    testing::FakeHttpClient http;
    core::FetchContext ctx(std::chrono::seconds(5));

    SECTION("Candidates exclude the primary URL") {
        NativeFetcher fetcher(native_config(), http);
        REQUIRE(fetcher.fallback_candidates() == std::vector<std::string>{kFallback});
    }

    SECTION("Connection failure on the primary tries the fallback") {
        serve_all(http, kFallback);
        NativeFetcher fetcher(native_config(), http);

        auto result = fetcher.fetch(ctx);
        REQUIRE(result.ok());
        REQUIRE(http.count_prefix(kPrimary) == kNativeEndpoints.size());
        REQUIRE(http.count_prefix(kFallback) == kNativeEndpoints.size());
    }

    SECTION("Every URL unreachable") {
        NativeFetcher fetcher(native_config(), http);

        auto result = fetcher.fetch(ctx);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error.is(core::Errc::all_urls_failed));
    }
}

TEST_CASE("Native resource surfacing", "[upstream][native]") {
    testing::FakeHttpClient http;
    serve_all(http, kPrimary);
    core::FetchContext ctx(std::chrono::seconds(5));

    SECTION("Internal and system routers are skipped") {
        NativeFetcher fetcher(native_config(), http);
        auto result = fetcher.fetch(ctx);
        REQUIRE(result.ok());

        auto resources = fetcher.surface_resources(*result.snapshot);
        REQUIRE(resources.size() == 2);
        REQUIRE(resources[0].id == "whoami@docker");
        REQUIRE(resources[0].host == "whoami.example.com");
        REQUIRE(resources[0].entrypoints == "web,websecure");
        REQUIRE(resources[0].router_priority == 42);
        REQUIRE(resources[0].source_type == model::kSourceTraefik);
        REQUIRE(resources[1].id == "plain@file");
        REQUIRE(resources[1].router_priority == 0);
    }

    SECTION("Certificate resolver requirement") {
        auto config = native_config();
        config.require_cert_resolver = true;
        NativeFetcher fetcher(config, http);
        auto result = fetcher.fetch(ctx);
        REQUIRE(result.ok());

        auto resources = fetcher.surface_resources(*result.snapshot);
        REQUIRE(resources.size() == 1);
        REQUIRE(resources[0].id == "whoami@docker");
    }
}
