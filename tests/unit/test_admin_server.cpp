// Waypoint Admin Server Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/runtime/admin_server.hpp"
#include "../../src/store/certificate_authority.hpp"
#include "fakes.hpp"

using namespace waypoint;
using namespace waypoint::runtime;
using namespace std::chrono_literals;

namespace {

struct AdminFixture {
    std::shared_ptr<testing::FakeFetcher> fetcher = std::make_shared<testing::FakeFetcher>();
    upstream::FetchCoordinator coordinator{fetcher, 0ms};
    store::SqliteStore store{":memory:"};
    store::StoredCertificateAuthority authority{store};
    merge::ConfigMerger merger{coordinator, store, authority, control::MergeConfig{}};
    AdminServer server{control::AdminConfig{}, merger, coordinator, 5s};

    AdminFixture() {
        model::RoutingSnapshot snapshot;
        snapshot.http.routers.push_back(model::router_from_document(
            "app-router",
            model::Document::parse(R"({"rule": "Host(`app.example.com`)", "service": "app"})")));
        fetcher->set_snapshot(std::move(snapshot));
    }
};

}  // namespace

TEST_CASE("Admin routes", "[runtime][admin]") {
    AdminFixture f;

    SECTION("Merged configuration") {
        auto response = f.server.handle("GET", "/api/traefik-config");
        REQUIRE(response.status == 200);
        REQUIRE(response.content_type == "application/json");

        auto body = nlohmann::json::parse(response.body);
        REQUIRE(body["http"]["routers"]["app-router"]["service"] == "app");
    }

    SECTION("Cache invalidation") {
        (void)f.server.handle("GET", "/api/traefik-config");
        auto response = f.server.handle("POST", "/api/traefik-config/invalidate");
        REQUIRE(response.status == 200);
        REQUIRE(nlohmann::json::parse(response.body)["message"] == "Cache invalidated successfully");

        (void)f.server.handle("GET", "/api/traefik-config");
        REQUIRE(f.fetcher->calls() == 2);
    }

    SECTION("Status") {
        auto response = f.server.handle("GET", "/api/traefik-config/status");
        REQUIRE(response.status == 200);
        auto body = nlohmann::json::parse(response.body);
        REQUIRE(body["status"] == "healthy");
        REQUIRE(body["message"] == "Config proxy is operational");
    }

    SECTION("Health") {
        (void)f.server.handle("GET", "/api/traefik-config");
        for (const char* path : {"/health", "/_health"}) {
            auto response = f.server.handle("GET", path);
            REQUIRE(response.status == 200);
            auto body = nlohmann::json::parse(response.body);
            REQUIRE(body["status"] == "healthy");
            REQUIRE(body["fetch"]["fetch_count"] == 1);
            REQUIRE(body["merge"]["build_count"] == 1);
            REQUIRE(body["source_type"] == "pangolin_api");
        }
    }

    SECTION("Unknown routes and methods") {
        REQUIRE(f.server.handle("GET", "/api/unknown").status == 404);
        REQUIRE(f.server.handle("GET", "/api/traefik-config/invalidate").status == 404);
        REQUIRE(f.server.handle("DELETE", "/api/traefik-config").status == 404);
    }
}

TEST_CASE("Admin routes with an unreachable upstream", "[runtime][admin]") {
    AdminFixture f;
    f.fetcher->set_error(core::Errc::transport_failed, "connection refused");

    SECTION("Configuration request fails with details") {
        auto response = f.server.handle("GET", "/api/traefik-config");
        REQUIRE(response.status == 500);
        auto body = nlohmann::json::parse(response.body);
        REQUIRE(body["error"] == "Failed to get Traefik configuration");
        REQUIRE(body["details"] == "connection refused");
    }

    SECTION("Status reports unhealthy") {
        auto response = f.server.handle("GET", "/api/traefik-config/status");
        REQUIRE(response.status == 200);
        auto body = nlohmann::json::parse(response.body);
        REQUIRE(body["status"] == "unhealthy");
        REQUIRE(body["error"] == "connection refused");
    }

    SECTION("Health reports a node that never fetched") {
        auto response = f.server.handle("GET", "/health");
        auto body = nlohmann::json::parse(response.body);
        REQUIRE(body["status"] == "starting");
    }
}
