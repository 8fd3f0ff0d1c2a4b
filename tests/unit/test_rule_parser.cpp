// Waypoint Rule Parser Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/upstream/rule_parser.hpp"
#include "../../src/upstream/system_routers.hpp"

using namespace waypoint::upstream;

TEST_CASE("Host extraction from router rules", "[upstream][rule_parser]") {
    SECTION("Plain Host matcher") {
        REQUIRE(extract_host("Host(`app.example.com`)") == "app.example.com");
    }

    SECTION("First Host of an OR expression wins") {
        REQUIRE(extract_host("Host(`a.example.com`) || Host(`b.example.com`)") ==
                "a.example.com");
    }

    SECTION("Host combined with a path matcher") {
        REQUIRE(extract_host("PathPrefix(`/api`) && Host(`api.example.com`)") ==
                "api.example.com");
    }

    SECTION("Catch-all HostRegexp") {
        REQUIRE(extract_host("HostRegexp(`.+`)") == std::string(kAnyHost));
    }

    SECTION("HostRegexp pattern is simplified") {
        REQUIRE(extract_host(R"(HostRegexp(`^[a-z]+\.example\.com$`))") == "x.example.com");
    }

    SECTION("Legacy Host: syntax") {
        REQUIRE(extract_host("Host:legacy.example.com") == "legacy.example.com");
        REQUIRE(extract_host("Host:legacy.example.com,other") == "legacy.example.com");
    }

    SECTION("No host matcher") {
        REQUIRE(extract_host("PathPrefix(`/`)").empty());
        REQUIRE(extract_host("").empty());
        REQUIRE(extract_host("Host(`unterminated").empty());
    }
}

TEST_CASE("SNI extraction from TCP rules", "[upstream][rule_parser]") {
    SECTION("HostSNI literal") {
        REQUIRE(extract_host_sni("HostSNI(`db.example.com`)") == "db.example.com");
        REQUIRE(extract_sni("HostSNI(`*`)") == "*");
    }

    SECTION("HostSNIRegexp fallback") {
        REQUIRE(extract_host_sni("HostSNIRegexp(`^.+\\.example\\.com$`)").empty());
        REQUIRE(extract_sni(R"(HostSNIRegexp(`^.+\.example\.com$`))") == "x.example.com");
    }

    SECTION("HTTP Host matcher is not an SNI") {
        REQUIRE(extract_sni("Host(`web.example.com`)").empty());
    }
}

TEST_CASE("Host pattern simplification", "[upstream][rule_parser]") {
    REQUIRE(simplify_host_pattern(R"(\d+\.example\.com)") == "N.example.com");
    REQUIRE(simplify_host_pattern("(foo|bar).example.com") == "foo-bar.example.com");
    REQUIRE(simplify_host_pattern("plain.example.com") == "plain.example.com");
}

TEST_CASE("System router classification", "[upstream][system_routers]") {
    SECTION("Aggregator routers") {
        REQUIRE(is_aggregator_system_router("api-router"));
        REQUIRE(is_aggregator_system_router("next-router"));
        REQUIRE(is_aggregator_system_router("ws-router"));
        REQUIRE_FALSE(is_aggregator_system_router("3-router"));
        REQUIRE_FALSE(is_aggregator_system_router("whoami"));
    }

    SECTION("Traefik built-in routers") {
        REQUIRE(is_traefik_system_router("api@internal"));
        REQUIRE(is_traefik_system_router("dashboard@internal"));
        REQUIRE(is_traefik_system_router("acme-http@internal"));
        REQUIRE(is_traefik_system_router("traefik@file"));
    }

    SECTION("User routers with -router in the name") {
        REQUIRE_FALSE(is_traefik_system_router("api-router@file"));
        REQUIRE_FALSE(is_traefik_system_router("next-router@file"));
    }

    SECTION("Ordinary user routers") {
        REQUIRE_FALSE(is_traefik_system_router("whoami@docker"));
        REQUIRE_FALSE(is_traefik_system_router("apiserver@file"));
    }
}
