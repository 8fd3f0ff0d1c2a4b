// Waypoint Core Utilities Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <set>

#include "../../src/core/errors.hpp"
#include "../../src/core/fetch_context.hpp"
#include "../../src/core/http_client.hpp"
#include "../../src/core/regex.hpp"
#include "../../src/core/string_utils.hpp"
#include "../../src/core/uuid.hpp"

using namespace waypoint::core;

TEST_CASE("Error codes", "[core][errors]") {
    Error none;
    REQUIRE_FALSE(none);

    Error error(Errc::throttled, "minimum interval not elapsed");
    REQUIRE(error);
    REQUIRE(error.is(Errc::throttled));
    REQUIRE_FALSE(error.is(Errc::cancelled));
    REQUIRE(error.code.category().name() == std::string("waypoint"));
    REQUIRE(error.code.message() == "rate limited");

    std::error_code converted = Errc::storage_failed;
    REQUIRE(converted == make_error_code(Errc::storage_failed));
}

TEST_CASE("Fetch context deadline", "[core][fetch_context]") {
    SECTION("Fresh context") {
        FetchContext ctx(std::chrono::seconds(10));
        REQUIRE_FALSE(ctx.done());
        REQUIRE(ctx.remaining() > std::chrono::milliseconds(0));
    }

    SECTION("Expired context") {
        FetchContext ctx(std::chrono::milliseconds(0));
        REQUIRE(ctx.done());
        REQUIRE(ctx.remaining() == std::chrono::milliseconds(0));
    }

    SECTION("Copies share cancellation") {
        FetchContext ctx(std::chrono::seconds(10));
        FetchContext copy = ctx;
        copy.cancel();
        REQUIRE(ctx.done());
    }
}

TEST_CASE("URL splitting", "[core][http_client]") {
    auto [origin, path] = split_url("https://traefik.example.com:8443/api/http/routers?x=1");
    REQUIRE(origin == "https://traefik.example.com:8443");
    REQUIRE(path == "/api/http/routers?x=1");

    auto [bare_origin, bare_path] = split_url("http://pangolin:3001");
    REQUIRE(bare_origin == "http://pangolin:3001");
    REQUIRE(bare_path == "/");
}

TEST_CASE("UUID generation", "[core][uuid]") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto id = generate_uuid();
        REQUIRE(is_valid_uuid(id));
        seen.insert(id);
    }
    REQUIRE(seen.size() == 100);

    REQUIRE_FALSE(is_valid_uuid("3-router"));
    REQUIRE_FALSE(is_valid_uuid("123e4567-e89b-12d3-a456-426614174000"));
}

TEST_CASE("String utilities", "[core][string_utils]") {
    REQUIRE(join({"web", "websecure"}, ",") == "web,websecure");
    REQUIRE(join({}, ",").empty());
    REQUIRE(split("a && b && c", "&&").size() == 3);
    REQUIRE(trim("  Host(`a`) ") == "Host(`a`)");
    REQUIRE(replace_all("a.b.c", ".", "-") == "a-b-c");
    REQUIRE(to_lower("TRAEFIK") == "traefik");
    REQUIRE(levenshtein_distance("pangolin", "pangolni") == 2);
}

TEST_CASE("PCRE2 regex wrapper", "[core][regex]") {
    auto re = Regex::compile(R"(Host\(`(.*?)`\))");
    REQUIRE(re.has_value());
    REQUIRE(re->matches("Host(`a.example.com`) || Host(`b.example.com`)"));
    REQUIRE(re->first_capture("Host(`a.example.com`) || Host(`b.example.com`)") ==
            "a.example.com");
    REQUIRE_FALSE(re->first_capture("PathPrefix(`/`)").has_value());

    auto groups = re->extract_groups("x Host(`c.example.com`)");
    REQUIRE(groups.size() == 2);
    REQUIRE(groups[1] == "c.example.com");

    std::string error;
    REQUIRE_FALSE(Regex::compile("Host(`", error).has_value());
    REQUIRE_FALSE(error.empty());
}

TEST_CASE("HTTP client refuses requests it cannot make", "[core][http_client]") {
    HttplibClient client;
    HttpRequestOptions options;

    SECTION("Expired context") {
        FetchContext ctx(std::chrono::milliseconds(0));
        auto response = client.get("http://127.0.0.1:1/api/version", options, ctx);
        REQUIRE(response.error.is(Errc::cancelled));
        REQUIRE_FALSE(response.ok());
    }

    SECTION("Unsupported scheme") {
        FetchContext ctx(std::chrono::seconds(1));
        auto response = client.get("ftp://example.com/file", options, ctx);
        REQUIRE(response.error.is(Errc::transport_failed));
    }
}
