// Waypoint Array-or-Map Decoder Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/upstream/array_or_map.hpp"

using namespace waypoint;
using namespace waypoint::upstream;

TEST_CASE("Array form keeps item order", "[upstream][array_or_map]") {
    auto decoded = parse_array_or_map(
        R"([{"name":"b@docker","rule":"Host(`b`)"},{"name":"a@file","rule":"Host(`a`)"}])");

    REQUIRE_FALSE(decoded.error);
    REQUIRE(decoded.items.size() == 2);
    REQUIRE(decoded.items[0].name == "b@docker");
    REQUIRE(decoded.items[1].name == "a@file");
    REQUIRE(model::string_field(decoded.items[1].value, "rule") == "Host(`a`)");
}

TEST_CASE("Map form writes the key into each item", "[upstream][array_or_map]") {
    auto decoded = parse_array_or_map(R"({"whoami@docker":{"service":"whoami"}})");

    REQUIRE_FALSE(decoded.error);
    REQUIRE(decoded.items.size() == 1);
    REQUIRE(decoded.items[0].name == "whoami@docker");
    REQUIRE(model::string_field(decoded.items[0].value, "name") == "whoami@docker");
    REQUIRE(model::string_field(decoded.items[0].value, "service") == "whoami");
}

TEST_CASE("Empty and null collections", "[upstream][array_or_map]") {
    SECTION("null") {
        auto decoded = parse_array_or_map("null");
        REQUIRE_FALSE(decoded.error);
        REQUIRE(decoded.items.empty());
    }

    SECTION("empty array") {
        auto decoded = parse_array_or_map("[]");
        REQUIRE_FALSE(decoded.error);
        REQUIRE(decoded.items.empty());
    }

    SECTION("empty object") {
        auto decoded = parse_array_or_map("{}");
        REQUIRE_FALSE(decoded.error);
        REQUIRE(decoded.items.empty());
    }
}

TEST_CASE("Unusable collections are rejected", "[upstream][array_or_map]") {
    SECTION("Array of scalars") {
        auto decoded = parse_array_or_map(R"(["a", "b"])");
        REQUIRE(decoded.error.is(core::Errc::decode_failed));
    }

    SECTION("Map with scalar values") {
        auto decoded = parse_array_or_map(R"({"a": 1})");
        REQUIRE(decoded.error.is(core::Errc::decode_failed));
    }

    SECTION("Invalid JSON") {
        auto decoded = parse_array_or_map("{not json");
        REQUIRE(decoded.error.is(core::Errc::decode_failed));
    }

    SECTION("Bare string") {
        auto decoded = parse_array_or_map(R"("routers")");
        REQUIRE(decoded.error);
    }
}
