// Waypoint Fetch Coordinator Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <thread>

#include "../../src/upstream/fetch_coordinator.hpp"
#include "fakes.hpp"

using namespace waypoint;
using namespace waypoint::upstream;
using namespace std::chrono_literals;

namespace {

model::RoutingSnapshot snapshot_with_router(const std::string& name) {
    model::RoutingSnapshot snapshot;
    model::Router router;
    router.name = name;
    router.rule = "Host(`" + name + ".example.com`)";
    router.service = name + "-service";
    snapshot.http.routers.push_back(router);
    return snapshot;
}

}  // namespace

TEST_CASE("Concurrent callers share one fetch", "[upstream][coordinator]") {
    auto fetcher = std::make_shared<testing::FakeFetcher>();
    fetcher->set_snapshot(snapshot_with_router("app"));
    fetcher->set_delay(200ms);
    FetchCoordinator coordinator(fetcher, 0ms);

    FetchResult first;
    FetchResult second;
    std::thread a([&] { first = coordinator.fetch(core::FetchContext(5s)); });
    std::this_thread::sleep_for(50ms);
    std::thread b([&] { second = coordinator.fetch(core::FetchContext(5s)); });
    a.join();
    b.join();

    REQUIRE(fetcher->calls() == 1);
    REQUIRE(first.ok());
    REQUIRE(second.ok());
    REQUIRE(first.snapshot == second.snapshot);
}

TEST_CASE("Minimum interval throttling", "[upstream][coordinator]") {
    auto fetcher = std::make_shared<testing::FakeFetcher>();
    core::FetchContext ctx(5s);

    SECTION("Recent success is served from cache") {
        fetcher->set_snapshot(snapshot_with_router("app"));
        FetchCoordinator coordinator(fetcher, 10s);

        auto first = coordinator.fetch(ctx);
        auto second = coordinator.fetch(ctx);
        REQUIRE(first.ok());
        REQUIRE(second.ok());
        REQUIRE(second.snapshot == first.snapshot);
        REQUIRE(fetcher->calls() == 1);

        coordinator.invalidate();
        auto third = coordinator.fetch(ctx);
        REQUIRE(third.ok());
        REQUIRE(fetcher->calls() == 2);
    }

    SECTION("Nothing cached yet") {
        fetcher->set_error(core::Errc::transport_failed, "connection refused");
        FetchCoordinator coordinator(fetcher, 10s);

        auto first = coordinator.fetch(ctx);
        REQUIRE(first.error.is(core::Errc::transport_failed));

        auto second = coordinator.fetch(ctx);
        REQUIRE(second.error.is(core::Errc::throttled));
        REQUIRE(fetcher->calls() == 1);
    }
}

TEST_CASE("Last good snapshot survives failures", "[upstream][coordinator]") {
    auto fetcher = std::make_shared<testing::FakeFetcher>();
    fetcher->set_snapshot(snapshot_with_router("app"));
    FetchCoordinator coordinator(fetcher, 0ms);
    core::FetchContext ctx(5s);

    auto good = coordinator.fetch(ctx);
    REQUIRE(good.ok());

    fetcher->set_error(core::Errc::unexpected_status, "unexpected status code: 503");
    auto bad = coordinator.fetch(ctx);
    REQUIRE_FALSE(bad.ok());
    REQUIRE(coordinator.cached() == good.snapshot);

    auto status = coordinator.status();
    REQUIRE(status.has_snapshot);
    REQUIRE(status.fetch_count == 2);
    REQUIRE(status.last_error == "unexpected status code: 503");
    REQUIRE(status.last_success_unix_ms != 0);
    REQUIRE(status.source_type == std::string(model::kSourcePangolin));
}

TEST_CASE("Snapshot projections", "[upstream][coordinator]") {
    auto fetcher = std::make_shared<testing::FakeFetcher>();
    fetcher->set_snapshot(snapshot_with_router("app"));
    fetcher->set_resources({testing::discovered("app", "app.example.com", "app-service")});
    FetchCoordinator coordinator(fetcher, 10s);
    core::FetchContext ctx(5s);

    auto routers = coordinator.routers(ctx, model::Protocol::Http);
    REQUIRE(routers.ok());
    REQUIRE(routers.items.size() == 1);
    REQUIRE(routers.items[0].name == "app");

    auto tcp = coordinator.routers(ctx, model::Protocol::Tcp);
    REQUIRE(tcp.ok());
    REQUIRE(tcp.items.empty());

    auto resources = coordinator.resources(ctx);
    REQUIRE(resources.ok());
    REQUIRE(resources.items.size() == 1);
    REQUIRE(resources.items[0].host == "app.example.com");

    // Every projection above shared the first fetch
    REQUIRE(fetcher->calls() == 1);
}

TEST_CASE("Replacing the fetcher drops cached state", "[upstream][coordinator]") {
    auto original = std::make_shared<testing::FakeFetcher>();
    original->set_snapshot(snapshot_with_router("old"));
    FetchCoordinator coordinator(original, 10s);
    core::FetchContext ctx(5s);

    REQUIRE(coordinator.fetch(ctx).ok());
    REQUIRE(coordinator.cached() != nullptr);

    auto replacement = std::make_shared<testing::FakeFetcher>(model::kSourceTraefik);
    replacement->set_snapshot(snapshot_with_router("new"));
    coordinator.replace_fetcher(replacement);
    REQUIRE(coordinator.cached() == nullptr);

    auto result = coordinator.fetch(ctx);
    REQUIRE(result.ok());
    REQUIRE(result.snapshot->http.routers[0].name == "new");
    REQUIRE(replacement->calls() == 1);
    REQUIRE(coordinator.status().source_type == std::string(model::kSourceTraefik));
}

TEST_CASE("Missing fetcher reports a configuration error", "[upstream][coordinator]") {
    FetchCoordinator coordinator(nullptr, 0ms);
    auto result = coordinator.fetch(core::FetchContext(1s));
    REQUIRE(result.error.is(core::Errc::invalid_config));
}
