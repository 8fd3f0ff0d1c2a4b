// Waypoint Resource Reconciler Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/reconcile/resource_reconciler.hpp"
#include "../../src/upstream/fetch_coordinator.hpp"
#include "fakes.hpp"

using namespace waypoint;
using namespace waypoint::reconcile;
using namespace std::chrono_literals;

namespace {

struct ReconcilerFixture {
    std::shared_ptr<testing::FakeFetcher> fetcher = std::make_shared<testing::FakeFetcher>();
    upstream::FetchCoordinator coordinator{fetcher, 0ms};
    store::SqliteStore store{":memory:"};
    ResourceReconciler reconciler{coordinator, store};

    ReconcileOutcome run() { return reconciler.reconcile(core::FetchContext(5s)); }

    std::string internal_id_for(const std::string& host) {
        auto tx = store.begin();
        auto row = store.find_active_by_host(*tx, host);
        return row ? row->id : std::string();
    }
};

}  // namespace

TEST_CASE("Resources are created once and then updated", "[reconcile][resources]") {
    ReconcilerFixture f;
    f.fetcher->set_resources({
        testing::discovered("3-router", "app.example.com", "3-service"),
        testing::discovered("4-router", "ops.example.com", "4-service"),
    });

    auto first = f.run();
    REQUIRE(first.ok());
    REQUIRE(first.summary.observed == 2);
    REQUIRE(first.summary.created == 2);
    REQUIRE(f.store.active_resource_ids().size() == 2);

    auto app_id = f.internal_id_for("app.example.com");
    REQUIRE_FALSE(app_id.empty());
    REQUIRE(app_id != "3-router");

    auto second = f.run();
    REQUIRE(second.ok());
    REQUIRE(second.summary.created == 0);
    REQUIRE(second.summary.updated == 2);
    REQUIRE(second.summary.disabled == 0);
    REQUIRE(f.internal_id_for("app.example.com") == app_id);
}

TEST_CASE("Router renames keep the internal id", "[reconcile][resources]") {
    ReconcilerFixture f;
    f.fetcher->set_resources({testing::discovered("3-router", "app.example.com", "3-service")});
    REQUIRE(f.run().ok());
    auto internal_id = f.internal_id_for("app.example.com");

    f.fetcher->set_resources({testing::discovered("7-router", "app.example.com", "7-service")});
    auto outcome = f.run();
    REQUIRE(outcome.ok());
    REQUIRE(outcome.summary.created == 0);
    REQUIRE(outcome.summary.updated == 1);
    REQUIRE(outcome.summary.disabled == 0);

    auto row = f.store.resource(internal_id);
    REQUIRE(row.has_value());
    REQUIRE(row->upstream_id == "7-router");
    REQUIRE(row->service_id == "7-service");
    REQUIRE(row->status == store::kStatusActive);
}

TEST_CASE("Router priority updates", "[reconcile][resources]") {
    ReconcilerFixture f;
    f.fetcher->set_resources({testing::discovered("3-router", "app.example.com", "3-service")});
    REQUIRE(f.run().ok());
    auto internal_id = f.internal_id_for("app.example.com");

    SECTION("Upstream priority is taken") {
        f.fetcher->set_resources(
            {testing::discovered("3-router", "app.example.com", "3-service", 200)});
        REQUIRE(f.run().ok());
        REQUIRE(f.store.resource(internal_id)->router_priority == 200);
    }

    SECTION("Manually pinned priority is preserved") {
        f.store.exec("UPDATE resources SET router_priority = 500, router_priority_manual = 1");
        f.fetcher->set_resources(
            {testing::discovered("3-router", "app.example.com", "3-service", 200)});
        REQUIRE(f.run().ok());

        auto row = f.store.resource(internal_id);
        REQUIRE(row->router_priority == 500);
        REQUIRE(row->router_priority_manual);
    }
}

TEST_CASE("Vanished routes are disabled", "[reconcile][resources]") {
    ReconcilerFixture f;
    f.fetcher->set_resources({
        testing::discovered("3-router", "app.example.com", "3-service"),
        testing::discovered("4-router", "ops.example.com", "4-service"),
    });
    REQUIRE(f.run().ok());

    SECTION("One route removed") {
        auto ops_id = f.internal_id_for("ops.example.com");
        f.fetcher->set_resources({testing::discovered("3-router", "app.example.com", "3-service")});

        auto outcome = f.run();
        REQUIRE(outcome.summary.disabled == 1);
        REQUIRE(f.store.resource(ops_id)->status == store::kStatusDisabled);
    }

    SECTION("Upstream reports no routes at all") {
        f.fetcher->set_resources({});

        auto outcome = f.run();
        REQUIRE(outcome.ok());
        REQUIRE(outcome.summary.observed == 0);
        REQUIRE(outcome.summary.disabled == 2);
        REQUIRE(f.store.active_resource_ids().empty());
    }
}

TEST_CASE("Fetch failure leaves storage untouched", "[reconcile][resources]") {
    ReconcilerFixture f;
    f.fetcher->set_resources({testing::discovered("3-router", "app.example.com", "3-service")});
    REQUIRE(f.run().ok());

    f.fetcher->set_error(core::Errc::transport_failed, "connection refused");
    auto outcome = f.run();
    REQUIRE_FALSE(outcome.ok());
    REQUIRE(outcome.error.is(core::Errc::transport_failed));
    REQUIRE(outcome.summary.disabled == 0);
    REQUIRE(f.store.active_resource_ids().size() == 1);
}

TEST_CASE("Incomplete routes are skipped", "[reconcile][resources]") {
    ReconcilerFixture f;
    f.fetcher->set_resources({
        testing::discovered("no-service", "app.example.com", ""),
        testing::discovered("no-host", "", "svc"),
        testing::discovered("auth-auth-router-auth-auth@docker", "auth.example.com", "svc"),
    });

    auto outcome = f.run();
    REQUIRE(outcome.summary.skipped == 2);
    REQUIRE(outcome.summary.created == 1);

    auto tx = f.store.begin();
    auto row = f.store.find_active_by_host(*tx, "auth.example.com");
    REQUIRE(row.has_value());
    REQUIRE(row->upstream_id == "auth-auth-router-auth");
}

TEST_CASE("Legacy rows are adopted", "[reconcile][resources]") {
    ReconcilerFixture f;
    f.store.exec(
        "INSERT INTO resources (id, host, service_id, status) "
        "VALUES ('3-router', 'app.example.com', '3-service', 'disabled')");
    f.fetcher->set_resources({testing::discovered("3-router", "app.example.com", "3-service")});

    auto outcome = f.run();
    REQUIRE(outcome.summary.created == 0);
    REQUIRE(outcome.summary.updated == 1);

    auto row = f.store.resource("3-router");
    REQUIRE(row->status == store::kStatusActive);
    REQUIRE(row->upstream_id == "3-router");
}
