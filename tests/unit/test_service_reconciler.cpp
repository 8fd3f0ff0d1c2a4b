// Waypoint Service Reconciler Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/reconcile/id_normalizer.hpp"
#include "../../src/reconcile/service_reconciler.hpp"
#include "../../src/upstream/fetch_coordinator.hpp"
#include "fakes.hpp"

using namespace waypoint;
using namespace waypoint::reconcile;
using namespace std::chrono_literals;

namespace {

model::Service service(const std::string& name, const char* json) {
    return model::service_from_document(name, model::Document::parse(json));
}

model::RoutingSnapshot services_snapshot(const std::string& whoami_url) {
    model::RoutingSnapshot snapshot;
    snapshot.http.services.push_back(service(
        "whoami@docker",
        (R"({"provider": "docker", "loadBalancer": {"servers": [{"url": ")" + whoami_url +
         R"("}]}})")
            .c_str()));
    snapshot.http.services.push_back(
        service("whoami@file", R"({"provider": "file", "loadBalancer": {"servers": []}})"));
    snapshot.http.services.push_back(
        service("api@internal", R"({"provider": "internal", "loadBalancer": {}})"));
    snapshot.udp.services.push_back(service(
        "dns@file", R"({"provider": "file", "loadBalancer": {"servers": [{"address": "10.0.0.53:53"}]}})"));
    return snapshot;
}

struct ServiceFixture {
    std::shared_ptr<testing::FakeFetcher> fetcher = std::make_shared<testing::FakeFetcher>();
    upstream::FetchCoordinator coordinator{fetcher, 0ms};
    store::SqliteStore store{":memory:"};
    ServiceReconciler reconciler{coordinator, store};

    ReconcileOutcome run() { return reconciler.reconcile(core::FetchContext(5s)); }

    std::optional<store::StoredService> find(const std::string& id) {
        for (auto& stored : store.list_services()) {
            if (stored.id == id) {
                return stored;
            }
        }
        return std::nullopt;
    }
};

}  // namespace

TEST_CASE("Identifier normalization", "[reconcile][ids]") {
    REQUIRE(normalize_id("whoami@docker") == "whoami");
    REQUIRE(normalize_id("plain") == "plain");
    REQUIRE(normalize_id("badger-auth-auth@file") == "badger-auth");
    REQUIRE(normalize_id("badger-auth-auth-auth") == "badger-auth");
    REQUIRE(normalize_id("router-redirect-auth@file") == "router-redirect");
    REQUIRE(normalize_id("svc-auth") == "svc-auth");
}

TEST_CASE("Service display names", "[reconcile][ids]") {
    REQUIRE(format_service_name("my-service@docker") == "My Service");
    REQUIRE(format_service_name("api_gateway_service") == "Api Gateway Service");
    REQUIRE(format_service_name("whoami") == "Whoami");
    REQUIRE(format_service_name("trailing-") == "Trailing");
}

TEST_CASE("Stored service records", "[reconcile][services]") {
    SECTION("HTTP body is taken from under the type key") {
        auto record = service_record(
            service("web@docker", R"({"loadBalancer": {"servers": [{"url": "http://a"}]}})"),
            model::Protocol::Http, model::kSourceTraefik);
        REQUIRE(record.has_value());
        REQUIRE(record->id == "web");
        REQUIRE(record->name == "Web");
        REQUIRE(record->type == "loadBalancer");
        REQUIRE(record->config.contains("servers"));
        REQUIRE_FALSE(record->config.contains("protocol"));
        REQUIRE(record->source_type == std::string(model::kSourceTraefik));
    }

    SECTION("UDP services carry a protocol marker") {
        auto record = service_record(
            service("dns", R"({"loadBalancer": {"servers": [{"address": "1.1.1.1:53"}]}})"),
            model::Protocol::Udp, model::kSourcePangolin);
        REQUIRE(record.has_value());
        REQUIRE(record->config["protocol"] == "udp");
    }

    SECTION("Internal and untyped services are ignored") {
        REQUIRE_FALSE(service_record(service("api@internal",
                                             R"({"provider": "internal", "loadBalancer": {}})"),
                                     model::Protocol::Http, model::kSourceTraefik)
                          .has_value());
        REQUIRE_FALSE(service_record(service("odd", R"({"something": {}})"),
                                     model::Protocol::Http, model::kSourceTraefik)
                          .has_value());
    }
}

TEST_CASE("Service reconciliation cycle", "[reconcile][services]") {
    ServiceFixture f;
    f.fetcher->set_snapshot(services_snapshot("http://172.17.0.2"));

    auto first = f.run();
    REQUIRE(first.ok());
    REQUIRE(first.summary.observed == 4);
    REQUIRE(first.summary.created == 2);
    REQUIRE(first.summary.skipped == 1);
    REQUIRE(f.find("whoami").has_value());
    REQUIRE(f.find("dns")->config["protocol"] == "udp");

    SECTION("Unchanged services are left alone") {
        auto second = f.run();
        REQUIRE(second.summary.created == 0);
        REQUIRE(second.summary.updated == 0);
    }

    SECTION("Changed configuration is written") {
        f.fetcher->set_snapshot(services_snapshot("http://172.17.0.9"));
        auto second = f.run();
        REQUIRE(second.summary.updated == 1);
        REQUIRE(f.find("whoami")->config["servers"][0]["url"] == "http://172.17.0.9");
    }

    SECTION("Vanished upstream services are disabled, operator services are kept") {
        f.store.exec(
            "INSERT INTO services (id, name, type, config, source_type) VALUES "
            "('manual-svc', 'Manual', 'loadBalancer', '{}', 'manual'), "
            "('unowned-svc', 'Unowned', 'loadBalancer', '{}', '')");

        f.fetcher->set_snapshot(model::RoutingSnapshot{});
        auto second = f.run();
        REQUIRE(second.ok());
        REQUIRE(second.summary.disabled == 2);
        REQUIRE(f.find("whoami")->status == store::kStatusDisabled);
        REQUIRE(f.find("dns")->status == store::kStatusDisabled);
        REQUIRE(f.find("manual-svc")->status == store::kStatusActive);
        REQUIRE(f.find("unowned-svc")->status == store::kStatusActive);

        SECTION("A returning service is re-activated") {
            f.fetcher->set_snapshot(services_snapshot("http://172.17.0.2"));
            auto third = f.run();
            REQUIRE(third.summary.updated == 2);
            REQUIRE(f.find("whoami")->status == store::kStatusActive);
        }
    }

    SECTION("Fetch failure changes nothing") {
        f.fetcher->set_error(core::Errc::transport_failed, "connection refused");
        auto second = f.run();
        REQUIRE(second.error.is(core::Errc::transport_failed));
        REQUIRE(f.find("whoami")->status == store::kStatusActive);
    }
}
