// Waypoint Config Merger Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/merge/config_merger.hpp"
#include "../../src/store/certificate_authority.hpp"
#include "../../src/upstream/fetch_coordinator.hpp"
#include "fakes.hpp"

using namespace waypoint;
using namespace waypoint::merge;
using namespace std::chrono_literals;
using model::Document;

namespace {

model::RoutingSnapshot upstream_snapshot() {
    model::RoutingSnapshot snapshot;
    snapshot.http.routers.push_back(model::router_from_document("app-router", Document::parse(R"({
        "rule": "Host(`app.example.com`)",
        "service": "app-service",
        "entryPoints": ["websecure"],
        "middlewares": ["badger"],
        "tls": {"certResolver": "letsencrypt"}
    })")));
    snapshot.http.routers.push_back(model::router_from_document("ops-router", Document::parse(R"({
        "rule": "Host(`ops.example.com`)",
        "service": "ops-service",
        "entryPoints": ["websecure"]
    })")));
    snapshot.http.services.push_back(model::service_from_document(
        "app-service", Document::parse(R"({"loadBalancer": {"servers": [{"url": "http://10.0.0.2"}]}})")));
    snapshot.http.middlewares.push_back(model::middleware_from_document(
        "badger", Document::parse(R"({"plugin": {"badger": {"disableForwardAuth": true}}})")));
    return snapshot;
}

struct MergerFixture {
    std::shared_ptr<testing::FakeFetcher> fetcher = std::make_shared<testing::FakeFetcher>();
    upstream::FetchCoordinator coordinator{fetcher, 0ms};
    store::SqliteStore store{":memory:"};
    store::StoredCertificateAuthority authority{store};
    ConfigMerger merger{coordinator, store, authority, control::MergeConfig{60000, 100}};

    MergerFixture() {
        fetcher->set_snapshot(upstream_snapshot());
        store.exec(
            "INSERT INTO resources (id, pangolin_router_id, host, service_id) VALUES "
            "('r-app', 'app-router', 'app.example.com', 'app-service'), "
            "('r-ops', 'ops-router', 'ops.example.com', 'ops-service')");
    }

    std::shared_ptr<const Document> merged() {
        auto result = merger.get_merged_config(core::FetchContext(5s));
        REQUIRE(result.ok());
        return result.document;
    }
};

std::vector<std::string> chain_of(const Document& router) {
    std::vector<std::string> chain;
    for (const auto& entry : router["middlewares"]) {
        chain.push_back(entry.get<std::string>());
    }
    return chain;
}

}  // namespace

TEST_CASE("Merged document is cached", "[merge][cache]") {
    MergerFixture f;

    auto first = f.merged();
    auto second = f.merged();
    REQUIRE(first == second);
    REQUIRE(f.fetcher->calls() == 1);
    REQUIRE(f.merger.status().build_count == 1);
    REQUIRE(f.merger.status().cache_fresh);

    SECTION("Invalidation triggers exactly one new fetch") {
        f.merger.invalidate_cache();
        auto third = f.merged();
        auto fourth = f.merged();
        REQUIRE(f.fetcher->calls() == 2);
        REQUIRE(third == fourth);
        REQUIRE(third->dump() == first->dump());
    }
}

TEST_CASE("Upstream document without overrides", "[merge][document]") {
    MergerFixture f;
    auto doc = f.merged();

    const auto& routers = (*doc)["http"]["routers"];
    REQUIRE(routers.contains("app-router"));
    REQUIRE(chain_of(routers["app-router"]) == std::vector<std::string>{"badger"});
    REQUIRE_FALSE(routers["app-router"].contains("priority"));
    REQUIRE((*doc)["http"]["services"].contains("app-service"));
    REQUIRE((*doc)["http"]["middlewares"].contains("badger"));
    REQUIRE_FALSE(doc->contains("tcp"));
    REQUIRE_FALSE(doc->contains("tls"));
}

TEST_CASE("mTLS and TLS hardening", "[merge][security]") {
    MergerFixture f;
    f.store.exec(R"sql(
        UPDATE mtls_config SET enabled = 1, ca_cert_path = '/certs/ca.crt' WHERE id = 1;
        UPDATE security_config SET tls_hardening_enabled = 1 WHERE id = 1;
        UPDATE resources SET mtls_enabled = 1, tls_hardening_enabled = 1 WHERE id = 'r-app';
        UPDATE resources SET tls_hardening_enabled = 1 WHERE id = 'r-ops';
    )sql");

    auto doc = f.merged();
    const auto& routers = (*doc)["http"]["routers"];
    const auto& options = (*doc)["tls"]["options"];

    REQUIRE(options.contains("mtls-verify"));
    REQUIRE(options.contains("tls-hardened"));
    REQUIRE(options["mtls-verify"]["clientAuth"]["caFiles"][0] == "/certs/ca.crt");

    SECTION("mTLS resource never gets the hardened option") {
        const auto& app = routers["app-router"];
        REQUIRE(app["tls"]["options"] == "mtls-verify");
        REQUIRE(app["tls"]["certResolver"] == "letsencrypt");
        REQUIRE(chain_of(app) == std::vector<std::string>{"mtls-auth", "badger"});
        REQUIRE((*doc)["http"]["middlewares"].contains("mtls-auth"));
    }

    SECTION("Hardened resource") {
        const auto& ops = routers["ops-router"];
        REQUIRE(ops["tls"]["options"] == "tls-hardened");
        REQUIRE_FALSE(ops.contains("middlewares"));
    }

    SECTION("Per-resource mTLS overrides get their own middleware") {
        f.store.exec("UPDATE resources SET mtls_reject_code = 401 WHERE id = 'r-app'");
        f.merger.invalidate_cache();

        auto rebuilt = f.merged();
        const auto& app = (*rebuilt)["http"]["routers"]["app-router"];
        REQUIRE(chain_of(app).front() == "r-app-mtls-auth");
        const auto& middleware = (*rebuilt)["http"]["middlewares"]["r-app-mtls-auth"];
        REQUIRE(middleware["plugin"]["mtlswhitelist"]["rejectCode"] == 401);
    }
}

TEST_CASE("mTLS without a CA is not applied", "[merge][security]") {
    MergerFixture f;
    f.store.exec(R"sql(
        UPDATE mtls_config SET enabled = 1 WHERE id = 1;
        UPDATE resources SET mtls_enabled = 1 WHERE id = 'r-app';
    )sql");

    auto doc = f.merged();
    REQUIRE_FALSE(doc->contains("tls"));
    REQUIRE(chain_of((*doc)["http"]["routers"]["app-router"]) ==
            std::vector<std::string>{"badger"});
}

TEST_CASE("Resource overrides", "[merge][overrides]") {
    MergerFixture f;
    f.store.exec(R"sql(
        UPDATE security_config SET secure_headers_enabled = 1 WHERE id = 1;
        INSERT INTO middlewares (id, name, type, config) VALUES
            ('rate-limit', 'Rate Limit', 'rateLimit', '{"average": 100, "burst": 50}'),
            ('auth', 'Auth', 'basicAuth', '{"users": ["admin:$apr1$x"]}');
        INSERT INTO services (id, name, type, config) VALUES
            ('backend', 'Backend', 'loadBalancer', '{"servers": [{"url": "http://10.0.0.9"}]}'),
            ('postgres', 'Postgres', 'loadBalancer', '{"servers": [{"address": "10.0.0.5:5432"}]}');
        UPDATE resources SET custom_headers = '{"X-Tenant": "blue"}', router_priority = 300,
                             secure_headers_enabled = 1 WHERE id = 'r-app';
        INSERT INTO resource_middlewares (resource_id, middleware_id, priority) VALUES
            ('r-app', 'rate-limit', 50), ('r-app', 'auth', 200);
        INSERT INTO resource_services (resource_id, service_id) VALUES ('r-app', 'backend');
    )sql");

    auto doc = f.merged();
    const auto& http = (*doc)["http"];
    const auto& app = http["routers"]["app-router"];

    SECTION("Middleware chain order") {
        REQUIRE(chain_of(app) ==
                std::vector<std::string>{"waypoint-secure-headers", "r-app-customheaders", "auth",
                                         "rate-limit", "badger"});
        REQUIRE(http["middlewares"]["r-app-customheaders"]["headers"]["customRequestHeaders"]
                    ["X-Tenant"] == "blue");
        REQUIRE(http["middlewares"]["rate-limit"]["rateLimit"]["average"] == 100);
        REQUIRE(http["middlewares"]["waypoint-secure-headers"]["headers"]
                    ["customResponseHeaders"]["X-Frame-Options"] == "SAMEORIGIN");
    }

    SECTION("Priority and custom service") {
        REQUIRE(app["priority"] == 300);
        REQUIRE(app["service"] == "backend");
        REQUIRE(http["services"]["backend"]["loadBalancer"]["servers"][0]["url"] ==
                "http://10.0.0.9");
    }

    SECTION("Stored TCP service lands in the tcp plane") {
        REQUIRE((*doc)["tcp"]["services"].contains("postgres"));
        REQUIRE_FALSE(http["services"].contains("postgres"));
    }

    SECTION("Resource without overrides is untouched") {
        const auto& ops = http["routers"]["ops-router"];
        REQUIRE_FALSE(ops.contains("middlewares"));
        REQUIRE(ops["service"] == "ops-service");
    }
}

TEST_CASE("Disabled resources are not applied", "[merge][overrides]") {
    MergerFixture f;
    f.store.exec(
        "UPDATE resources SET custom_headers = '{\"X-A\": \"1\"}', status = 'disabled' "
        "WHERE id = 'r-app'");

    auto doc = f.merged();
    REQUIRE_FALSE((*doc)["http"]["middlewares"].contains("r-app-customheaders"));
}

TEST_CASE("Upstream failures", "[merge][fallback]") {
    MergerFixture f;

    SECTION("Stale document is served after a failed refresh") {
        auto good = f.merged();

        f.fetcher->set_error(core::Errc::transport_failed, "connection refused");
        f.merger.invalidate_cache();

        auto result = f.merger.get_merged_config(core::FetchContext(5s));
        REQUIRE(result.ok());
        REQUIRE(result.stale);
        REQUIRE(result.document == good);
        REQUIRE(f.merger.status().last_error == "connection refused");
    }

    SECTION("No previous document") {
        f.fetcher->set_error(core::Errc::transport_failed, "connection refused");

        auto result = f.merger.get_merged_config(core::FetchContext(5s));
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error.is(core::Errc::transport_failed));
        REQUIRE_FALSE(f.merger.status().has_cache);
    }
}
