/*
 * Copyright 2025 Waypoint Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */


// Waypoint Config Merger - Implementation

#include "config_merger.hpp"

#include <algorithm>
#include <vector>

#include "../core/logging.hpp"
#include "../upstream/rule_parser.hpp"
#include "canonicalize.hpp"
#include "middleware_builder.hpp"

namespace waypoint::merge {

namespace {

uint64_t unix_ms_now() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::system_clock::now().time_since_epoch())
                                     .count());
}

model::Document& ensure_object(model::Document& parent, const std::string& key) {
    auto& child = parent[key];
    if (!child.is_object()) {
        child = model::Document::object();
    }
    return child;
}

/// Key of the first router (in key order) whose rule resolves to `host`
std::string find_router(const model::Document& routers, const std::string& host) {
    for (const auto& [key, router] : routers.items()) {
        auto rule = model::string_field(router, "rule");
        if (!rule.empty() && upstream::extract_host(rule) == host) {
            return key;
        }
    }
    return {};
}

}  // namespace

ConfigMerger::ConfigMerger(upstream::FetchCoordinator& coordinator, store::SqliteStore& store,
                           store::CertificateAuthority& authority, control::MergeConfig config)
    : coordinator_(coordinator), store_(store), authority_(authority), config_(config) {}

std::shared_ptr<const model::Document> ConfigMerger::fresh_cache() const {
    std::shared_lock lock(cache_mutex_);
    if (cache_ && clock::now() < expiry_) {
        return cache_;
    }
    return nullptr;
}

MergeResult ConfigMerger::get_merged_config(const core::FetchContext& ctx) {
    auto* logger = logging::get_current_logger();

    if (auto cached = fresh_cache()) {
        return MergeResult{std::move(cached), {}, false};
    }

    std::lock_guard build_lock(build_mutex_);

    // Another caller may have rebuilt while this one waited
    if (auto cached = fresh_cache()) {
        return MergeResult{std::move(cached), {}, false};
    }

    auto fetched = coordinator_.fetch(ctx);
    if (!fetched.ok()) {
        record_error(fetched.error.message);

        std::shared_lock lock(cache_mutex_);
        if (cache_) {
            LOG_WARNING(logger, "Upstream fetch failed, using stale cache: {}",
                        fetched.error.message);
            return MergeResult{cache_, {}, true};
        }
        LOG_ERROR_CTX(logger, "Failed to build merged configuration", "config_merger",
                      fetched.error.code.message(), fetched.error.message);
        return MergeResult{nullptr, std::move(fetched.error), false};
    }

    model::Document doc;
    try {
        doc = build(*fetched.snapshot);
    } catch (const store::StoreError& e) {
        record_error(e.what());
        LOG_ERROR_CTX(logger, "Failed to merge stored overrides", "config_merger",
                      "storage_failed", e.what());
        return MergeResult{nullptr, core::Error(core::Errc::storage_failed, e.what()), false};
    }

    auto built = std::make_shared<const model::Document>(std::move(doc));
    build_count_.fetch_add(1, std::memory_order_relaxed);
    {
        std::unique_lock lock(cache_mutex_);
        cache_ = built;
        expiry_ = clock::now() + std::chrono::milliseconds(config_.cache_ttl_ms);
        last_build_unix_ms_ = unix_ms_now();
        last_error_.clear();
    }
    return MergeResult{std::move(built), {}, false};
}

void ConfigMerger::invalidate_cache() {
    {
        std::unique_lock lock(cache_mutex_);
        expiry_ = clock::time_point{};
    }
    coordinator_.invalidate();
}

void ConfigMerger::update_config(const control::MergeConfig& config) {
    std::unique_lock lock(cache_mutex_);
    config_ = config;
}

void ConfigMerger::record_error(const std::string& message) {
    std::unique_lock lock(cache_mutex_);
    last_error_ = message;
}

MergeStatus ConfigMerger::status() const {
    MergeStatus out;
    out.build_count = build_count_.load(std::memory_order_relaxed);

    std::shared_lock lock(cache_mutex_);
    out.has_cache = cache_ != nullptr;
    out.cache_fresh = cache_ && clock::now() < expiry_;
    out.last_build_unix_ms = last_build_unix_ms_;
    out.last_error = last_error_;
    return out;
}

model::Document ConfigMerger::build(const model::RoutingSnapshot& snapshot) {
    auto* logger = logging::get_current_logger();

    int default_priority = 0;
    {
        std::shared_lock lock(cache_mutex_);
        default_priority = config_.default_router_priority;
    }

    model::Document doc = snapshot.to_document();

    // Objects are vector-backed: create every section before holding references into them
    for (auto plane : {model::Protocol::Http, model::Protocol::Tcp, model::Protocol::Udp}) {
        auto& section = ensure_object(doc, std::string(model::protocol_name(plane)));
        ensure_object(section, "routers");
        ensure_object(section, "services");
        if (plane != model::Protocol::Udp) {
            ensure_object(section, "middlewares");
        }
    }
    ensure_object(ensure_object(doc, "tls"), "options");

    // Stored middleware and service definitions
    for (const auto& record : store_.load_middlewares()) {
        doc["http"]["middlewares"][record.id] = wrap_override(record);
    }
    for (const auto& record : store_.load_services()) {
        auto plane = std::string(model::protocol_name(service_plane(record.type, record.config)));
        doc[plane]["services"][record.id] = wrap_override(record);
    }

    auto& http_middlewares = doc["http"]["middlewares"];
    auto& http_routers = doc["http"]["routers"];
    auto& tls_options = doc["tls"]["options"];

    // Global security features
    auto certificate = authority_.get_config();
    auto mtls = store_.load_mtls_settings();
    auto security = store_.load_security_settings();

    std::string ca_path = certificate.ca_cert_path.empty() ? mtls.ca_cert_path
                                                           : certificate.ca_cert_path;
    bool mtls_active = certificate.enabled && certificate.has_ca;
    if (mtls_active && ca_path.empty()) {
        LOG_WARNING(logger, "mTLS enabled but no CA certificate path configured");
        mtls_active = false;
    }

    if (mtls_active) {
        tls_options[std::string(model::kMtlsVerifyOption)] = model::mtls_verify_options(ca_path);
        http_middlewares[std::string(model::kMtlsMiddleware)] = mtls_middleware(mtls, ca_path);
    }
    if (security.tls_hardening_enabled) {
        tls_options[std::string(model::kTlsHardenedOption)] = model::tls_hardening_options();
    }
    bool secure_headers_active =
        security.secure_headers_enabled && security.headers.any_set();
    if (secure_headers_active) {
        http_middlewares[std::string(model::kSecureHeadersMiddleware)] =
            model::secure_headers_middleware(security.headers);
    }

    // Per-resource router overrides
    size_t applied = 0;
    for (auto& resource : store_.load_active_resources()) {
        auto key = find_router(http_routers, resource.host);
        if (key.empty()) {
            LOG_DEBUG(logger, "No matching router found for resource {} (host: {})",
                      resource.id, resource.host);
            continue;
        }
        auto& router = http_routers[key];

        std::vector<std::string> injected;

        bool resource_mtls = mtls_active && resource.mtls.enabled;
        if (resource_mtls) {
            auto name = mtls_middleware_name(resource);
            if (resource.mtls.has_overrides()) {
                http_middlewares[name] = mtls_middleware(mtls, ca_path, &resource.mtls);
            }
            injected.push_back(std::move(name));
            set_tls_option(router, model::kMtlsVerifyOption);
        } else if (security.tls_hardening_enabled && resource.tls_hardening_enabled) {
            set_tls_option(router, model::kTlsHardenedOption);
        }

        if (secure_headers_active && resource.secure_headers_enabled) {
            injected.emplace_back(model::kSecureHeadersMiddleware);
        }

        if (auto headers = custom_headers_middleware(resource.custom_headers)) {
            auto name = custom_headers_middleware_name(resource.id);
            http_middlewares[name] = std::move(*headers);
            injected.push_back(std::move(name));
        }

        std::stable_sort(resource.middlewares.begin(), resource.middlewares.end(),
                         [](const auto& a, const auto& b) { return a.priority > b.priority; });
        for (const auto& assignment : resource.middlewares) {
            injected.push_back(assignment.middleware_id);
        }

        auto chain = merge_chain(std::move(injected), router_middlewares(router));
        if (!chain.empty()) {
            router["middlewares"] = chain;
        }

        if (resource.router_priority != default_priority) {
            router["priority"] = resource.router_priority;
        }

        if (!resource.custom_service_id.empty()) {
            router["service"] = resource.custom_service_id;
        }

        ++applied;
    }

    canonicalize(doc);

    LOG_DEBUG(logger, "Merged configuration: overrides applied to {} routers", applied);
    return doc;
}

}  // namespace waypoint::merge
