// Waypoint Unit Tests - Shared test doubles

#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../../src/core/http_client.hpp"
#include "../../src/upstream/fetcher.hpp"

namespace waypoint::testing {

/// HttpClient answering from a URL -> response table; unknown URLs fail to connect
class FakeHttpClient final : public core::HttpClient {
public:
    void respond(const std::string& url, int status, std::string body) {
        std::lock_guard lock(mutex_);
        core::HttpResponse response;
        response.status = status;
        response.body = std::move(body);
        responses_[url] = std::move(response);
    }

    void fail(const std::string& url, core::Errc code, std::string message) {
        std::lock_guard lock(mutex_);
        core::HttpResponse response;
        response.error = core::Error(code, std::move(message));
        responses_[url] = std::move(response);
    }

    core::HttpResponse get(const std::string& url, const core::HttpRequestOptions& options,
                           const core::FetchContext& /*ctx*/) override {
        std::lock_guard lock(mutex_);
        calls_.push_back(url);
        last_options_ = options;
        if (auto it = responses_.find(url); it != responses_.end()) {
            return it->second;
        }
        core::HttpResponse refused;
        refused.error = core::Error(core::Errc::transport_failed, "connection refused: " + url);
        return refused;
    }

    [[nodiscard]] std::vector<std::string> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    /// Requests whose URL starts with `prefix`
    [[nodiscard]] size_t count_prefix(const std::string& prefix) const {
        std::lock_guard lock(mutex_);
        size_t n = 0;
        for (const auto& url : calls_) {
            if (url.starts_with(prefix)) {
                ++n;
            }
        }
        return n;
    }

    [[nodiscard]] core::HttpRequestOptions last_options() const {
        std::lock_guard lock(mutex_);
        return last_options_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, core::HttpResponse> responses_;
    std::vector<std::string> calls_;
    core::HttpRequestOptions last_options_;
};

/// Fetcher returning a scripted snapshot (or error) and counting round trips
class FakeFetcher final : public upstream::UpstreamFetcher {
public:
    explicit FakeFetcher(std::string_view source = model::kSourcePangolin) : source_(source) {}

    void set_snapshot(model::RoutingSnapshot snapshot) {
        std::lock_guard lock(mutex_);
        snapshot.source_type = source_;
        snapshot_ = std::make_shared<const model::RoutingSnapshot>(std::move(snapshot));
        error_ = {};
    }

    void set_error(core::Errc code, std::string message) {
        std::lock_guard lock(mutex_);
        error_ = core::Error(code, std::move(message));
    }

    void set_resources(std::vector<model::DiscoveredResource> resources) {
        std::lock_guard lock(mutex_);
        resources_ = std::move(resources);
    }

    void set_delay(std::chrono::milliseconds delay) { delay_ms_.store(delay.count()); }

    upstream::FetchResult fetch(const core::FetchContext& /*ctx*/) override {
        calls_.fetch_add(1);
        if (auto delay = delay_ms_.load(); delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        std::lock_guard lock(mutex_);
        if (error_) {
            return upstream::FetchResult::failure(error_);
        }
        if (!snapshot_) {
            return upstream::FetchResult::success(
                std::make_shared<const model::RoutingSnapshot>());
        }
        return upstream::FetchResult::success(snapshot_);
    }

    std::vector<model::DiscoveredResource> surface_resources(
        const model::RoutingSnapshot& /*snapshot*/) const override {
        std::lock_guard lock(mutex_);
        return resources_;
    }

    std::string_view source_type() const noexcept override { return source_; }

    std::string base_url() const override { return "http://fake-upstream"; }

    [[nodiscard]] int calls() const { return calls_.load(); }

private:
    std::string source_;
    mutable std::mutex mutex_;
    std::shared_ptr<const model::RoutingSnapshot> snapshot_;
    core::Error error_;
    std::vector<model::DiscoveredResource> resources_;
    std::atomic<long long> delay_ms_{0};
    std::atomic<int> calls_{0};
};

/// Discovered route with the fields the reconciler reads
inline model::DiscoveredResource discovered(std::string id, std::string host,
                                            std::string service, int priority = 100) {
    model::DiscoveredResource resource;
    resource.id = std::move(id);
    resource.host = std::move(host);
    resource.service_id = std::move(service);
    resource.entrypoints = "websecure";
    resource.router_priority = priority;
    resource.source_type = model::kSourcePangolin;
    return resource;
}

}  // namespace waypoint::testing
