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

// Waypoint Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace waypoint::control {

/// Upstream authority the routing configuration is derived from
struct UpstreamConfig {
    std::string type = "pangolin";  // pangolin (aggregator) or traefik (native API)
    std::string url = "http://pangolin:3001/api/v1";
    std::string username;  // Basic auth (optional)
    std::string password;
    bool skip_tls_verify = false;
    bool require_cert_resolver = false;  // Surface only routers with a certResolver
    uint32_t timeout_ms = 10000;
    uint64_t max_body_bytes = 10 * 1024 * 1024;  // 10 MiB
    std::vector<std::string> fallback_urls = {
        "http://host.docker.internal:8080",
        "http://localhost:8080",
        "http://127.0.0.1:8080",
        "http://traefik:8080",
    };
};

/// Fetch coordinator settings
struct CoordinatorConfig {
    uint32_t min_interval_ms = 5000;  // Minimum time between completed fetches
};

/// Merge engine settings
struct MergeConfig {
    uint32_t cache_ttl_ms = 5000;
    int32_t default_router_priority = 100;
};

/// Background reconciliation loops
struct ReconcilerConfig {
    bool enabled = true;
    uint32_t interval_seconds = 30;
    uint32_t cycle_timeout_ms = 30000;
    bool services_enabled = true;
};

/// SQLite database
struct StorageConfig {
    std::string path = "waypoint.db";
};

/// Admin HTTP endpoint serving the merged document
struct AdminConfig {
    bool enabled = true;
    std::string listen_address = "127.0.0.1";
    uint16_t port = 3456;
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";  // debug, info, warning, error
    std::string format = "text";  // json, text
    std::string output = "-";     // Log directory (waypoint.log appended), "-" for console

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Waypoint configuration
struct Config {
    UpstreamConfig upstream;
    CoordinatorConfig coordinator;
    MergeConfig merge;
    ReconcilerConfig reconciler;
    StorageConfig storage;
    AdminConfig admin;
    LogConfig logging;

    // Metadata
    std::string version = "1.0";
    std::optional<std::string> description;
};

// All config types use custom from_json/to_json (no macros - avoids conflicts)

inline void from_json(const nlohmann::json& j, UpstreamConfig& u) {
    UpstreamConfig defaults;
    u.type = j.value("type", defaults.type);
    u.url = j.value("url", defaults.url);
    u.username = j.value("username", std::string());
    u.password = j.value("password", std::string());
    u.skip_tls_verify = j.value("skip_tls_verify", false);
    u.require_cert_resolver = j.value("require_cert_resolver", false);
    u.timeout_ms = j.value("timeout_ms", 10000u);
    u.max_body_bytes = j.value("max_body_bytes", defaults.max_body_bytes);
    u.fallback_urls = j.value("fallback_urls", defaults.fallback_urls);
}

inline void from_json(const nlohmann::json& j, CoordinatorConfig& c) {
    c.min_interval_ms = j.value("min_interval_ms", 5000u);
}

inline void from_json(const nlohmann::json& j, MergeConfig& m) {
    m.cache_ttl_ms = j.value("cache_ttl_ms", 5000u);
    m.default_router_priority = j.value("default_router_priority", int32_t(100));
}

inline void from_json(const nlohmann::json& j, ReconcilerConfig& r) {
    r.enabled = j.value("enabled", true);
    r.interval_seconds = j.value("interval_seconds", 30u);
    r.cycle_timeout_ms = j.value("cycle_timeout_ms", 30000u);
    r.services_enabled = j.value("services_enabled", true);
}

inline void from_json(const nlohmann::json& j, StorageConfig& s) {
    s.path = j.value("path", std::string("waypoint.db"));
}

inline void from_json(const nlohmann::json& j, AdminConfig& a) {
    a.enabled = j.value("enabled", true);
    a.listen_address = j.value("listen_address", std::string("127.0.0.1"));
    a.port = j.value("port", uint16_t(3456));
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string("-"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // Use contains() + get() instead of value() to avoid infinite recursion
    // when default values trigger to_json() -> from_json() cycles
    if (j.contains("upstream")) {
        j.at("upstream").get_to(c.upstream);
    }
    if (j.contains("coordinator")) {
        j.at("coordinator").get_to(c.coordinator);
    }
    if (j.contains("merge")) {
        j.at("merge").get_to(c.merge);
    }
    if (j.contains("reconciler")) {
        j.at("reconciler").get_to(c.reconciler);
    }
    if (j.contains("storage")) {
        j.at("storage").get_to(c.storage);
    }
    if (j.contains("admin")) {
        j.at("admin").get_to(c.admin);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("version")) {
        j.at("version").get_to(c.version);
    }
    if (j.contains("description")) {
        j.at("description").get_to(c.description);
    }
}

// ============================================================================
// to_json functions for all config types
// ============================================================================

inline void to_json(nlohmann::json& j, const UpstreamConfig& u) {
    j = nlohmann::json{{"type", u.type},
                       {"url", u.url},
                       {"username", u.username},
                       {"password", u.password},
                       {"skip_tls_verify", u.skip_tls_verify},
                       {"require_cert_resolver", u.require_cert_resolver},
                       {"timeout_ms", u.timeout_ms},
                       {"max_body_bytes", u.max_body_bytes},
                       {"fallback_urls", u.fallback_urls}};
}

inline void to_json(nlohmann::json& j, const CoordinatorConfig& c) {
    j = nlohmann::json{{"min_interval_ms", c.min_interval_ms}};
}

inline void to_json(nlohmann::json& j, const MergeConfig& m) {
    j = nlohmann::json{{"cache_ttl_ms", m.cache_ttl_ms},
                       {"default_router_priority", m.default_router_priority}};
}

inline void to_json(nlohmann::json& j, const ReconcilerConfig& r) {
    j = nlohmann::json{{"enabled", r.enabled},
                       {"interval_seconds", r.interval_seconds},
                       {"cycle_timeout_ms", r.cycle_timeout_ms},
                       {"services_enabled", r.services_enabled}};
}

inline void to_json(nlohmann::json& j, const StorageConfig& s) {
    j = nlohmann::json{{"path", s.path}};
}

inline void to_json(nlohmann::json& j, const AdminConfig& a) {
    j = nlohmann::json{
        {"enabled", a.enabled}, {"listen_address", a.listen_address}, {"port", a.port}};
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json::object();
    j["upstream"] = c.upstream;
    j["coordinator"] = c.coordinator;
    j["merge"] = c.merge;
    j["reconciler"] = c.reconciler;
    j["storage"] = c.storage;
    j["admin"] = c.admin;
    j["logging"] = c.logging;
    j["version"] = c.version;
    j["description"] = c.description;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Environment variables consulted after parsing
inline constexpr const char* kEnvUpstreamUrl = "WAYPOINT_UPSTREAM_URL";
inline constexpr const char* kEnvUpstreamType = "WAYPOINT_UPSTREAM_TYPE";

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string (environment overrides applied, then validated)
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Apply WAYPOINT_UPSTREAM_URL / WAYPOINT_UPSTREAM_TYPE when set and non-empty
    static void apply_env_overrides(Config& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Configuration manager with hot-reload support (RCU pattern)
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Load initial configuration
    [[nodiscard]] bool load(std::string_view path);

    /// Reload configuration (hot-reload with RCU)
    [[nodiscard]] bool reload();

    /// Get current configuration (thread-safe read)
    [[nodiscard]] std::shared_ptr<const Config> get() const noexcept;

    /// Get configuration file path
    [[nodiscard]] std::string_view config_path() const noexcept { return config_path_; }

    /// Get last validation result
    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

private:
    std::string config_path_;
    std::shared_ptr<const Config> current_config_;
    ValidationResult last_validation_;
};

}  // namespace waypoint::control
