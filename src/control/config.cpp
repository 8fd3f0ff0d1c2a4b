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

// Waypoint Configuration - Implementation

#include "config.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "../core/string_utils.hpp"

namespace waypoint::control {

namespace {

constexpr size_t MAX_LEVENSHTEIN_DISTANCE = 2;

const std::vector<std::string> kUpstreamTypes = {"pangolin", "traefik"};
const std::vector<std::string> kLogLevels = {"debug", "info", "warning", "error"};
const std::vector<std::string> kLogFormats = {"json", "text"};

// "Unknown X 'v'" plus a suggestion when a known value is close
void reject_unknown(std::string_view what, const std::string& value,
                    const std::vector<std::string>& known, ValidationResult& result) {
    std::string message = "Unknown " + std::string(what) + " '" + value + "'";
    auto similar = core::find_similar_strings(value, known, MAX_LEVENSHTEIN_DISTANCE);
    if (!similar.empty()) {
        message += " (did you mean '" + similar.front() + "'?)";
    } else {
        message += " (expected one of: " + core::join(known, ", ") + ")";
    }
    result.add_error(std::move(message));
}

bool is_known(const std::string& value, const std::vector<std::string>& known) {
    for (const auto& k : known) {
        if (k == value) {
            return true;
        }
    }
    return false;
}

bool has_http_scheme(std::string_view url) {
    return url.starts_with("http://") || url.starts_with("https://");
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    // Read file contents
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open config file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    apply_env_overrides(config);

    auto validation = validate(config);
    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "Config error: %s\n", error.c_str());
        }
        return std::nullopt;
    }

    return config;
}

void ConfigLoader::apply_env_overrides(Config& config) {
    if (const char* url = std::getenv(kEnvUpstreamUrl); url != nullptr && *url != '\0') {
        config.upstream.url = url;
    }
    if (const char* type = std::getenv(kEnvUpstreamType); type != nullptr && *type != '\0') {
        config.upstream.type = core::to_lower(type);
    }
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Upstream
    const auto& upstream = config.upstream;
    if (!is_known(upstream.type, kUpstreamTypes)) {
        reject_unknown("upstream type", upstream.type, kUpstreamTypes, result);
    }

    if (upstream.url.empty()) {
        result.add_error("Upstream url cannot be empty");
    } else if (!has_http_scheme(upstream.url)) {
        result.add_error("Upstream url '" + upstream.url + "' must start with http:// or https://");
    }

    if (upstream.timeout_ms == 0) {
        result.add_error("Upstream timeout_ms must be > 0");
    }

    if (upstream.max_body_bytes == 0) {
        result.add_error("Upstream max_body_bytes must be > 0");
    }

    if (!upstream.password.empty() && upstream.username.empty()) {
        result.add_warning("Upstream password is set without a username (basic auth disabled)");
    }

    if (upstream.type == "traefik") {
        for (const auto& fallback : upstream.fallback_urls) {
            if (!has_http_scheme(fallback)) {
                result.add_error("Fallback url '" + fallback +
                                 "' must start with http:// or https://");
            }
        }
    }

    // Caches
    if (config.merge.cache_ttl_ms == 0) {
        result.add_warning("merge.cache_ttl_ms is 0 (every request triggers a merge)");
    }

    // Reconciler
    if (config.reconciler.enabled) {
        if (config.reconciler.interval_seconds == 0) {
            result.add_error("reconciler.interval_seconds must be > 0");
        }
        if (config.reconciler.cycle_timeout_ms == 0) {
            result.add_error("reconciler.cycle_timeout_ms must be > 0");
        }
    }

    // Storage
    if (config.storage.path.empty()) {
        result.add_error("storage.path cannot be empty");
    }

    // Admin endpoint
    if (config.admin.enabled && config.admin.port == 0) {
        result.add_error("admin.port must be > 0");
    }

    // Logging
    if (!is_known(config.logging.level, kLogLevels)) {
        reject_unknown("log level", config.logging.level, kLogLevels, result);
    }
    if (!is_known(config.logging.format, kLogFormats)) {
        reject_unknown("log format", config.logging.format, kLogFormats, result);
    }
    if (config.logging.rotation.max_files == 0) {
        result.add_warning("logging.rotation.max_files is 0 (old logs are discarded)");
    }

    return result;
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "Config serialization error: %s\n", e.what());
        return "";
    }
}

// ConfigManager implementation

bool ConfigManager::load(std::string_view path) {
    config_path_ = path;

    auto maybe_config = ConfigLoader::load_from_file(path);
    if (!maybe_config.has_value()) {
        return false;
    }

    last_validation_ = ConfigLoader::validate(*maybe_config);
    if (last_validation_.has_errors()) {
        return false;
    }

    std::atomic_store(&current_config_, std::make_shared<const Config>(std::move(*maybe_config)));

    return true;
}

bool ConfigManager::reload() {
    if (config_path_.empty()) {
        return false;
    }

    auto maybe_config = ConfigLoader::load_from_file(config_path_);
    if (!maybe_config.has_value()) {
        return false;
    }

    last_validation_ = ConfigLoader::validate(*maybe_config);
    if (last_validation_.has_errors()) {
        return false;
    }

    // RCU pattern: old config remains valid until all readers release their references
    auto new_config = std::make_shared<const Config>(std::move(*maybe_config));
    std::atomic_store(&current_config_, new_config);

    return true;
}

std::shared_ptr<const Config> ConfigManager::get() const noexcept {
    return std::atomic_load(&current_config_);
}

}  // namespace waypoint::control
