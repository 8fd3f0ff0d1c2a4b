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

// Upstream Fetcher Factory - Implementation

#include "factory.hpp"

#include "../core/logging.hpp"
#include "aggregator_fetcher.hpp"
#include "native_fetcher.hpp"

namespace waypoint::upstream {

std::shared_ptr<UpstreamFetcher> build_fetcher(const control::UpstreamConfig& config,
                                               core::HttpClient& http) {
    auto* logger = logging::get_current_logger();

    if (config.type == "pangolin") {
        LOG_INFO(logger, "Using aggregator upstream at {}", config.url);
        return std::make_shared<AggregatorFetcher>(config, http);
    }

    if (config.type == "traefik") {
        LOG_INFO(logger, "Using Traefik API upstream at {} ({} fallback URLs)", config.url,
                 config.fallback_urls.size());
        return std::make_shared<NativeFetcher>(config, http);
    }

    LOG_ERROR(logger, "Unknown upstream type '{}'", config.type);
    return nullptr;
}

}  // namespace waypoint::upstream
