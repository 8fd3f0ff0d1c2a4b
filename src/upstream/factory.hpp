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

// Upstream Fetcher Factory - Header
// Build the fetcher selected by upstream.type

#pragma once

#include <memory>

#include "../control/config.hpp"
#include "../core/http_client.hpp"
#include "fetcher.hpp"

namespace waypoint::upstream {

/// Build the fetcher for `config.type` ("pangolin" or "traefik"); null for unknown types.
/// `http` must outlive the returned fetcher.
[[nodiscard]] std::shared_ptr<UpstreamFetcher> build_fetcher(const control::UpstreamConfig& config,
                                                             core::HttpClient& http);

}  // namespace waypoint::upstream
