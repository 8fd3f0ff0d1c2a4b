#pragma once

#include <string>
#include <string_view>

namespace waypoint::core {

// Random UUID v4 in canonical 8-4-4-4-12 form, used for stable internal ids
std::string generate_uuid();

// Validate UUID v4 format (8-4-4-4-12, version nibble 4, RFC 4122 variant)
bool is_valid_uuid(std::string_view uuid);

}  // namespace waypoint::core
