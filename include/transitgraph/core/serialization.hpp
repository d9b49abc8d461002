/* JSON persistence of NetworkState.
 *
 * Pair-keyed maps are written as arrays of objects with explicit "from"/"to"
 * fields so city names may contain any characters.
 */
#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "transitgraph/core/error.hpp"
#include "transitgraph/core/types.hpp"

namespace transitgraph::core {

void to_json(nlohmann::json& dst, const GeoPoint& src);
void from_json(const nlohmann::json& src, GeoPoint& dst);
void to_json(nlohmann::json& dst, const Connection& src);
void from_json(const nlohmann::json& src, Connection& dst);

[[nodiscard]] nlohmann::json state_to_json(const NetworkState& state);
// Parses and validates (validate_state) a persisted record. Missing optional
// sections default to empty; "cities" and "connections" are required.
[[nodiscard]] Result<NetworkState> state_from_json(const nlohmann::json& src);

Status save_state(const NetworkState& state, const std::string& path);
[[nodiscard]] Result<NetworkState> load_state(const std::string& path);

} // namespace transitgraph::core
