/* Built-in sample network: sixteen German cities on one long line. */
#pragma once

#include <vector>

#include "transitgraph/core/types.hpp"

namespace transitgraph::core {

// Cities, connections and reference durations (as overrides) of the sample.
[[nodiscard]] NetworkState default_network();
[[nodiscard]] const std::vector<CityName>& default_city_names();

} // namespace transitgraph::core
