/* Runtime configuration structs and their JSON loaders. */
#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "transitgraph/core/constants.hpp"
#include "transitgraph/core/error.hpp"
#include "transitgraph/core/types.hpp"

namespace transitgraph::core {

struct EstimatorOptions {
  double reference_speed_kmh {kReferenceSpeedKmh};
  double default_terrain_factor {kDefaultTerrainFactor};
  // Class used for connections with no explicit transport class.
  TransportClass default_class {TransportClass::RegionalExpress};
  bool cache_enabled {true};
};

struct HistoryOptions {
  std::size_t capacity {kMaxHistorySize};
};

struct CoreOptions {
  EstimatorOptions estimator {};
  HistoryOptions history {};
  // spdlog level name: trace, debug, info, warn, error, critical, off.
  std::string log_level {"info"};
};

// Reads options from a JSON object of the form
//   {"estimator": {"reference_speed_kmh": 100, "default_terrain_factor": 1.15,
//                  "default_class": "RE", "cache_enabled": true},
//    "history": {"capacity": 100}, "log_level": "info"}
// Missing keys keep their defaults; unknown keys are ignored.
[[nodiscard]] Result<CoreOptions> options_from_json(const nlohmann::json& src);
[[nodiscard]] Result<CoreOptions> load_options(const std::string& path);

// Applies log_level to the default spdlog logger.
Status configure_logging(const CoreOptions& options);

} // namespace transitgraph::core
