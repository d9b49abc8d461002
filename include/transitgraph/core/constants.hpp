/* Numeric constants of the estimation model and the branch presentation palette. */
#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace transitgraph::core {

inline constexpr double kEarthRadiusKm = 6371.0;
// Reference train speed before class and terrain scaling.
inline constexpr double kReferenceSpeedKmh = 100.0;
// Terrain multiplier when a coordinate resolves to no region at all.
inline constexpr double kDefaultTerrainFactor = 1.15;

inline constexpr std::size_t kMaxHistorySize = 100;

// Branch colors are assigned round-robin by index into this palette.
inline constexpr std::array<std::string_view, 8> kBranchColors {
  "#3498db", "#e74c3c", "#2ecc71", "#f39c12",
  "#9b59b6", "#1abc9c", "#d35400", "#34495e",
};

// Line styles as dash patterns; empty means solid.
enum class LineStyle { Solid = 0, Dashed = 1, Dotted = 2, DashDotted = 3 };
inline constexpr std::size_t kLineStyleCount = 4;

} // namespace transitgraph::core
