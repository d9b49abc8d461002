/* Terrain classification of coordinates over a fixed region table. */
#pragma once

#include <optional>
#include <span>
#include <string_view>

#include "transitgraph/core/types.hpp"

namespace transitgraph::core {

// Ordered by severity: a larger enumerator never has a smaller multiplier.
enum class Terrain { Flat = 0, Urban = 1, Hills = 2, Mountains = 3 };

// Axis-aligned bounding rectangle in degrees, half-open on the max side.
struct Region {
  std::string_view name;
  double lat_min;
  double lat_max;
  double lon_min;
  double lon_max;
  Terrain terrain;

  [[nodiscard]] constexpr bool contains(GeoPoint p) const noexcept {
    return p.lat >= lat_min && p.lat < lat_max && p.lon >= lon_min && p.lon < lon_max;
  }
};

struct RegionMatch {
  std::string_view name;
  Terrain terrain;
};

// Named regions checked in table order; rectangles are pairwise disjoint.
[[nodiscard]] std::span<const Region> region_table() noexcept;

// Outer rectangle inside which the northern/central/southern band fallback applies.
[[nodiscard]] const Region& coverage_bounds() noexcept;

// First matching named region, else the latitude band fallback when the point
// lies within coverage_bounds(), else nullopt.
[[nodiscard]] std::optional<RegionMatch> resolve_region(GeoPoint p) noexcept;

[[nodiscard]] double terrain_multiplier(Terrain t) noexcept;

// Multiplier for a leg: the more severe of both endpoints. An endpoint with no
// region match contributes `default_factor`.
[[nodiscard]] double terrain_factor(GeoPoint a, GeoPoint b, double default_factor) noexcept;

} // namespace transitgraph::core
