/*
  Terrain: piecewise region classifier.

  Named rectangles are checked first, in table order. Points inside the
  coverage area that hit no rectangle fall into one of three latitude bands.
  Points outside the coverage area are unresolved.
*/
#include "transitgraph/core/terrain.hpp"

#include <algorithm>
#include <array>

namespace transitgraph::core {

namespace {
constexpr std::array<Region, 13> kRegions {{
  // Metropolitan areas
  {"Berlin",            52.30, 52.70, 13.00, 13.80, Terrain::Urban},
  {"Hamburg",           53.40, 53.70,  9.70, 10.30, Terrain::Urban},
  {"Munich",            48.00, 48.30, 11.30, 11.80, Terrain::Urban},
  {"Rhine-Main",        49.90, 50.25,  8.40,  9.00, Terrain::Urban},
  {"Ruhr",              51.30, 51.70,  6.60,  7.70, Terrain::Urban},
  // Mountain ranges
  {"Alps",              47.20, 47.80,  9.50, 13.10, Terrain::Mountains},
  {"Black Forest",      47.60, 48.90,  7.70,  8.60, Terrain::Mountains},
  {"Bavarian Forest",   48.50, 49.30, 12.20, 13.90, Terrain::Mountains},
  {"Harz",              51.50, 51.95, 10.30, 11.30, Terrain::Mountains},
  {"Ore Mountains",     50.30, 50.80, 12.20, 14.00, Terrain::Mountains},
  // Uplands
  {"Thuringian Forest", 50.40, 50.90, 10.30, 11.30, Terrain::Hills},
  {"Swabian Jura",      48.10, 48.90,  8.60, 10.40, Terrain::Hills},
  {"Rhenish Massif",    49.90, 51.30,  6.20,  8.40, Terrain::Hills},
}};

constexpr Region kCoverage {"Germany", 47.20, 55.10, 5.80, 15.10, Terrain::Flat};

// Band edges (degrees latitude).
constexpr double kNorthernBandMin = 52.0;
constexpr double kCentralBandMin = 50.0;
} // namespace

std::span<const Region> region_table() noexcept { return kRegions; }

const Region& coverage_bounds() noexcept { return kCoverage; }

std::optional<RegionMatch> resolve_region(GeoPoint p) noexcept {
  for (const auto& r : kRegions) {
    if (r.contains(p)) return RegionMatch{r.name, r.terrain};
  }
  if (!coverage_bounds().contains(p)) return std::nullopt;
  if (p.lat >= kNorthernBandMin) return RegionMatch{"Northern Lowlands", Terrain::Flat};
  if (p.lat >= kCentralBandMin) return RegionMatch{"Central Uplands", Terrain::Hills};
  return RegionMatch{"Southern Germany", Terrain::Hills};
}

double terrain_multiplier(Terrain t) noexcept {
  switch (t) {
    case Terrain::Flat: return 1.0;
    case Terrain::Urban: return 1.1;
    case Terrain::Hills: return 1.2;
    case Terrain::Mountains: return 1.4;
  }
  return 1.0;
}

double terrain_factor(GeoPoint a, GeoPoint b, double default_factor) noexcept {
  auto ra = resolve_region(a);
  auto rb = resolve_region(b);
  double fa = ra ? terrain_multiplier(ra->terrain) : default_factor;
  double fb = rb ? terrain_multiplier(rb->terrain) : default_factor;
  return std::max(fa, fb);
}

} // namespace transitgraph::core
