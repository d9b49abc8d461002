#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include "transitgraph/core/error.hpp"
#include "transitgraph/core/network_store.hpp"
#include "transitgraph/core/terrain.hpp"
#include "transitgraph/core/travel_time.hpp"
#include "test_utils.hpp"

using namespace transitgraph::core;
using namespace transitgraph::core::test;

namespace {
const GeoPoint kBerlin {13.4050, 52.5200};
const GeoPoint kMuenchen {11.5820, 48.1351};
const GeoPoint kPotsdam {13.0635, 52.3989};
const GeoPoint kKoeln {6.9603, 50.9375};
const GeoPoint kFrankfurt {8.6821, 50.1109};
const GeoPoint kMannheim {8.4660, 49.4875};
} // namespace

TEST(Haversine, ZeroForIdenticalPoints) {
  EXPECT_DOUBLE_EQ(haversine_km(kBerlin, kBerlin), 0.0);
}

TEST(Haversine, Symmetric) {
  EXPECT_DOUBLE_EQ(haversine_km(kBerlin, kMuenchen), haversine_km(kMuenchen, kBerlin));
}

TEST(Haversine, KnownDistances) {
  EXPECT_NEAR(haversine_km(kBerlin, kMuenchen), 504.4, 0.5);
  EXPECT_NEAR(haversine_km(GeoPoint{0.0, 0.0}, GeoPoint{1.0, 0.0}), 111.19, 0.01);
  EXPECT_NEAR(haversine_km(kFrankfurt, kMannheim), 71.0, 0.5);
}

TEST(Terrain, RegionTableIsDisjoint) {
  auto regions = region_table();
  for (std::size_t i = 0; i < regions.size(); ++i) {
    for (std::size_t j = i + 1; j < regions.size(); ++j) {
      const auto& a = regions[i];
      const auto& b = regions[j];
      const bool lat_overlap = a.lat_min < b.lat_max && b.lat_min < a.lat_max;
      const bool lon_overlap = a.lon_min < b.lon_max && b.lon_min < a.lon_max;
      EXPECT_FALSE(lat_overlap && lon_overlap) << a.name << " overlaps " << b.name;
    }
  }
}

TEST(Terrain, ResolvesNamedRegions) {
  auto berlin = resolve_region(kBerlin);
  ASSERT_TRUE(berlin.has_value());
  EXPECT_EQ(berlin->name, "Berlin");
  EXPECT_EQ(berlin->terrain, Terrain::Urban);

  auto frankfurt = resolve_region(kFrankfurt);
  ASSERT_TRUE(frankfurt.has_value());
  EXPECT_EQ(frankfurt->name, "Rhine-Main");

  auto koeln = resolve_region(kKoeln);
  ASSERT_TRUE(koeln.has_value());
  EXPECT_EQ(koeln->name, "Rhenish Massif");
  EXPECT_EQ(koeln->terrain, Terrain::Hills);

  auto alps = resolve_region(GeoPoint{11.0, 47.5});
  ASSERT_TRUE(alps.has_value());
  EXPECT_EQ(alps->terrain, Terrain::Mountains);
}

TEST(Terrain, FallsBackToLatitudeBands) {
  auto stralsund = resolve_region(GeoPoint{13.0810, 54.3091});
  ASSERT_TRUE(stralsund.has_value());
  EXPECT_EQ(stralsund->name, "Northern Lowlands");
  EXPECT_EQ(stralsund->terrain, Terrain::Flat);

  auto erfurt = resolve_region(GeoPoint{11.0299, 50.9848});
  ASSERT_TRUE(erfurt.has_value());
  EXPECT_EQ(erfurt->name, "Central Uplands");

  auto mannheim = resolve_region(kMannheim);
  ASSERT_TRUE(mannheim.has_value());
  EXPECT_EQ(mannheim->name, "Southern Germany");
}

TEST(Terrain, CoverageHoldsEveryRegion) {
  const Region& cover = coverage_bounds();
  for (const auto& r : region_table()) {
    EXPECT_GE(r.lat_min, cover.lat_min) << r.name;
    EXPECT_LE(r.lat_max, cover.lat_max) << r.name;
    EXPECT_GE(r.lon_min, cover.lon_min) << r.name;
    EXPECT_LE(r.lon_max, cover.lon_max) << r.name;
  }
  EXPECT_TRUE(cover.contains(GeoPoint{13.4050, 52.5200}));
  EXPECT_FALSE(cover.contains(GeoPoint{cover.lon_max, cover.lat_min}));
}

TEST(Terrain, UnresolvedOutsideCoverage) {
  EXPECT_FALSE(resolve_region(GeoPoint{0.0, 0.0}).has_value());
  EXPECT_FALSE(resolve_region(GeoPoint{2.35, 48.85}).has_value());
}

TEST(Terrain, LegUsesHarsherEndpoint) {
  EXPECT_DOUBLE_EQ(terrain_factor(kBerlin, kKoeln, kDefaultTerrainFactor), 1.2);
  EXPECT_DOUBLE_EQ(terrain_factor(kBerlin, kPotsdam, kDefaultTerrainFactor), 1.1);
  EXPECT_DOUBLE_EQ(terrain_factor(GeoPoint{0.0, 0.0}, GeoPoint{13.0810, 54.3091}, kDefaultTerrainFactor),
                   kDefaultTerrainFactor);
}

TEST(TravelTimeEstimate, ReferenceValues) {
  TravelTimeEstimator est;
  const GeoPoint a {0.0, 0.0};
  const GeoPoint b {1.0, 0.0};
  EXPECT_EQ(est.estimate(a, b, TransportClass::HighSpeed), 44);
  EXPECT_EQ(est.estimate(a, b, TransportClass::InterCity), 67);
  EXPECT_EQ(est.estimate(a, b, TransportClass::RegionalExpress), 96);
  EXPECT_EQ(est.estimate(a, b, TransportClass::Regional), 128);
  EXPECT_EQ(est.estimate(a, b, TransportClass::Suburban), 174);
}

TEST(TravelTimeEstimate, StopCountRoundsHalfToEven) {
  // Regional trains stop 8 times per 100 km, so these distances land on exact halves.
  EXPECT_EQ(estimated_stops(6.25, TransportClass::Regional), 0.0);
  EXPECT_EQ(estimated_stops(18.75, TransportClass::Regional), 2.0);
  EXPECT_EQ(estimated_stops(31.25, TransportClass::Regional), 2.0);
  EXPECT_EQ(estimated_stops(100.0, TransportClass::Regional), 8.0);
  EXPECT_EQ(estimated_stops(0.0, TransportClass::HighSpeed), 0.0);
}

TEST(TravelTimeEstimate, DeterministicAndSymmetric) {
  TravelTimeEstimator est;
  auto first = est.estimate(kBerlin, kMuenchen, TransportClass::InterCity);
  EXPECT_EQ(first, est.estimate(kBerlin, kMuenchen, TransportClass::InterCity));
  EXPECT_EQ(first, est.estimate(kMuenchen, kBerlin, TransportClass::InterCity));
  EXPECT_GT(first, 0);
}

TEST(TravelTimeEstimate, FasterClassesAreNotSlower) {
  TravelTimeEstimator est;
  auto ice = est.estimate(kBerlin, kMuenchen, TransportClass::HighSpeed);
  auto ic = est.estimate(kBerlin, kMuenchen, TransportClass::InterCity);
  auto re = est.estimate(kBerlin, kMuenchen, TransportClass::RegionalExpress);
  auto rb = est.estimate(kBerlin, kMuenchen, TransportClass::Regional);
  EXPECT_LE(ice, ic);
  EXPECT_LE(ic, re);
  EXPECT_LE(re, rb);
}

TEST(TravelTimeEstimate, RejectsNonFiniteCoordinates) {
  TravelTimeEstimator est;
  const double nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW((void)est.estimate(GeoPoint{nan, 0.0}, kBerlin, TransportClass::Regional), ValueError);
}

TEST(TravelTimeEstimate, RejectsInvalidOptions) {
  EstimatorOptions bad_speed;
  bad_speed.reference_speed_kmh = 0.0;
  EXPECT_THROW(TravelTimeEstimator{bad_speed}, std::invalid_argument);
  EstimatorOptions bad_terrain;
  bad_terrain.default_terrain_factor = 0.5;
  EXPECT_THROW(TravelTimeEstimator{bad_terrain}, std::invalid_argument);
}

TEST(TravelTimeLookup, OverrideReturnedVerbatim) {
  NetworkStore store;
  store.add_city("Berlin", kBerlin);
  store.add_city("München", kMuenchen);
  ASSERT_TRUE(store.add_connection("Berlin", "München").is_ok());
  ASSERT_TRUE(store.set_duration_override("München", "Berlin", 7).is_ok());
  TravelTimeEstimator est;
  EXPECT_EQ(est.travel_minutes(store, "Berlin", "München").value_or(-1), 7);
  EXPECT_EQ(est.travel_time_label(store, "Berlin", "München"), "7 min");
}

TEST(TravelTimeLookup, UsesConnectionClassOrDefault) {
  NetworkStore store;
  store.add_city("A", GeoPoint{0.0, 0.0});
  store.add_city("B", GeoPoint{1.0, 0.0});
  store.add_city("C", GeoPoint{2.0, 0.0});
  ASSERT_TRUE(store.add_connection("A", "B", TransportClass::HighSpeed).is_ok());
  ASSERT_TRUE(store.add_connection("B", "C").is_ok());
  TravelTimeEstimator est;
  EXPECT_EQ(est.travel_minutes(store, "A", "B").value_or(-1), 44);
  EXPECT_EQ(est.travel_minutes(store, "B", "C").value_or(-1), 96);
  EXPECT_EQ(est.chain_total_minutes(store, Chain{{"A", "B"}, {"B", "C"}}), 140);
}

TEST(TravelTimeLookup, UnknownCityIsUnavailable) {
  NetworkStore store;
  store.add_city("A", GeoPoint{0.0, 0.0});
  TravelTimeEstimator est;
  EXPECT_FALSE(est.travel_minutes(store, "A", "Nowhere").has_value());
  EXPECT_EQ(est.travel_time_label(store, "A", "Nowhere"), "N/A");
}

TEST(TravelTimeCache, HitsAndInvalidation) {
  NetworkStore store;
  store.add_city("Berlin", kBerlin);
  store.add_city("Potsdam", kPotsdam);
  store.add_city("Köln", kKoeln);
  ASSERT_TRUE(store.add_connection("Berlin", "Potsdam").is_ok());
  TravelTimeEstimator est;
  store.add_observer(&est);

  auto first = est.travel_minutes(store, "Berlin", "Potsdam");
  auto second = est.travel_minutes(store, "Potsdam", "Berlin");
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first, second);
  EXPECT_EQ(est.cache_misses(), 1u);
  EXPECT_EQ(est.cache_hits(), 1u);
  EXPECT_EQ(est.cache_size(), 1u);

  ASSERT_TRUE(store.update_city_coordinates("Potsdam", kKoeln).is_ok());
  EXPECT_EQ(est.cache_size(), 0u);
  auto moved = est.travel_minutes(store, "Berlin", "Potsdam");
  ASSERT_TRUE(moved.has_value());
  EXPECT_GT(*moved, *first);

  ASSERT_TRUE(store.set_transport_class("Berlin", "Potsdam", TransportClass::HighSpeed).is_ok());
  EXPECT_EQ(est.cache_size(), 0u);
  store.remove_observer(&est);
}

TEST(TravelTimeCache, DisabledCacheStillComputes) {
  NetworkStore store;
  store.add_city("A", GeoPoint{0.0, 0.0});
  store.add_city("B", GeoPoint{1.0, 0.0});
  EstimatorOptions opts;
  opts.cache_enabled = false;
  TravelTimeEstimator est(opts);
  EXPECT_EQ(est.travel_minutes(store, "A", "B").value_or(-1), 96);
  EXPECT_EQ(est.travel_minutes(store, "A", "B").value_or(-1), 96);
  EXPECT_EQ(est.cache_size(), 0u);
  EXPECT_EQ(est.cache_hits(), 0u);
}

TEST(TravelTimeFormat, Labels) {
  EXPECT_EQ(format_minutes(0), "0 min");
  EXPECT_EQ(format_minutes(45), "45 min");
  EXPECT_EQ(format_minutes(60), "1h 0m");
  EXPECT_EQ(format_minutes(150), "2h 30m");
  EXPECT_EQ(format_total(1710), "Total: 28h 30m");
}
