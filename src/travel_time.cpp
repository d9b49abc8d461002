/*
  TravelTimeEstimator: distance/terrain/stop model with per-pair memoization.

  minutes = floor(adjusted_km / effective_speed * 60 + stops * dwell) where
    adjusted_km     = haversine_km * curvature(class)
    effective_speed = reference_speed * speed_factor(class) / terrain_factor
    stops           = round_half_even(haversine_km / 100 * stops_per_100km(class))
*/
#include "transitgraph/core/travel_time.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "transitgraph/core/constants.hpp"
#include "transitgraph/core/error.hpp"
#include "transitgraph/core/network_store.hpp"
#include "transitgraph/core/terrain.hpp"

namespace transitgraph::core {

namespace {
constexpr TransportProfile kHighSpeed       {2.0, 1.10,  0.8, 2.0};
constexpr TransportProfile kInterCity       {1.4, 1.15,  1.5, 2.0};
constexpr TransportProfile kRegionalExpress {1.0, 1.20,  4.0, 1.0};
constexpr TransportProfile kRegional        {0.8, 1.25,  8.0, 1.0};
constexpr TransportProfile kSuburban        {0.6, 1.30, 15.0, 0.5};

constexpr double to_radians(double deg) noexcept { return deg * std::numbers::pi / 180.0; }
} // namespace

const TransportProfile& transport_profile(TransportClass cls) noexcept {
  switch (cls) {
    case TransportClass::HighSpeed: return kHighSpeed;
    case TransportClass::InterCity: return kInterCity;
    case TransportClass::RegionalExpress: return kRegionalExpress;
    case TransportClass::Regional: return kRegional;
    case TransportClass::Suburban: return kSuburban;
  }
  return kRegionalExpress;
}

double haversine_km(GeoPoint a, GeoPoint b) noexcept {
  const double lon1 = to_radians(a.lon), lat1 = to_radians(a.lat);
  const double lon2 = to_radians(b.lon), lat2 = to_radians(b.lat);
  const double dlon = lon2 - lon1;
  const double dlat = lat2 - lat1;
  const double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2) * std::sin(dlon / 2);
  const double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
  return kEarthRadiusKm * c;
}

double estimated_stops(double raw_km, TransportClass cls) noexcept {
  // std::nearbyint follows the default FE_TONEAREST mode: ties go to even.
  return std::max(0.0, std::nearbyint(raw_km / 100.0 * transport_profile(cls).stops_per_100km));
}

std::string format_minutes(Minutes minutes) {
  const Minutes hours = minutes / 60;
  const Minutes rest = minutes % 60;
  if (hours > 0) return std::to_string(hours) + "h " + std::to_string(rest) + "m";
  return std::to_string(rest) + " min";
}

std::string format_total(Minutes minutes) {
  return "Total: " + format_minutes(minutes);
}

TravelTimeEstimator::TravelTimeEstimator(EstimatorOptions options)
  : options_(options) {
  if (!(options_.reference_speed_kmh > 0.0)) {
    throw std::invalid_argument("reference_speed_kmh must be > 0");
  }
  if (!(options_.default_terrain_factor >= 1.0)) {
    throw std::invalid_argument("default_terrain_factor must be >= 1.0");
  }
}

Minutes TravelTimeEstimator::estimate(GeoPoint a, GeoPoint b, TransportClass cls) const {
  if (!std::isfinite(a.lon) || !std::isfinite(a.lat) || !std::isfinite(b.lon) || !std::isfinite(b.lat)) {
    throw ValueError("estimate: coordinates must be finite");
  }
  const auto& profile = transport_profile(cls);
  const double raw_km = haversine_km(a, b);
  const double adjusted_km = raw_km * profile.curvature;
  const double terrain = terrain_factor(a, b, options_.default_terrain_factor);
  const double speed_kmh = options_.reference_speed_kmh * profile.speed_factor / terrain;
  const double base_minutes = adjusted_km / speed_kmh * 60.0;
  const double stops = estimated_stops(raw_km, cls);
  const double dwell = stops * profile.dwell_minutes;
  return static_cast<Minutes>(std::floor(base_minutes + dwell));
}

std::optional<Minutes> TravelTimeEstimator::travel_minutes(const NetworkStore& store,
                                                           std::string_view a, std::string_view b) {
  PairKey key{CityName(a), CityName(b)};
  if (auto override_minutes = store.duration_override(a, b)) {
    return *override_minutes;
  }
  auto pa = store.city(a);
  auto pb = store.city(b);
  if (!pa || !pb) return std::nullopt;

  if (options_.cache_enabled) {
    auto it = cache_.find(key);
    if (it != cache_.end()) {
      ++hits_;
      return it->second;
    }
  }
  ++misses_;
  const auto cls = store.transport_class(a, b).value_or(options_.default_class);
  const Minutes minutes = estimate(*pa, *pb, cls);
  if (options_.cache_enabled) cache_.emplace(std::move(key), minutes);
  return minutes;
}

std::string TravelTimeEstimator::travel_time_label(const NetworkStore& store,
                                                   std::string_view a, std::string_view b) {
  auto minutes = travel_minutes(store, a, b);
  if (!minutes) return "N/A";
  return format_minutes(*minutes);
}

Minutes TravelTimeEstimator::chain_total_minutes(const NetworkStore& store, const Chain& chain) {
  Minutes total = 0;
  for (const auto& leg : chain) {
    if (auto m = travel_minutes(store, leg.a, leg.b)) total += *m;
  }
  return total;
}

void TravelTimeEstimator::invalidate(const PairKey& pair) {
  cache_.erase(pair);
}

void TravelTimeEstimator::invalidate_city(std::string_view city) {
  std::size_t dropped = std::erase_if(cache_, [&](const auto& kv) { return kv.first.contains(city); });
  if (dropped > 0) {
    spdlog::debug("travel-time cache: dropped {} entries for city '{}'", dropped, city);
  }
}

void TravelTimeEstimator::clear_cache() noexcept {
  cache_.clear();
}

} // namespace transitgraph::core
