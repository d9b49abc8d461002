/* Travel-time estimation: haversine distance scaled by class and terrain. */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "transitgraph/core/network_observer.hpp"
#include "transitgraph/core/options.hpp"
#include "transitgraph/core/types.hpp"

namespace transitgraph::core {

class NetworkStore;

// Per-class model constants.
struct TransportProfile {
  double speed_factor;      // multiplies the reference speed
  double curvature;         // straight-line to track-length correction (>= 1)
  double stops_per_100km;   // typical intermediate stops
  double dwell_minutes;     // minutes spent per stop
};

[[nodiscard]] const TransportProfile& transport_profile(TransportClass cls) noexcept;

// Great-circle distance in km between (lon, lat) degree coordinates.
[[nodiscard]] double haversine_km(GeoPoint a, GeoPoint b) noexcept;

// Intermediate stops over `raw_km`, rounded half to even.
[[nodiscard]] double estimated_stops(double raw_km, TransportClass cls) noexcept;

// "<h>h <m>m" when hours > 0, else "<m> min".
[[nodiscard]] std::string format_minutes(Minutes minutes);
// "Total: " + format_minutes(minutes).
[[nodiscard]] std::string format_total(Minutes minutes);

// TravelTimeEstimator computes leg durations and memoizes them per unordered
// city pair. It observes a NetworkStore so cached entries are dropped whenever
// their inputs (coordinates, class, override, existence) change.
class TravelTimeEstimator final : public NetworkObserver {
public:
  explicit TravelTimeEstimator(EstimatorOptions options = {});
  ~TravelTimeEstimator() noexcept override = default;

  // Pure model evaluation; symmetric in (a, b). Throws ValueError on
  // non-finite coordinates.
  [[nodiscard]] Minutes estimate(GeoPoint a, GeoPoint b, TransportClass cls) const;

  // Leg duration as shown to users: an explicit override is returned verbatim,
  // otherwise the (cached) estimate for the connection's class. nullopt when
  // either city is unknown to the store.
  [[nodiscard]] std::optional<Minutes> travel_minutes(const NetworkStore& store,
                                                      std::string_view a, std::string_view b);

  // Formatted travel_minutes, or "N/A".
  [[nodiscard]] std::string travel_time_label(const NetworkStore& store,
                                              std::string_view a, std::string_view b);

  // Sum over the legs of a chain; unresolvable legs contribute nothing.
  [[nodiscard]] Minutes chain_total_minutes(const NetworkStore& store, const Chain& chain);

  void invalidate(const PairKey& pair);
  void invalidate_city(std::string_view city);
  void clear_cache() noexcept;

  [[nodiscard]] std::size_t cache_size() const noexcept { return cache_.size(); }
  [[nodiscard]] std::uint64_t cache_hits() const noexcept { return hits_; }
  [[nodiscard]] std::uint64_t cache_misses() const noexcept { return misses_; }
  [[nodiscard]] const EstimatorOptions& options() const noexcept { return options_; }

  void on_city_changed(const CityName& city) override { invalidate_city(city); }
  void on_connection_changed(const PairKey& pair) override { invalidate(pair); }
  void on_state_reset() override { clear_cache(); }

private:
  EstimatorOptions options_;
  std::unordered_map<PairKey, Minutes, PairKeyHash> cache_;
  std::uint64_t hits_ {0};
  std::uint64_t misses_ {0};
};

} // namespace transitgraph::core
