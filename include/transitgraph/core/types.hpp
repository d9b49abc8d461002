/* Core value types shared by the network, estimator and branch layers.
 *
 * For Python developers:
 * - CityName: std::string (city identifiers are their display names)
 * - PairKey: canonical unordered city pair (like frozenset({a, b}) but ordered)
 * - std::map/std::set: ordered containers, iteration is sorted by key
 */
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace transitgraph::core {

using CityName = std::string;
using Minutes = std::int32_t;

// Geographic coordinate in degrees.
struct GeoPoint {
  double lon {0.0};
  double lat {0.0};
  friend bool operator==(const GeoPoint& a, const GeoPoint& b) noexcept {
    return a.lon == b.lon && a.lat == b.lat;
  }
};

// Transport class of a connection; governs speed, curvature and stop model.
enum class TransportClass {
  HighSpeed = 1,        // ICE
  InterCity = 2,        // IC
  RegionalExpress = 3,  // RE (default when a connection carries no class)
  Regional = 4,         // RB
  Suburban = 5          // S-Bahn
};

// Stable text tags used by persistence and bindings ("ICE", "IC", "RE", "RB", "S").
[[nodiscard]] std::string_view transport_class_tag(TransportClass cls) noexcept;
[[nodiscard]] std::optional<TransportClass> parse_transport_class(std::string_view tag) noexcept;

// Unordered city pair in canonical form (first <= second). Used as the key of
// every per-connection attribute map so (a, b) and (b, a) address the same entry.
struct PairKey {
  CityName first;
  CityName second;

  PairKey() = default;
  PairKey(CityName a, CityName b) {
    if (b < a) std::swap(a, b);
    first = std::move(a);
    second = std::move(b);
  }

  [[nodiscard]] bool contains(std::string_view city) const noexcept {
    return first == city || second == city;
  }
  // Endpoint opposite to `city`; caller guarantees contains(city).
  [[nodiscard]] const CityName& other(std::string_view city) const noexcept {
    return first == city ? second : first;
  }

  friend bool operator==(const PairKey& a, const PairKey& b) noexcept {
    return a.first == b.first && a.second == b.second;
  }
  friend bool operator<(const PairKey& a, const PairKey& b) noexcept {
    if (a.first != b.first) return a.first < b.first;
    return a.second < b.second;
  }
};

struct PairKeyHash {
  std::size_t operator()(const PairKey& k) const noexcept {
    std::size_t h = std::hash<std::string>{}(k.first);
    h ^= std::hash<std::string>{}(k.second) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
  }
};

// Connection tuple as stored (orientation is kept for display order only).
struct Connection {
  CityName a;
  CityName b;

  [[nodiscard]] PairKey key() const { return PairKey{a, b}; }
  [[nodiscard]] bool touches(std::string_view city) const noexcept { return a == city || b == city; }

  friend bool operator==(const Connection& x, const Connection& y) noexcept {
    return x.a == y.a && x.b == y.b;
  }
};

// Chains are ordered connections; each element is oriented so that its `a`
// is the `b` of its predecessor.
using Chain = std::vector<Connection>;

// Full persisted/versioned network state. Plain data: copying it is a deep copy.
struct NetworkState {
  std::map<CityName, GeoPoint, std::less<>> cities;
  std::vector<Connection> connections;
  std::map<PairKey, TransportClass> train_types;
  std::map<PairKey, Minutes> travel_times;
  std::set<PairKey> daybreaks;
  std::map<std::int32_t, std::string> route_chain_names;
  std::vector<std::string> zoomed_states;

  friend bool operator==(const NetworkState&, const NetworkState&) = default;
};

} // namespace transitgraph::core
