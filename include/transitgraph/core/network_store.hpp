/* Authoritative city/connection store with validated mutation primitives. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "transitgraph/core/error.hpp"
#include "transitgraph/core/network_observer.hpp"
#include "transitgraph/core/types.hpp"

namespace transitgraph::core {

// Checks the structural invariants of a state: no self-loops, no duplicate
// unordered pairs, every endpoint is a known city, overrides are positive and
// attach to existing connections. Break markers are not checked.
[[nodiscard]] Status validate_state(const NetworkState& state);

// NetworkStore owns one NetworkState and is the only place it is mutated.
// Expected failures are reported through Status; nothing here throws for
// domain conditions. Observers are non-owning and must outlive the store or
// be removed first.
class NetworkStore {
public:
  NetworkStore() = default;
  // Throws std::invalid_argument when `state` violates validate_state().
  explicit NetworkStore(NetworkState state);
  NetworkStore(const NetworkStore&) = delete;
  NetworkStore& operator=(const NetworkStore&) = delete;
  ~NetworkStore() noexcept = default;

  // Cities
  void add_city(const CityName& name, GeoPoint at);
  Status update_city_coordinates(std::string_view name, GeoPoint at);
  // Removes the city and its connections, then connects every pair of its
  // former neighbours that is not already connected.
  Status remove_city(std::string_view name);
  // Removes cities and their connections without reconnecting. Unknown names
  // are ignored. Returns the number of cities removed.
  std::size_t remove_cities(std::span<const CityName> names);

  // Connections
  Status add_connection(std::string_view a, std::string_view b,
                        std::optional<TransportClass> cls = std::nullopt);
  Status remove_connection(std::string_view a, std::string_view b);
  Status set_transport_class(std::string_view a, std::string_view b, TransportClass cls);
  // Idempotent; the pair need not be a connection.
  void mark_break(std::string_view a, std::string_view b);
  void unmark_break(std::string_view a, std::string_view b);
  Status set_duration_override(std::string_view a, std::string_view b, Minutes minutes);
  void clear_duration_override(std::string_view a, std::string_view b);

  // Replaces the connection set. Pairs already taken (either order), self-loops
  // and pairs with unknown endpoints are skipped. Attributes of pairs that are
  // no longer connections are dropped. Returns the number of connections kept.
  std::size_t replace_connections(std::span<const Connection> connections);

  // Replaces the whole state (history restore, load). Same contract as the
  // constructor.
  void restore(NetworkState state);

  // Display names of chains by decomposition index.
  void set_chain_name(std::int32_t index, std::string name);
  [[nodiscard]] std::string chain_name(std::int32_t index) const;

  // Readers
  [[nodiscard]] const NetworkState& state() const noexcept { return state_; }
  [[nodiscard]] bool has_city(std::string_view name) const;
  [[nodiscard]] std::optional<GeoPoint> city(std::string_view name) const;
  [[nodiscard]] bool has_connection(std::string_view a, std::string_view b) const;
  [[nodiscard]] std::optional<TransportClass> transport_class(std::string_view a, std::string_view b) const;
  [[nodiscard]] std::optional<Minutes> duration_override(std::string_view a, std::string_view b) const;
  [[nodiscard]] bool is_break(std::string_view a, std::string_view b) const;
  // Cities directly connected to `name`, in connection order.
  [[nodiscard]] std::vector<CityName> neighbors(std::string_view name) const;
  [[nodiscard]] std::size_t num_cities() const noexcept { return state_.cities.size(); }
  [[nodiscard]] std::size_t num_connections() const noexcept { return state_.connections.size(); }

  void add_observer(NetworkObserver* observer);
  void remove_observer(NetworkObserver* observer) noexcept;

private:
  void erase_pair_attributes(const PairKey& key);
  void notify_city(const CityName& city);
  void notify_connection(const PairKey& key);
  void notify_reset();
  void rebuild_index();

  NetworkState state_ {};
  std::set<PairKey> pairs_ {};  // index over state_.connections
  std::vector<NetworkObserver*> observers_ {};
};

} // namespace transitgraph::core
