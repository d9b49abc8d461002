/*
  NetworkStore: validated mutations over NetworkState.

  Every mutation that can change a cached travel time notifies observers:
  city moves/removals per city, connection edits per unordered pair, and
  whole-state replacement as a reset.
*/
#include "transitgraph/core/network_store.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace transitgraph::core {

namespace {
PairKey make_key(std::string_view a, std::string_view b) {
  return PairKey{CityName(a), CityName(b)};
}
} // namespace

Status validate_state(const NetworkState& state) {
  std::set<PairKey> seen;
  for (const auto& c : state.connections) {
    if (c.a == c.b) {
      return Status::invalid_input("connection connects '" + c.a + "' to itself");
    }
    if (!state.cities.contains(c.a) || !state.cities.contains(c.b)) {
      return Status::invalid_input("connection " + c.a + " - " + c.b + " references an unknown city");
    }
    if (!seen.insert(c.key()).second) {
      return Status::invalid_input("duplicate connection " + c.a + " - " + c.b);
    }
  }
  for (const auto& [key, minutes] : state.travel_times) {
    if (minutes <= 0) {
      return Status::invalid_input("travel time for " + key.first + " - " + key.second + " must be > 0");
    }
    if (!seen.contains(key)) {
      return Status::invalid_input("travel time for missing connection " + key.first + " - " + key.second);
    }
  }
  for (const auto& [key, cls] : state.train_types) {
    (void)cls;
    if (!seen.contains(key)) {
      return Status::invalid_input("train type for missing connection " + key.first + " - " + key.second);
    }
  }
  return Status::ok();
}

NetworkStore::NetworkStore(NetworkState state) {
  restore(std::move(state));
}

void NetworkStore::add_city(const CityName& name, GeoPoint at) {
  state_.cities.insert_or_assign(name, at);
  notify_city(name);
}

Status NetworkStore::update_city_coordinates(std::string_view name, GeoPoint at) {
  auto it = state_.cities.find(name);
  if (it == state_.cities.end()) {
    return Status::not_found("city '" + CityName(name) + "' does not exist");
  }
  it->second = at;
  notify_city(it->first);
  return Status::ok();
}

Status NetworkStore::remove_city(std::string_view name) {
  auto it = state_.cities.find(name);
  if (it == state_.cities.end()) {
    return Status::not_found("city '" + CityName(name) + "' does not exist");
  }
  const CityName removed = it->first;
  state_.cities.erase(it);

  // Split connections into incident (dropped) and kept, remembering the
  // removed city's neighbours in connection order.
  std::vector<CityName> former_neighbors;
  std::vector<Connection> kept;
  kept.reserve(state_.connections.size());
  for (auto& c : state_.connections) {
    if (c.touches(removed)) {
      former_neighbors.push_back(c.a == removed ? c.b : c.a);
      auto key = c.key();
      pairs_.erase(key);
      erase_pair_attributes(key);
      notify_connection(key);
    } else {
      kept.push_back(std::move(c));
    }
  }
  state_.connections = std::move(kept);

  // Star-to-clique repair among the former neighbours.
  std::size_t added = 0;
  for (std::size_t i = 0; i < former_neighbors.size(); ++i) {
    for (std::size_t j = i + 1; j < former_neighbors.size(); ++j) {
      const auto& x = former_neighbors[i];
      const auto& y = former_neighbors[j];
      if (x == y) continue;
      auto key = make_key(x, y);
      if (pairs_.insert(key).second) {
        state_.connections.push_back(Connection{x, y});
        notify_connection(key);
        ++added;
      }
    }
  }
  notify_city(removed);
  spdlog::info("removed city '{}' ({} connections dropped, {} reconnected)",
               removed, former_neighbors.size(), added);
  return Status::ok();
}

std::size_t NetworkStore::remove_cities(std::span<const CityName> names) {
  std::size_t removed = 0;
  for (const auto& name : names) {
    if (state_.cities.erase(name) == 0) continue;
    ++removed;
    std::erase_if(state_.connections, [&](const Connection& c) {
      if (!c.touches(name)) return false;
      auto key = c.key();
      pairs_.erase(key);
      erase_pair_attributes(key);
      notify_connection(key);
      return true;
    });
    notify_city(name);
  }
  return removed;
}

Status NetworkStore::add_connection(std::string_view a, std::string_view b,
                                    std::optional<TransportClass> cls) {
  if (a == b) {
    spdlog::debug("rejected self-loop connection at '{}'", a);
    return Status::invalid_input("a city cannot be connected to itself");
  }
  if (!has_city(a)) return Status::not_found("city '" + CityName(a) + "' does not exist");
  if (!has_city(b)) return Status::not_found("city '" + CityName(b) + "' does not exist");
  auto key = make_key(a, b);
  if (pairs_.contains(key)) {
    spdlog::debug("rejected duplicate connection {} - {}", a, b);
    return Status::duplicate("connection between " + CityName(a) + " and " + CityName(b) + " already exists");
  }
  pairs_.insert(key);
  state_.connections.push_back(Connection{CityName(a), CityName(b)});
  if (cls) state_.train_types[key] = *cls;
  notify_connection(key);
  return Status::ok();
}

Status NetworkStore::remove_connection(std::string_view a, std::string_view b) {
  auto key = make_key(a, b);
  if (!pairs_.contains(key)) {
    return Status::not_found("no connection between " + CityName(a) + " and " + CityName(b));
  }
  std::erase_if(state_.connections, [&](const Connection& c) { return c.key() == key; });
  pairs_.erase(key);
  erase_pair_attributes(key);
  notify_connection(key);
  return Status::ok();
}

Status NetworkStore::set_transport_class(std::string_view a, std::string_view b, TransportClass cls) {
  auto key = make_key(a, b);
  if (!pairs_.contains(key)) {
    return Status::not_found("no connection between " + CityName(a) + " and " + CityName(b));
  }
  state_.train_types[key] = cls;
  notify_connection(key);
  return Status::ok();
}

void NetworkStore::mark_break(std::string_view a, std::string_view b) {
  auto key = make_key(a, b);
  if (state_.daybreaks.insert(key).second) notify_connection(key);
}

void NetworkStore::unmark_break(std::string_view a, std::string_view b) {
  auto key = make_key(a, b);
  if (state_.daybreaks.erase(key) > 0) notify_connection(key);
}

Status NetworkStore::set_duration_override(std::string_view a, std::string_view b, Minutes minutes) {
  if (minutes <= 0) {
    return Status::invalid_input("travel time must be a positive number of minutes");
  }
  auto key = make_key(a, b);
  if (!pairs_.contains(key)) {
    return Status::invalid_input("no connection between " + CityName(a) + " and " + CityName(b));
  }
  state_.travel_times[key] = minutes;
  notify_connection(key);
  return Status::ok();
}

void NetworkStore::clear_duration_override(std::string_view a, std::string_view b) {
  auto key = make_key(a, b);
  if (state_.travel_times.erase(key) > 0) notify_connection(key);
}

std::size_t NetworkStore::replace_connections(std::span<const Connection> connections) {
  std::vector<Connection> next;
  std::set<PairKey> next_pairs;
  next.reserve(connections.size());
  for (const auto& c : connections) {
    if (c.a == c.b) continue;
    if (!has_city(c.a) || !has_city(c.b)) {
      spdlog::warn("skipping connection {} - {}: unknown city", c.a, c.b);
      continue;
    }
    if (!next_pairs.insert(c.key()).second) continue;
    next.push_back(c);
  }
  // Drop attributes that no longer belong to a connection.
  for (const auto& key : pairs_) {
    if (!next_pairs.contains(key)) {
      erase_pair_attributes(key);
    }
  }
  state_.connections = std::move(next);
  pairs_ = std::move(next_pairs);
  notify_reset();
  return state_.connections.size();
}

void NetworkStore::restore(NetworkState state) {
  auto st = validate_state(state);
  if (!st) throw std::invalid_argument("NetworkStore: " + st.to_string());
  state_ = std::move(state);
  rebuild_index();
  notify_reset();
}

void NetworkStore::set_chain_name(std::int32_t index, std::string name) {
  state_.route_chain_names[index] = std::move(name);
}

std::string NetworkStore::chain_name(std::int32_t index) const {
  auto it = state_.route_chain_names.find(index);
  if (it != state_.route_chain_names.end()) return it->second;
  return "Route " + std::to_string(index + 1);
}

bool NetworkStore::has_city(std::string_view name) const {
  return state_.cities.find(name) != state_.cities.end();
}

std::optional<GeoPoint> NetworkStore::city(std::string_view name) const {
  auto it = state_.cities.find(name);
  if (it == state_.cities.end()) return std::nullopt;
  return it->second;
}

bool NetworkStore::has_connection(std::string_view a, std::string_view b) const {
  return pairs_.contains(make_key(a, b));
}

std::optional<TransportClass> NetworkStore::transport_class(std::string_view a, std::string_view b) const {
  auto it = state_.train_types.find(make_key(a, b));
  if (it == state_.train_types.end()) return std::nullopt;
  return it->second;
}

std::optional<Minutes> NetworkStore::duration_override(std::string_view a, std::string_view b) const {
  auto it = state_.travel_times.find(make_key(a, b));
  if (it == state_.travel_times.end()) return std::nullopt;
  return it->second;
}

bool NetworkStore::is_break(std::string_view a, std::string_view b) const {
  return state_.daybreaks.contains(make_key(a, b));
}

std::vector<CityName> NetworkStore::neighbors(std::string_view name) const {
  std::vector<CityName> out;
  for (const auto& c : state_.connections) {
    if (c.a == name) out.push_back(c.b);
    else if (c.b == name) out.push_back(c.a);
  }
  return out;
}

void NetworkStore::add_observer(NetworkObserver* observer) {
  if (observer == nullptr) throw std::invalid_argument("add_observer: observer must not be null");
  if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
    observers_.push_back(observer);
  }
}

void NetworkStore::remove_observer(NetworkObserver* observer) noexcept {
  std::erase(observers_, observer);
}

void NetworkStore::erase_pair_attributes(const PairKey& key) {
  state_.train_types.erase(key);
  state_.travel_times.erase(key);
  state_.daybreaks.erase(key);
}

void NetworkStore::notify_city(const CityName& city) {
  for (auto* o : observers_) o->on_city_changed(city);
}

void NetworkStore::notify_connection(const PairKey& key) {
  for (auto* o : observers_) o->on_connection_changed(key);
}

void NetworkStore::notify_reset() {
  for (auto* o : observers_) o->on_state_reset();
}

void NetworkStore::rebuild_index() {
  pairs_.clear();
  for (const auto& c : state_.connections) pairs_.insert(c.key());
}

} // namespace transitgraph::core
