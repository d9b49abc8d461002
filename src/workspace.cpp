/*
  RouteWorkspace: wiring of store, estimator cache, history and branches.
*/
#include "transitgraph/core/workspace.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "transitgraph/core/chain_decomposer.hpp"
#include "transitgraph/core/default_network.hpp"
#include "transitgraph/core/serialization.hpp"

namespace transitgraph::core {

RouteWorkspace::RouteWorkspace(CoreOptions options, NetworkState initial)
  : options_(std::move(options)),
    store_(std::move(initial)),
    estimator_(options_.estimator),
    history_(options_.history),
    branches_(store_, history_) {
  auto st = configure_logging(options_);
  if (!st) throw std::invalid_argument(st.to_string());
  store_.add_observer(&estimator_);
  history_.record(store_.state(), "Initial state");
  branches_.initialize_from_chains();
}

RouteWorkspace::~RouteWorkspace() noexcept {
  store_.remove_observer(&estimator_);
}

Status RouteWorkspace::add_city(const CityName& name, GeoPoint at) {
  store_.add_city(name, at);
  return commit(Status::ok(), "Added city " + name);
}

Status RouteWorkspace::update_city_coordinates(std::string_view name, GeoPoint at) {
  return commit(store_.update_city_coordinates(name, at), "Moved city " + CityName(name));
}

Status RouteWorkspace::remove_city(std::string_view name) {
  return commit(store_.remove_city(name), "Removed city " + CityName(name));
}

Status RouteWorkspace::remove_default_cities() {
  const auto removed = store_.remove_cities(default_city_names());
  if (removed == 0) return Status::ok();
  return commit(Status::ok(), "Removed default cities");
}

Status RouteWorkspace::add_connection(std::string_view a, std::string_view b,
                                      std::optional<TransportClass> cls) {
  return commit(store_.add_connection(a, b, cls),
                "Added connection " + CityName(a) + " - " + CityName(b));
}

Status RouteWorkspace::remove_connection(std::string_view a, std::string_view b) {
  return commit(store_.remove_connection(a, b),
                "Removed connection " + CityName(a) + " - " + CityName(b));
}

Status RouteWorkspace::set_transport_class(std::string_view a, std::string_view b, TransportClass cls) {
  return commit(store_.set_transport_class(a, b, cls),
                "Set train type " + std::string(transport_class_tag(cls)) + " on " +
                    CityName(a) + " - " + CityName(b));
}

Status RouteWorkspace::mark_break(std::string_view a, std::string_view b) {
  if (store_.is_break(a, b)) return Status::ok();
  store_.mark_break(a, b);
  return commit(Status::ok(), "Marked daybreak " + CityName(a) + " - " + CityName(b));
}

Status RouteWorkspace::unmark_break(std::string_view a, std::string_view b) {
  if (!store_.is_break(a, b)) return Status::ok();
  store_.unmark_break(a, b);
  return commit(Status::ok(), "Cleared daybreak " + CityName(a) + " - " + CityName(b));
}

Status RouteWorkspace::set_duration_override(std::string_view a, std::string_view b, Minutes minutes) {
  return commit(store_.set_duration_override(a, b, minutes),
                "Set travel time " + CityName(a) + " - " + CityName(b));
}

Status RouteWorkspace::clear_duration_override(std::string_view a, std::string_view b) {
  if (!store_.duration_override(a, b)) return Status::ok();
  store_.clear_duration_override(a, b);
  return commit(Status::ok(), "Cleared travel time " + CityName(a) + " - " + CityName(b));
}

Status RouteWorkspace::set_chain_name(std::int32_t index, std::string name) {
  if (index < 0) return Status::invalid_input("chain index must be >= 0");
  std::string description = "Renamed route " + std::to_string(index + 1) + " to " + name;
  store_.set_chain_name(index, std::move(name));
  return commit(Status::ok(), std::move(description));
}

Status RouteWorkspace::load_file(const std::string& path) {
  auto loaded = load_state(path);
  if (!loaded) return loaded.status();
  store_.restore(std::move(loaded).value());
  return commit(Status::ok(), "Loaded routes from " + path);
}

Status RouteWorkspace::save_file(const std::string& path) const {
  return save_state(store_.state(), path);
}

Status RouteWorkspace::undo() {
  auto version = history_.undo();
  if (!version) return version.status();
  store_.restore(std::move(version).value().state);
  return Status::ok();
}

Status RouteWorkspace::redo() {
  auto version = history_.redo();
  if (!version) return version.status();
  store_.restore(std::move(version).value().state);
  return Status::ok();
}

std::vector<Chain> RouteWorkspace::chains() const {
  return decompose_chains(store_.state());
}

std::optional<Minutes> RouteWorkspace::travel_minutes(std::string_view a, std::string_view b) {
  return estimator_.travel_minutes(store_, a, b);
}

std::string RouteWorkspace::travel_time_label(std::string_view a, std::string_view b) {
  return estimator_.travel_time_label(store_, a, b);
}

Minutes RouteWorkspace::chain_total_minutes(const Chain& chain) {
  return estimator_.chain_total_minutes(store_, chain);
}

Status RouteWorkspace::commit(Status status, std::string description) {
  if (!status) {
    spdlog::debug("rejected: {} ({})", description, status.to_string());
    return status;
  }
  history_.record(store_.state(), std::move(description));
  return status;
}

} // namespace transitgraph::core
