/* RouteWorkspace: one network with its estimator, history and branch DAG. */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "transitgraph/core/branch_manager.hpp"
#include "transitgraph/core/error.hpp"
#include "transitgraph/core/network_store.hpp"
#include "transitgraph/core/options.hpp"
#include "transitgraph/core/travel_time.hpp"
#include "transitgraph/core/types.hpp"
#include "transitgraph/core/version_history.hpp"

namespace transitgraph::core {

// Entry point for UI collaborators. Every successful mutation records a
// version; undo()/redo() restore network state (branches are not versioned).
// Single-threaded: callers serialize access.
class RouteWorkspace {
public:
  // Throws std::invalid_argument for invalid options or an invalid initial state.
  explicit RouteWorkspace(CoreOptions options = {}, NetworkState initial = {});
  RouteWorkspace(const RouteWorkspace&) = delete;
  RouteWorkspace& operator=(const RouteWorkspace&) = delete;
  ~RouteWorkspace() noexcept;

  // Network mutations
  Status add_city(const CityName& name, GeoPoint at);
  Status update_city_coordinates(std::string_view name, GeoPoint at);
  Status remove_city(std::string_view name);
  // Drops the built-in sample cities (and their connections) if present.
  Status remove_default_cities();
  Status add_connection(std::string_view a, std::string_view b,
                        std::optional<TransportClass> cls = std::nullopt);
  Status remove_connection(std::string_view a, std::string_view b);
  Status set_transport_class(std::string_view a, std::string_view b, TransportClass cls);
  Status mark_break(std::string_view a, std::string_view b);
  Status unmark_break(std::string_view a, std::string_view b);
  Status set_duration_override(std::string_view a, std::string_view b, Minutes minutes);
  Status clear_duration_override(std::string_view a, std::string_view b);
  Status set_chain_name(std::int32_t index, std::string name);

  // Persistence
  Status load_file(const std::string& path);
  Status save_file(const std::string& path) const;

  // History
  Status undo();
  Status redo();
  [[nodiscard]] bool can_undo() const noexcept { return history_.can_undo(); }
  [[nodiscard]] bool can_redo() const noexcept { return history_.can_redo(); }

  // Queries
  [[nodiscard]] std::vector<Chain> chains() const;
  [[nodiscard]] std::optional<Minutes> travel_minutes(std::string_view a, std::string_view b);
  [[nodiscard]] std::string travel_time_label(std::string_view a, std::string_view b);
  [[nodiscard]] Minutes chain_total_minutes(const Chain& chain);

  [[nodiscard]] const NetworkStore& store() const noexcept { return store_; }
  [[nodiscard]] TravelTimeEstimator& estimator() noexcept { return estimator_; }
  [[nodiscard]] const VersionHistory& history() const noexcept { return history_; }
  [[nodiscard]] BranchManager& branches() noexcept { return branches_; }
  [[nodiscard]] const BranchManager& branches() const noexcept { return branches_; }
  [[nodiscard]] const CoreOptions& options() const noexcept { return options_; }

private:
  // Records a version when `status` is OK; returns `status` unchanged.
  Status commit(Status status, std::string description);

  CoreOptions options_;
  NetworkStore store_;
  TravelTimeEstimator estimator_;
  VersionHistory history_;
  BranchManager branches_;
};

} // namespace transitgraph::core
