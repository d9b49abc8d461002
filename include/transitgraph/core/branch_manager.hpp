/* Branch DAG over connection subsets: split at a junction, merge via a new leg.
 *
 * For Python developers:
 * - std::variant<A, B, C>: tagged union (like a typing.Union checked with std::visit)
 */
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "transitgraph/core/constants.hpp"
#include "transitgraph/core/error.hpp"
#include "transitgraph/core/network_store.hpp"
#include "transitgraph/core/types.hpp"
#include "transitgraph/core/version_history.hpp"

namespace transitgraph::core {

using BranchId = std::string;

// How a branch came to exist.
struct RootLineage {};
struct SplitLineage { BranchId parent; };
struct MergeLineage { BranchId primary; BranchId secondary; };
using Lineage = std::variant<RootLineage, SplitLineage, MergeLineage>;

// A branch is an immutable snapshot of a connection subset. Only
// BranchManager creates branches; after creation only `children` grows.
struct Branch {
  BranchId id;
  std::string name;
  Lineage lineage {};
  std::vector<BranchId> children;
  std::vector<Connection> edges;  // unique by unordered pair
  std::size_t color_index {0};
  LineStyle line_style {LineStyle::Solid};

  [[nodiscard]] bool contains_city(std::string_view city) const;
  // Distinct cities adjacent to `city` within this branch, in edge order.
  [[nodiscard]] std::vector<CityName> connected_cities(std::string_view city) const;
  // Parents in lineage order (primary first); empty for roots.
  [[nodiscard]] std::vector<BranchId> parents() const;
  [[nodiscard]] std::string_view color() const noexcept {
    return kBranchColors[color_index % kBranchColors.size()];
  }
};

struct SplitResult {
  BranchId first;
  BranchId second;
};

// Lineage view for renderers: roots plus parent -> children adjacency. A merge
// result is listed under both of its parents.
struct BranchTree {
  std::vector<BranchId> roots;
  std::map<BranchId, std::vector<BranchId>> children;
};

// BranchManager owns the branch DAG. It mutates the NetworkStore only in
// apply_to_network() and records a version after every structural operation.
// Both references must outlive the manager.
class BranchManager {
public:
  BranchManager(NetworkStore& store, VersionHistory& history);
  BranchManager(const BranchManager&) = delete;
  BranchManager& operator=(const BranchManager&) = delete;

  // Creates one root branch per chain of the current network, named from the
  // store's chain names. The first becomes active. Returns the new ids.
  std::vector<BranchId> initialize_from_chains();

  // Splits a branch at a junction city into two child branches.
  [[nodiscard]] Result<SplitResult> split(const BranchId& branch_id, std::string_view city);

  // Merges two branches plus the new leg (city1, city2) into one child branch.
  [[nodiscard]] Result<BranchId> merge(const BranchId& branch_id1, const BranchId& branch_id2,
                                       std::string_view city1, std::string_view city2);

  // Replaces the network's connections with the branch's edges.
  Status apply_to_network(const BranchId& branch_id);
  Status apply_active();

  Status set_active(const BranchId& branch_id);
  [[nodiscard]] const std::optional<BranchId>& active() const noexcept { return active_; }

  [[nodiscard]] const Branch* find(const BranchId& branch_id) const;
  // Throws RuntimeError for unknown ids (callers validate first).
  [[nodiscard]] const Branch& branch(const BranchId& branch_id) const;
  // Ids in creation order.
  [[nodiscard]] const std::vector<BranchId>& branch_ids() const noexcept { return order_; }
  [[nodiscard]] std::size_t size() const noexcept { return order_.size(); }
  [[nodiscard]] BranchTree tree() const;

private:
  Branch& create_branch(std::string name, Lineage lineage, std::vector<Connection> edges);
  Branch& mutable_branch(const BranchId& branch_id);

  NetworkStore& store_;
  VersionHistory& history_;
  std::unordered_map<BranchId, Branch> branches_ {};
  std::vector<BranchId> order_ {};
  std::optional<BranchId> active_ {};
  std::size_t color_index_ {0};  // grows; palette lookup wraps
  std::size_t style_index_ {0};  // wraps at kLineStyleCount
};

} // namespace transitgraph::core
