/*
  BranchManager: split/merge over branch edge snapshots.

  Split removes the junction city, finds the connected components reachable
  from its neighbours (iterative BFS), and distributes edges: the first
  component's edges go to the "-A" child, every other edge to the "-B" child.
  Merge takes the pair-unique union of both parents plus the connecting leg.
*/
#include "transitgraph/core/branch_manager.hpp"

#include <algorithm>
#include <queue>
#include <set>
#include <type_traits>
#include <utility>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

#include "transitgraph/core/chain_decomposer.hpp"

namespace transitgraph::core {

namespace {
BranchId new_branch_id() {
  static thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

// Appends `c` unless its unordered pair is already present.
void add_unique(std::vector<Connection>& edges, std::set<PairKey>& keys, const Connection& c) {
  if (keys.insert(c.key()).second) edges.push_back(c);
}

constexpr int kUnassigned = -1;
} // namespace

bool Branch::contains_city(std::string_view city) const {
  return std::any_of(edges.begin(), edges.end(), [&](const Connection& c) { return c.touches(city); });
}

std::vector<CityName> Branch::connected_cities(std::string_view city) const {
  std::vector<CityName> out;
  for (const auto& c : edges) {
    const CityName* other = nullptr;
    if (c.a == city) other = &c.b;
    else if (c.b == city) other = &c.a;
    if (other && std::find(out.begin(), out.end(), *other) == out.end()) out.push_back(*other);
  }
  return out;
}

std::vector<BranchId> Branch::parents() const {
  return std::visit([](const auto& l) -> std::vector<BranchId> {
    using L = std::decay_t<decltype(l)>;
    if constexpr (std::is_same_v<L, SplitLineage>) return {l.parent};
    else if constexpr (std::is_same_v<L, MergeLineage>) return {l.primary, l.secondary};
    else return {};
  }, lineage);
}

BranchManager::BranchManager(NetworkStore& store, VersionHistory& history)
  : store_(store), history_(history) {}

std::vector<BranchId> BranchManager::initialize_from_chains() {
  auto chains = decompose_chains(store_.state());
  std::vector<BranchId> ids;
  ids.reserve(chains.size());
  for (std::size_t i = 0; i < chains.size(); ++i) {
    auto& b = create_branch(store_.chain_name(static_cast<std::int32_t>(i)), RootLineage{}, std::move(chains[i]));
    ids.push_back(b.id);
    if (i == 0) active_ = b.id;
  }
  spdlog::info("initialized {} branches from route chains", ids.size());
  return ids;
}

Result<SplitResult> BranchManager::split(const BranchId& branch_id, std::string_view city) {
  auto it = branches_.find(branch_id);
  if (it == branches_.end()) return Status::not_found("Invalid branch '" + branch_id + "'");
  const Branch& parent = it->second;

  if (!parent.contains_city(city)) {
    return Status::invalid_input("City " + CityName(city) + " not found in branch " + parent.name);
  }
  const auto neighbours = parent.connected_cities(city);
  if (neighbours.size() < 2) {
    return Status::invalid_input("City " + CityName(city) +
                                 " is not a valid split point (need at least 2 connections)");
  }

  // Adjacency of the branch with `city` removed.
  std::map<CityName, std::vector<CityName>, std::less<>> adj;
  for (const auto& c : parent.edges) {
    if (c.touches(city)) continue;
    adj[c.a].push_back(c.b);
    adj[c.b].push_back(c.a);
  }

  std::map<CityName, int, std::less<>> component_of;
  int components = 0;
  for (const auto& start : neighbours) {
    if (component_of.contains(start)) continue;
    const int comp = components++;
    std::queue<CityName> frontier;
    frontier.push(start);
    component_of[start] = comp;
    while (!frontier.empty()) {
      CityName u = std::move(frontier.front());
      frontier.pop();
      auto a = adj.find(u);
      if (a == adj.end()) continue;
      for (const auto& v : a->second) {
        if (component_of.emplace(v, comp).second) frontier.push(v);
      }
    }
  }
  if (components < 2) {
    return Status::invalid_input("Cannot split at this city - would not create separate branches");
  }

  auto component = [&](const CityName& c) {
    auto f = component_of.find(c);
    return f == component_of.end() ? kUnassigned : f->second;
  };
  std::vector<Connection> first_edges;
  std::vector<Connection> second_edges;
  for (const auto& c : parent.edges) {
    const CityName& probe = (c.a == city) ? c.b : c.a;
    (component(probe) == 0 ? first_edges : second_edges).push_back(c);
  }

  const std::string parent_name = parent.name;
  const BranchId parent_id = parent.id;
  auto& first = create_branch(parent_name + "-A", SplitLineage{parent_id}, std::move(first_edges));
  auto& second = create_branch(parent_name + "-B", SplitLineage{parent_id}, std::move(second_edges));
  auto& parent_mut = mutable_branch(parent_id);
  parent_mut.children.push_back(first.id);
  parent_mut.children.push_back(second.id);
  active_ = first.id;

  history_.record(store_.state(), "Split route at " + CityName(city));
  spdlog::info("split branch '{}' at '{}' into '{}' ({} edges) and '{}' ({} edges)",
               parent_name, city, first.name, first.edges.size(), second.name, second.edges.size());
  return SplitResult{first.id, second.id};
}

Result<BranchId> BranchManager::merge(const BranchId& branch_id1, const BranchId& branch_id2,
                                      std::string_view city1, std::string_view city2) {
  const Branch* b1 = find(branch_id1);
  const Branch* b2 = find(branch_id2);
  if (b1 == nullptr || b2 == nullptr) return Status::not_found("Invalid branch(es)");
  if (!b1->contains_city(city1)) {
    return Status::invalid_input("City " + CityName(city1) + " not found in branch " + b1->name);
  }
  if (!b2->contains_city(city2)) {
    return Status::invalid_input("City " + CityName(city2) + " not found in branch " + b2->name);
  }
  if (city1 == city2) {
    return Status::invalid_input("a city cannot be connected to itself");
  }

  std::vector<Connection> edges;
  std::set<PairKey> keys;
  edges.reserve(b1->edges.size() + b2->edges.size() + 1);
  for (const auto& c : b1->edges) add_unique(edges, keys, c);
  for (const auto& c : b2->edges) add_unique(edges, keys, c);
  add_unique(edges, keys, Connection{CityName(city1), CityName(city2)});

  const std::string name1 = b1->name;
  const std::string name2 = b2->name;
  auto& merged = create_branch(name1 + "-" + name2 + "-merged",
                               MergeLineage{branch_id1, branch_id2}, std::move(edges));
  mutable_branch(branch_id1).children.push_back(merged.id);
  if (branch_id2 != branch_id1) mutable_branch(branch_id2).children.push_back(merged.id);
  active_ = merged.id;

  history_.record(store_.state(), "Merged " + name1 + " and " + name2);
  spdlog::info("merged '{}' and '{}' via {} - {} into '{}' ({} edges)",
               name1, name2, city1, city2, merged.name, merged.edges.size());
  return merged.id;
}

Status BranchManager::apply_to_network(const BranchId& branch_id) {
  const Branch* b = find(branch_id);
  if (b == nullptr) return Status::invalid_input("Invalid branch '" + branch_id + "'");
  const auto kept = store_.replace_connections(b->edges);
  if (kept != b->edges.size()) {
    spdlog::warn("applied branch '{}': {} of {} edges kept", b->name, kept, b->edges.size());
  }
  history_.record(store_.state(), "Applied branch " + b->name);
  spdlog::info("applied branch '{}' to network ({} connections)", b->name, kept);
  return Status::ok();
}

Status BranchManager::apply_active() {
  if (!active_) return Status::invalid_input("No active branch selected");
  return apply_to_network(*active_);
}

Status BranchManager::set_active(const BranchId& branch_id) {
  if (find(branch_id) == nullptr) return Status::not_found("Invalid branch '" + branch_id + "'");
  active_ = branch_id;
  return Status::ok();
}

const Branch* BranchManager::find(const BranchId& branch_id) const {
  auto it = branches_.find(branch_id);
  return it == branches_.end() ? nullptr : &it->second;
}

const Branch& BranchManager::branch(const BranchId& branch_id) const {
  const Branch* b = find(branch_id);
  if (b == nullptr) throw RuntimeError("unknown branch id '" + branch_id + "'");
  return *b;
}

BranchTree BranchManager::tree() const {
  BranchTree out;
  for (const auto& id : order_) {
    const Branch& b = branches_.at(id);
    if (std::holds_alternative<RootLineage>(b.lineage)) out.roots.push_back(id);
    if (!b.children.empty()) out.children[id] = b.children;
  }
  return out;
}

Branch& BranchManager::create_branch(std::string name, Lineage lineage, std::vector<Connection> edges) {
  Branch b;
  b.id = new_branch_id();
  b.name = std::move(name);
  b.lineage = std::move(lineage);
  b.edges = std::move(edges);
  b.color_index = color_index_++;
  b.line_style = static_cast<LineStyle>(style_index_);
  style_index_ = (style_index_ + 1) % kLineStyleCount;
  const BranchId id = b.id;
  order_.push_back(id);
  return branches_.emplace(id, std::move(b)).first->second;
}

Branch& BranchManager::mutable_branch(const BranchId& branch_id) {
  auto it = branches_.find(branch_id);
  if (it == branches_.end()) throw RuntimeError("unknown branch id '" + branch_id + "'");
  return it->second;
}

} // namespace transitgraph::core
