/*
  Chain decomposition: iterative edge-visiting DFS.

  The walk keeps an explicit stack of (city, next adjacency slot) frames, so
  depth is bounded by heap memory rather than the call stack. Edges, not
  cities, are marked visited: a city may appear in several chains.

  A break edge ends its chain. When nothing follows it on the walk, it is
  split off the chain it closed instead, so every break separates two chains
  whichever end the walk started from.
*/
#include "transitgraph/core/chain_decomposer.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>

namespace transitgraph::core {

namespace {
struct Arc {
  CityName to;
  std::size_t edge;  // index into the de-duplicated edge list
};

struct Frame {
  CityName city;
  std::size_t next {0};
};
} // namespace

std::vector<Chain> decompose_chains(std::span<const Connection> connections,
                                    const std::set<PairKey>& breaks) {
  // Adjacency in connection order; std::map gives sorted city iteration.
  std::map<CityName, std::vector<Arc>, std::less<>> adj;
  std::vector<PairKey> edge_keys;
  std::set<PairKey> seen;
  for (const auto& c : connections) {
    auto key = c.key();
    if (c.a == c.b || !seen.insert(key).second) continue;
    const std::size_t e = edge_keys.size();
    edge_keys.push_back(std::move(key));
    adj[c.a].push_back(Arc{c.b, e});
    adj[c.b].push_back(Arc{c.a, e});
  }

  std::vector<const CityName*> starts;
  starts.reserve(adj.size());
  for (const auto& [city, arcs] : adj) if (arcs.size() % 2 == 1) starts.push_back(&city);
  for (const auto& [city, arcs] : adj) if (arcs.size() % 2 == 0) starts.push_back(&city);

  std::vector<bool> visited(edge_keys.size(), false);
  std::vector<Chain> chains;
  Chain buffer;
  bool ends_at_break = false;  // buffer.back() is break-marked
  auto emit = [&]() {
    chains.push_back(std::move(buffer));
    buffer.clear();
    ends_at_break = false;
  };
  // Closes a buffer that cannot be extended any further.
  auto flush = [&]() {
    if (buffer.empty()) return;
    if (ends_at_break && buffer.size() > 1) {
      Connection last = std::move(buffer.back());
      buffer.pop_back();
      chains.push_back(std::move(buffer));
      buffer.clear();
      buffer.push_back(std::move(last));
    }
    emit();
  };

  std::vector<Frame> stack;
  for (const CityName* start : starts) {
    stack.push_back(Frame{*start, 0});
    while (!stack.empty()) {
      Frame& top = stack.back();
      const auto& arcs = adj.find(top.city)->second;
      while (top.next < arcs.size() && visited[arcs[top.next].edge]) ++top.next;
      if (top.next == arcs.size()) {
        stack.pop_back();
        continue;
      }
      const Arc& arc = arcs[top.next++];
      visited[arc.edge] = true;
      if (!buffer.empty()) {
        // Backtracked onto a different city: the running chain cannot continue.
        if (buffer.back().b != top.city) flush();
        else if (ends_at_break) emit();
      }
      buffer.push_back(Connection{top.city, arc.to});
      ends_at_break = breaks.contains(edge_keys[arc.edge]);
      CityName next = arc.to;  // `top` is invalidated by push_back
      stack.push_back(Frame{std::move(next), 0});
    }
    flush();
  }
  return chains;
}

std::vector<Chain> decompose_chains(const NetworkState& state) {
  return decompose_chains(state.connections, state.daybreaks);
}

} // namespace transitgraph::core
