/* Decomposition of the connection set into maximal chains split at break markers. */
#pragma once

#include <set>
#include <span>
#include <vector>

#include "transitgraph/core/types.hpp"

namespace transitgraph::core {

// Partition `connections` into chains. Every connection appears in exactly one
// chain, oriented along the walk. A chain ends after a break-marked connection,
// or when the walk backtracks to a city that is not the end of the current
// chain. Walks start at odd-degree cities first, then at the remaining cities,
// each group in lexicographic order, so the output is deterministic for a given
// connection list. Cities without connections produce no chain. Repeated pairs
// in the input are counted once.
[[nodiscard]] std::vector<Chain> decompose_chains(std::span<const Connection> connections,
                                                  const std::set<PairKey>& breaks);

// Convenience overload over a full state (connections + daybreaks).
[[nodiscard]] std::vector<Chain> decompose_chains(const NetworkState& state);

} // namespace transitgraph::core
