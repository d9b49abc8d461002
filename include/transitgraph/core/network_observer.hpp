/* Observer interface for NetworkStore mutations (cache invalidation hooks). */
#pragma once

#include "transitgraph/core/types.hpp"

namespace transitgraph::core {

class NetworkObserver {
public:
  virtual ~NetworkObserver() noexcept = default;

  // A city was added, moved or removed.
  virtual void on_city_changed(const CityName& city) = 0;
  // A connection was added/removed or its class, override or break changed.
  virtual void on_connection_changed(const PairKey& pair) = 0;
  // The whole state was replaced (restore from history, load, apply branch).
  virtual void on_state_reset() = 0;
};

} // namespace transitgraph::core
