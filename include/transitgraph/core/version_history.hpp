/* Linear undo/redo history of immutable NetworkState snapshots. */
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

#include "transitgraph/core/error.hpp"
#include "transitgraph/core/options.hpp"
#include "transitgraph/core/types.hpp"

namespace transitgraph::core {

struct Version {
  std::string id;
  NetworkState state;
  std::string description;
  std::chrono::system_clock::time_point created_at;
};

// VersionHistory keeps at most `capacity` versions and a cursor to the current
// one. Recording after an undo discards every version past the cursor.
class VersionHistory {
public:
  // Throws std::invalid_argument when capacity == 0.
  explicit VersionHistory(HistoryOptions options = {});

  // Deep-copies `state` as the new current version.
  void record(const NetworkState& state, std::string description);

  [[nodiscard]] bool can_undo() const noexcept { return !versions_.empty() && position_ > 0; }
  [[nodiscard]] bool can_redo() const noexcept { return !versions_.empty() && position_ + 1 < versions_.size(); }

  // Move the cursor and return the version it lands on; Unavailable when the
  // cursor is already at the oldest / newest retained version.
  [[nodiscard]] Result<Version> undo();
  [[nodiscard]] Result<Version> redo();

  // Current version; NotFound if nothing has been recorded.
  [[nodiscard]] Result<Version> current() const;

  [[nodiscard]] std::size_t size() const noexcept { return versions_.size(); }
  [[nodiscard]] std::size_t position() const noexcept { return position_; }
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  [[nodiscard]] const std::deque<Version>& versions() const noexcept { return versions_; }

  void clear() noexcept;

private:
  std::size_t capacity_;
  std::deque<Version> versions_ {};
  std::size_t position_ {0};
};

} // namespace transitgraph::core
