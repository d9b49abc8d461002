/*
  VersionHistory: bounded linear snapshot history.

  Invariant: versions_ is empty, or position_ < versions_.size() and
  versions_.size() <= capacity_.
*/
#include "transitgraph/core/version_history.hpp"

#include <stdexcept>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

namespace transitgraph::core {

VersionHistory::VersionHistory(HistoryOptions options)
  : capacity_(options.capacity) {
  if (capacity_ == 0) throw std::invalid_argument("history capacity must be >= 1");
}

void VersionHistory::record(const NetworkState& state, std::string description) {
  if (!versions_.empty() && position_ + 1 < versions_.size()) {
    const auto dropped = versions_.size() - position_ - 1;
    versions_.erase(versions_.begin() + static_cast<std::ptrdiff_t>(position_ + 1), versions_.end());
    spdlog::debug("history: discarded {} redo entries", dropped);
  }
  versions_.push_back(Version{
      boost::uuids::to_string(boost::uuids::random_generator()()),
      state,
      std::move(description),
      std::chrono::system_clock::now()});
  while (versions_.size() > capacity_) versions_.pop_front();
  position_ = versions_.size() - 1;
}

Result<Version> VersionHistory::undo() {
  if (!can_undo()) return Status::unavailable("Nothing to undo");
  --position_;
  spdlog::info("undo: '{}'", versions_[position_ + 1].description);
  return versions_[position_];
}

Result<Version> VersionHistory::redo() {
  if (!can_redo()) return Status::unavailable("Nothing to redo");
  ++position_;
  spdlog::info("redo: '{}'", versions_[position_].description);
  return versions_[position_];
}

Result<Version> VersionHistory::current() const {
  if (versions_.empty()) return Status::not_found("history is empty");
  return versions_[position_];
}

void VersionHistory::clear() noexcept {
  versions_.clear();
  position_ = 0;
}

} // namespace transitgraph::core
