/*
  Status rendering helpers.
*/
#include "transitgraph/core/error.hpp"

namespace transitgraph::core {

std::string_view error_kind_name(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::Ok: return "OK";
    case ErrorKind::InvalidInput: return "InvalidInput";
    case ErrorKind::Duplicate: return "Duplicate";
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::Unavailable: return "Unavailable";
  }
  return "Unknown";
}

std::string Status::to_string() const {
  if (is_ok()) return "OK";
  std::string out(error_kind_name(kind_));
  out += ": ";
  out += message_;
  return out;
}

} // namespace transitgraph::core
