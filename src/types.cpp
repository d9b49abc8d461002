/*
  Transport class tags. Tags are the short German service names used by the
  persisted `train_types` map.
*/
#include "transitgraph/core/types.hpp"

namespace transitgraph::core {

std::string_view transport_class_tag(TransportClass cls) noexcept {
  switch (cls) {
    case TransportClass::HighSpeed: return "ICE";
    case TransportClass::InterCity: return "IC";
    case TransportClass::RegionalExpress: return "RE";
    case TransportClass::Regional: return "RB";
    case TransportClass::Suburban: return "S";
  }
  return "RE";
}

std::optional<TransportClass> parse_transport_class(std::string_view tag) noexcept {
  if (tag == "ICE") return TransportClass::HighSpeed;
  if (tag == "IC") return TransportClass::InterCity;
  if (tag == "RE") return TransportClass::RegionalExpress;
  if (tag == "RB") return TransportClass::Regional;
  if (tag == "S") return TransportClass::Suburban;
  return std::nullopt;
}

} // namespace transitgraph::core
