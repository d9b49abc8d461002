/*
  Serialization: NetworkState <-> JSON record.

  Layout:
    {"cities": {"<name>": [lon, lat], ...},
     "connections": [["<a>", "<b>"], ...],
     "train_types": [{"from": a, "to": b, "type": "ICE"}, ...],
     "travel_times": [{"from": a, "to": b, "minutes": 30}, ...],
     "daybreaks": [{"from": a, "to": b, "value": true}, ...],
     "route_chain_names": {"0": "North line", ...},
     "zoomed_states": ["Bayern", ...]}
*/
#include "transitgraph/core/serialization.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <limits>
#include <system_error>

#include <spdlog/spdlog.h>

#include "transitgraph/core/network_store.hpp"

namespace transitgraph::core {

void to_json(nlohmann::json& dst, const GeoPoint& src) {
  dst = nlohmann::json::array({src.lon, src.lat});
}

void from_json(const nlohmann::json& src, GeoPoint& dst) {
  if (!src.is_array() || src.size() != 2) {
    throw ValueError("coordinate must be [lon, lat]");
  }
  dst.lon = src.at(0).get<double>();
  dst.lat = src.at(1).get<double>();
}

void to_json(nlohmann::json& dst, const Connection& src) {
  dst = nlohmann::json::array({src.a, src.b});
}

void from_json(const nlohmann::json& src, Connection& dst) {
  if (!src.is_array() || src.size() != 2) {
    throw ValueError("connection must be [cityA, cityB]");
  }
  dst.a = src.at(0).get<std::string>();
  dst.b = src.at(1).get<std::string>();
}

namespace {
nlohmann::json pair_entry(const PairKey& key) {
  return nlohmann::json{{"from", key.first}, {"to", key.second}};
}

PairKey read_pair(const nlohmann::json& entry) {
  return PairKey{entry.at("from").get<std::string>(), entry.at("to").get<std::string>()};
}
} // namespace

nlohmann::json state_to_json(const NetworkState& state) {
  nlohmann::json dst;
  dst["cities"] = nlohmann::json::object();
  for (const auto& [name, at] : state.cities) dst["cities"][name] = at;
  dst["connections"] = state.connections;

  auto& types = dst["train_types"] = nlohmann::json::array();
  for (const auto& [key, cls] : state.train_types) {
    auto e = pair_entry(key);
    e["type"] = std::string(transport_class_tag(cls));
    types.push_back(std::move(e));
  }
  auto& times = dst["travel_times"] = nlohmann::json::array();
  for (const auto& [key, minutes] : state.travel_times) {
    auto e = pair_entry(key);
    e["minutes"] = minutes;
    times.push_back(std::move(e));
  }
  auto& breaks = dst["daybreaks"] = nlohmann::json::array();
  for (const auto& key : state.daybreaks) {
    auto e = pair_entry(key);
    e["value"] = true;
    breaks.push_back(std::move(e));
  }
  auto& names = dst["route_chain_names"] = nlohmann::json::object();
  for (const auto& [index, name] : state.route_chain_names) names[std::to_string(index)] = name;
  dst["zoomed_states"] = state.zoomed_states;
  return dst;
}

Result<NetworkState> state_from_json(const nlohmann::json& src) {
  if (!src.is_object()) return Status::invalid_input("state must be a JSON object");
  NetworkState out;
  try {
    for (const auto& [name, at] : src.at("cities").items()) {
      out.cities.emplace(name, at.get<GeoPoint>());
    }
    out.connections = src.at("connections").get<std::vector<Connection>>();
    if (src.contains("train_types")) {
      for (const auto& e : src.at("train_types")) {
        auto tag = e.at("type").get<std::string>();
        auto cls = parse_transport_class(tag);
        if (!cls) return Status::invalid_input("unknown train type '" + tag + "'");
        out.train_types[read_pair(e)] = *cls;
      }
    }
    if (src.contains("travel_times")) {
      for (const auto& e : src.at("travel_times")) {
        const auto minutes = e.at("minutes").get<std::int64_t>();
        if (minutes < 1 || minutes > std::numeric_limits<Minutes>::max()) {
          return Status::invalid_input("travel time " + std::to_string(minutes) + " is out of range");
        }
        out.travel_times[read_pair(e)] = static_cast<Minutes>(minutes);
      }
    }
    if (src.contains("daybreaks")) {
      for (const auto& e : src.at("daybreaks")) {
        if (e.value("value", true)) out.daybreaks.insert(read_pair(e));
      }
    }
    if (src.contains("route_chain_names")) {
      for (const auto& [index_text, name] : src.at("route_chain_names").items()) {
        std::int32_t index = 0;
        auto [ptr, ec] = std::from_chars(index_text.data(), index_text.data() + index_text.size(), index);
        if (ec != std::errc{} || ptr != index_text.data() + index_text.size() || index < 0) {
          return Status::invalid_input("route chain index '" + index_text + "' is not a number");
        }
        out.route_chain_names[index] = name.get<std::string>();
      }
    }
    if (src.contains("zoomed_states")) {
      out.zoomed_states = src.at("zoomed_states").get<std::vector<std::string>>();
    }
  } catch (const nlohmann::json::exception& e) {
    return Status::invalid_input(std::string("malformed state: ") + e.what());
  } catch (const ValueError& e) {
    return Status::invalid_input(std::string("malformed state: ") + e.what());
  }
  auto st = validate_state(out);
  if (!st) return st;
  return out;
}

Status save_state(const NetworkState& state, const std::string& path) {
  std::ofstream out(path);
  if (!out) return Status::unavailable("Failed to save routes: cannot open " + path);
  out << state_to_json(state).dump(2);
  if (!out) return Status::unavailable("Failed to save routes: write error on " + path);
  spdlog::info("saved {} cities and {} connections to {}", state.cities.size(), state.connections.size(), path);
  return Status::ok();
}

Result<NetworkState> load_state(const std::string& path) {
  std::ifstream in(path);
  if (!in) return Status::unavailable("Failed to load routes: cannot open " + path);
  nlohmann::json doc = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) return Status::invalid_input("Failed to load routes: invalid JSON in " + path);
  auto result = state_from_json(doc);
  if (result) {
    spdlog::info("loaded {} cities and {} connections from {}",
                 result.value().cities.size(), result.value().connections.size(), path);
  } else {
    spdlog::warn("rejected state file {}: {}", path, result.status().to_string());
  }
  return result;
}

} // namespace transitgraph::core
