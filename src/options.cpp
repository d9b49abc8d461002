/*
  Options: JSON configuration loading and logging setup.

  Validation mirrors the constructors that consume the options: anything a
  constructor would reject is reported here as InvalidInput instead.
*/
#include "transitgraph/core/options.hpp"

#include <cstdint>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace transitgraph::core {

namespace {
Status read_estimator(const nlohmann::json& src, EstimatorOptions& dst) {
  if (!src.is_object()) return Status::invalid_input("estimator options must be an object");
  if (src.contains("reference_speed_kmh")) {
    dst.reference_speed_kmh = src.at("reference_speed_kmh").get<double>();
    if (!(dst.reference_speed_kmh > 0.0)) {
      return Status::invalid_input("reference_speed_kmh must be > 0");
    }
  }
  if (src.contains("default_terrain_factor")) {
    dst.default_terrain_factor = src.at("default_terrain_factor").get<double>();
    if (!(dst.default_terrain_factor >= 1.0)) {
      return Status::invalid_input("default_terrain_factor must be >= 1.0");
    }
  }
  if (src.contains("default_class")) {
    auto tag = src.at("default_class").get<std::string>();
    auto cls = parse_transport_class(tag);
    if (!cls) return Status::invalid_input("unknown transport class '" + tag + "'");
    dst.default_class = *cls;
  }
  if (src.contains("cache_enabled")) {
    dst.cache_enabled = src.at("cache_enabled").get<bool>();
  }
  return Status::ok();
}
} // namespace

Result<CoreOptions> options_from_json(const nlohmann::json& src) {
  if (!src.is_object()) return Status::invalid_input("options must be a JSON object");
  CoreOptions out;
  try {
    if (src.contains("estimator")) {
      auto st = read_estimator(src.at("estimator"), out.estimator);
      if (!st) return st;
    }
    if (src.contains("history")) {
      const auto& h = src.at("history");
      if (h.contains("capacity")) {
        auto cap = h.at("capacity").get<std::int64_t>();
        if (cap <= 0) return Status::invalid_input("history capacity must be >= 1");
        out.history.capacity = static_cast<std::size_t>(cap);
      }
    }
    if (src.contains("log_level")) {
      out.log_level = src.at("log_level").get<std::string>();
      if (spdlog::level::from_str(out.log_level) == spdlog::level::off && out.log_level != "off") {
        return Status::invalid_input("unknown log level '" + out.log_level + "'");
      }
    }
  } catch (const nlohmann::json::exception& e) {
    return Status::invalid_input(std::string("malformed options: ") + e.what());
  }
  return out;
}

Result<CoreOptions> load_options(const std::string& path) {
  std::ifstream in(path);
  if (!in) return Status::unavailable("cannot open options file " + path);
  nlohmann::json doc = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) return Status::invalid_input("options file is not valid JSON: " + path);
  return options_from_json(doc);
}

Status configure_logging(const CoreOptions& options) {
  auto level = spdlog::level::from_str(options.log_level);
  if (level == spdlog::level::off && options.log_level != "off") {
    return Status::invalid_input("unknown log level '" + options.log_level + "'");
  }
  spdlog::set_level(level);
  return Status::ok();
}

} // namespace transitgraph::core
