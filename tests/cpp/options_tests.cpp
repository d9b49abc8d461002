#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "transitgraph/core/options.hpp"

using namespace transitgraph::core;
using nlohmann::json;

TEST(Options, EmptyObjectGivesDefaults) {
  auto r = options_from_json(json::object());
  ASSERT_TRUE(r.is_ok());
  EXPECT_DOUBLE_EQ(r.value().estimator.reference_speed_kmh, kReferenceSpeedKmh);
  EXPECT_DOUBLE_EQ(r.value().estimator.default_terrain_factor, kDefaultTerrainFactor);
  EXPECT_EQ(r.value().estimator.default_class, TransportClass::RegionalExpress);
  EXPECT_TRUE(r.value().estimator.cache_enabled);
  EXPECT_EQ(r.value().history.capacity, kMaxHistorySize);
  EXPECT_EQ(r.value().log_level, "info");
}

TEST(Options, OverridesAreApplied) {
  json src = {
    {"estimator", {{"reference_speed_kmh", 120.0}, {"default_class", "IC"}, {"cache_enabled", false}}},
    {"history", {{"capacity", 5}}},
    {"log_level", "debug"},
  };
  auto r = options_from_json(src);
  ASSERT_TRUE(r.is_ok()) << r.status().to_string();
  EXPECT_DOUBLE_EQ(r.value().estimator.reference_speed_kmh, 120.0);
  EXPECT_EQ(r.value().estimator.default_class, TransportClass::InterCity);
  EXPECT_FALSE(r.value().estimator.cache_enabled);
  EXPECT_EQ(r.value().history.capacity, 5u);
  EXPECT_EQ(r.value().log_level, "debug");
}

TEST(Options, RejectsOutOfRangeValues) {
  EXPECT_EQ(options_from_json(json{{"estimator", {{"reference_speed_kmh", 0}}}}).status().kind(),
            ErrorKind::InvalidInput);
  EXPECT_EQ(options_from_json(json{{"estimator", {{"default_terrain_factor", 0.9}}}}).status().kind(),
            ErrorKind::InvalidInput);
  EXPECT_EQ(options_from_json(json{{"estimator", {{"default_class", "TGV"}}}}).status().kind(),
            ErrorKind::InvalidInput);
  EXPECT_EQ(options_from_json(json{{"history", {{"capacity", 0}}}}).status().kind(), ErrorKind::InvalidInput);
  EXPECT_EQ(options_from_json(json{{"log_level", "loud"}}).status().kind(), ErrorKind::InvalidInput);
}

TEST(Options, RejectsWrongTypes) {
  EXPECT_EQ(options_from_json(json::array()).status().kind(), ErrorKind::InvalidInput);
  EXPECT_EQ(options_from_json(json{{"history", {{"capacity", "many"}}}}).status().kind(), ErrorKind::InvalidInput);
  EXPECT_EQ(options_from_json(json{{"estimator", 3}}).status().kind(), ErrorKind::InvalidInput);
}

TEST(Options, LoadFromFile) {
  const auto path = (std::filesystem::temp_directory_path() / "transitgraph_options_test.json").string();
  {
    std::ofstream out(path);
    out << R"({"history": {"capacity": 7}, "log_level": "warn"})";
  }
  auto r = load_options(path);
  ASSERT_TRUE(r.is_ok()) << r.status().to_string();
  EXPECT_EQ(r.value().history.capacity, 7u);
  EXPECT_EQ(r.value().log_level, "warn");
  std::filesystem::remove(path);

  EXPECT_EQ(load_options(path).status().kind(), ErrorKind::Unavailable);
}

TEST(Options, ConfigureLogging) {
  CoreOptions opts;
  opts.log_level = "warn";
  EXPECT_TRUE(configure_logging(opts).is_ok());
  opts.log_level = "verbose";
  EXPECT_EQ(configure_logging(opts).kind(), ErrorKind::InvalidInput);
  opts.log_level = "info";
  EXPECT_TRUE(configure_logging(opts).is_ok());
}
