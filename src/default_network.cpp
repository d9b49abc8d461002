/*
  Sample network: sixteen cities joined in one line, with reference
  travel times stored as overrides.
*/
#include "transitgraph/core/default_network.hpp"

#include <array>
#include <utility>

namespace transitgraph::core {

namespace {
struct SampleCity { const char* name; double lon; double lat; };
struct SampleLeg { const char* a; const char* b; Minutes minutes; };

constexpr std::array<SampleCity, 16> kCities {{
  {"Frankfurt", 8.6821, 50.1109}, {"Mannheim", 8.4660, 49.4875},
  {"München", 11.5820, 48.1351}, {"Erfurt", 11.0299, 50.9848},
  {"Leipzig", 12.3731, 51.3397}, {"Potsdam", 13.0635, 52.3989},
  {"Berlin", 13.4050, 52.5200}, {"Magdeburg", 11.6276, 52.1205},
  {"Hannover", 9.7320, 52.3759}, {"Bremen", 8.8017, 53.0793},
  {"Hamburg", 9.9937, 53.5511}, {"Schwerin", 11.4074, 53.6294},
  {"Stralsund", 13.0810, 54.3091}, {"Köln", 6.9603, 50.9375},
  {"Saarbrücken", 6.9969, 49.2402}, {"Mainz", 8.2473, 49.9982},
}};

constexpr std::array<SampleLeg, 15> kLegs {{
  {"Frankfurt", "Mannheim", 30}, {"Mannheim", "München", 150},
  {"München", "Erfurt", 180}, {"Erfurt", "Leipzig", 60},
  {"Leipzig", "Potsdam", 90}, {"Potsdam", "Berlin", 30},
  {"Berlin", "Magdeburg", 105}, {"Magdeburg", "Hannover", 90},
  {"Hannover", "Bremen", 75}, {"Bremen", "Hamburg", 60},
  {"Hamburg", "Schwerin", 90}, {"Schwerin", "Stralsund", 120},
  {"Stralsund", "Köln", 360}, {"Köln", "Saarbrücken", 180},
  {"Saarbrücken", "Mainz", 90},
}};
} // namespace

NetworkState default_network() {
  NetworkState s;
  for (const auto& c : kCities) s.cities.emplace(c.name, GeoPoint{c.lon, c.lat});
  for (const auto& l : kLegs) {
    s.connections.push_back(Connection{l.a, l.b});
    s.travel_times[PairKey{l.a, l.b}] = l.minutes;
  }
  return s;
}

const std::vector<CityName>& default_city_names() {
  static const std::vector<CityName> names = [] {
    std::vector<CityName> out;
    out.reserve(kCities.size());
    for (const auto& c : kCities) out.emplace_back(c.name);
    return out;
  }();
  return names;
}

} // namespace transitgraph::core
