#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>
#include "transitgraph/core/network_store.hpp"
#include "test_utils.hpp"

using namespace transitgraph::core;
using namespace transitgraph::core::test;

TEST(NetworkStoreConnections, DuplicateRejectedInEitherOrder) {
  NetworkStore store(make_line_state(2));
  auto st = store.add_connection(city_name(1), city_name(0));
  EXPECT_EQ(st.kind(), ErrorKind::Duplicate);
  EXPECT_EQ(store.num_connections(), 1u);
}

TEST(NetworkStoreConnections, RejectsSelfLoopAndUnknownCity) {
  NetworkStore store(make_line_state(2));
  EXPECT_EQ(store.add_connection(city_name(0), city_name(0)).kind(), ErrorKind::InvalidInput);
  EXPECT_EQ(store.add_connection(city_name(0), "Atlantis").kind(), ErrorKind::NotFound);
  EXPECT_EQ(store.num_connections(), 1u);
}

TEST(NetworkStoreConnections, AddAndRemove) {
  NetworkStore store(make_line_state(3));
  ASSERT_TRUE(store.add_connection(city_name(0), city_name(2), TransportClass::InterCity).is_ok());
  EXPECT_TRUE(store.has_connection(city_name(2), city_name(0)));
  EXPECT_EQ(store.transport_class(city_name(2), city_name(0)), TransportClass::InterCity);

  ASSERT_TRUE(store.remove_connection(city_name(2), city_name(0)).is_ok());
  EXPECT_FALSE(store.has_connection(city_name(0), city_name(2)));
  EXPECT_FALSE(store.transport_class(city_name(0), city_name(2)).has_value());
  EXPECT_EQ(store.remove_connection(city_name(2), city_name(0)).kind(), ErrorKind::NotFound);
}

TEST(NetworkStoreConnections, TransportClassRequiresConnection) {
  NetworkStore store(make_line_state(3));
  EXPECT_EQ(store.set_transport_class(city_name(0), city_name(2), TransportClass::Suburban).kind(),
            ErrorKind::NotFound);
  EXPECT_TRUE(store.set_transport_class(city_name(1), city_name(0), TransportClass::Suburban).is_ok());
}

TEST(NetworkStoreOverrides, Validation) {
  NetworkStore store(make_line_state(3));
  EXPECT_EQ(store.set_duration_override(city_name(0), city_name(1), 0).kind(), ErrorKind::InvalidInput);
  EXPECT_EQ(store.set_duration_override(city_name(0), city_name(1), -5).kind(), ErrorKind::InvalidInput);
  EXPECT_EQ(store.set_duration_override(city_name(0), city_name(2), 10).kind(), ErrorKind::InvalidInput);
  ASSERT_TRUE(store.set_duration_override(city_name(1), city_name(0), 12).is_ok());
  EXPECT_EQ(store.duration_override(city_name(0), city_name(1)).value_or(0), 12);
  store.clear_duration_override(city_name(0), city_name(1));
  EXPECT_FALSE(store.duration_override(city_name(0), city_name(1)).has_value());
}

TEST(NetworkStoreCities, AddCityOverwritesCoordinates) {
  NetworkStore store;
  store.add_city("Bonn", GeoPoint{7.1, 50.7});
  store.add_city("Bonn", GeoPoint{7.2, 50.8});
  EXPECT_EQ(store.num_cities(), 1u);
  EXPECT_EQ(store.city("Bonn")->lon, 7.2);
  EXPECT_EQ(store.update_city_coordinates("Atlantis", GeoPoint{}).kind(), ErrorKind::NotFound);
}

TEST(NetworkStoreCities, RemoveCityReconnectsStarAsClique) {
  NetworkStore store(make_star_state("Hub", {"A", "B", "C"}));
  ASSERT_TRUE(store.remove_city("Hub").is_ok());
  EXPECT_FALSE(store.has_city("Hub"));
  EXPECT_EQ(store.num_connections(), 3u);
  EXPECT_TRUE(store.has_connection("A", "B"));
  EXPECT_TRUE(store.has_connection("A", "C"));
  EXPECT_TRUE(store.has_connection("B", "C"));
  for (const auto& c : store.state().connections) EXPECT_FALSE(c.touches("Hub"));
}

TEST(NetworkStoreCities, RemoveCityInLineBridgesNeighbours) {
  NetworkStore store(make_line_state(3));
  ASSERT_TRUE(store.remove_city(city_name(1)).is_ok());
  ASSERT_EQ(store.num_connections(), 1u);
  EXPECT_TRUE(store.has_connection(city_name(0), city_name(2)));
}

TEST(NetworkStoreCities, RemoveCityKeepsExistingNeighbourConnection) {
  NetworkState s = make_star_state("Hub", {"A", "B"});
  s.connections.push_back(Connection{"A", "B"});
  s.travel_times[PairKey{"A", "B"}] = 40;
  NetworkStore store(s);
  ASSERT_TRUE(store.remove_city("Hub").is_ok());
  EXPECT_EQ(store.num_connections(), 1u);
  EXPECT_EQ(store.duration_override("A", "B").value_or(0), 40);
}

TEST(NetworkStoreCities, RemoveCityDropsIncidentAttributes) {
  NetworkState s = make_line_state(3);
  s.travel_times[PairKey{city_name(0), city_name(1)}] = 25;
  s.train_types[PairKey{city_name(1), city_name(2)}] = TransportClass::Regional;
  s.daybreaks.insert(PairKey{city_name(0), city_name(1)});
  NetworkStore store(s);
  ASSERT_TRUE(store.remove_city(city_name(1)).is_ok());
  EXPECT_TRUE(store.state().travel_times.empty());
  EXPECT_TRUE(store.state().train_types.empty());
  EXPECT_TRUE(store.state().daybreaks.empty());
  EXPECT_EQ(store.remove_city(city_name(1)).kind(), ErrorKind::NotFound);
}

TEST(NetworkStoreCities, RemoveCitiesDoesNotReconnect) {
  NetworkStore store(make_line_state(4));
  std::vector<CityName> names {city_name(1), "Atlantis"};
  EXPECT_EQ(store.remove_cities(names), 1u);
  EXPECT_EQ(store.num_cities(), 3u);
  ASSERT_EQ(store.num_connections(), 1u);
  EXPECT_TRUE(store.has_connection(city_name(2), city_name(3)));
}

TEST(NetworkStoreBreaks, MarkAndUnmark) {
  NetworkStore store(make_line_state(3));
  store.mark_break(city_name(1), city_name(0));
  EXPECT_TRUE(store.is_break(city_name(0), city_name(1)));
  store.unmark_break(city_name(0), city_name(1));
  EXPECT_FALSE(store.is_break(city_name(1), city_name(0)));
}

TEST(NetworkStoreState, RestoreRejectsInvalidState) {
  NetworkState self_loop = make_line_state(2);
  self_loop.connections.push_back(Connection{city_name(0), city_name(0)});
  EXPECT_THROW(NetworkStore{self_loop}, std::invalid_argument);

  NetworkState reversed_dup = make_line_state(2);
  reversed_dup.connections.push_back(Connection{city_name(1), city_name(0)});
  EXPECT_EQ(validate_state(reversed_dup).kind(), ErrorKind::InvalidInput);

  NetworkState dangling = make_line_state(2);
  dangling.connections.push_back(Connection{city_name(0), "Atlantis"});
  EXPECT_FALSE(validate_state(dangling).is_ok());

  NetworkState orphan_override = make_line_state(3);
  orphan_override.travel_times[PairKey{city_name(0), city_name(2)}] = 10;
  EXPECT_FALSE(validate_state(orphan_override).is_ok());
}

TEST(NetworkStoreState, ReplaceConnectionsFiltersAndDropsAttributes) {
  NetworkState s = make_line_state(4);
  s.travel_times[PairKey{city_name(2), city_name(3)}] = 15;
  NetworkStore store(s);
  std::vector<Connection> next {
    {city_name(0), city_name(1)},
    {city_name(1), city_name(0)},
    {city_name(0), "Atlantis"},
    {city_name(2), city_name(2)},
    {city_name(0), city_name(3)},
  };
  EXPECT_EQ(store.replace_connections(next), 2u);
  EXPECT_TRUE(store.has_connection(city_name(0), city_name(3)));
  EXPECT_FALSE(store.has_connection(city_name(2), city_name(3)));
  EXPECT_TRUE(store.state().travel_times.empty());
}

TEST(NetworkStoreState, ChainNamesFallBack) {
  NetworkStore store;
  EXPECT_EQ(store.chain_name(0), "Route 1");
  store.set_chain_name(0, "Nordlinie");
  EXPECT_EQ(store.chain_name(0), "Nordlinie");
  EXPECT_EQ(store.chain_name(2), "Route 3");
}

TEST(NetworkStoreObservers, NotifiedOnMutation) {
  NetworkStore store(make_line_state(3));
  RecordingObserver obs;
  store.add_observer(&obs);
  store.add_observer(&obs);

  ASSERT_TRUE(store.update_city_coordinates(city_name(0), GeoPoint{9.5, 51.0}).is_ok());
  ASSERT_EQ(obs.cities.size(), 1u);
  EXPECT_EQ(obs.cities[0], city_name(0));

  ASSERT_TRUE(store.set_duration_override(city_name(1), city_name(2), 20).is_ok());
  ASSERT_EQ(obs.pairs.size(), 1u);
  EXPECT_EQ(obs.pairs[0], (PairKey{city_name(2), city_name(1)}));

  store.mark_break(city_name(0), city_name(1));
  store.mark_break(city_name(0), city_name(1));
  EXPECT_EQ(obs.pairs.size(), 2u);

  store.restore(make_line_state(2));
  EXPECT_EQ(obs.resets, 1);

  store.remove_observer(&obs);
  store.add_city("Extra", GeoPoint{});
  EXPECT_EQ(obs.cities.size(), 1u);
}

TEST(NetworkStoreObservers, NullObserverRejected) {
  NetworkStore store;
  EXPECT_THROW(store.add_observer(nullptr), std::invalid_argument);
}

TEST(NetworkStoreQueries, NeighboursInConnectionOrder) {
  NetworkStore store(make_star_state("Hub", {"X", "Y", "Z"}));
  EXPECT_EQ(store.neighbors("Hub"), (std::vector<CityName>{"X", "Y", "Z"}));
  EXPECT_EQ(store.neighbors("Y"), (std::vector<CityName>{"Hub"}));
  EXPECT_TRUE(store.neighbors("Atlantis").empty());
}
