#include <gtest/gtest.h>

#include "geo.h"

using namespace dispatch;

namespace {

// Points along the equator, 0.01 degree of longitude apart (about 1.11 km).
GeoConfig line_config() {
  GeoConfig cfg;
  cfg.zones = {
      {"H", {0.0, 0.00}},
      {"A", {0.0, 0.01}},
      {"B", {0.0, 0.02}},
      {"C", {0.0, 0.03}},
  };
  return cfg;
}

}  // namespace

TEST(Haversine, OneDegreeOfLongitudeAtEquator) {
  EXPECT_NEAR(haversine_km({0.0, 0.0}, {0.0, 1.0}), 111.195, 0.01);
  EXPECT_DOUBLE_EQ(haversine_km({41.3, 69.2}, {41.3, 69.2}), 0.0);
}

TEST(GeoIndex, DefaultTableHasTenDistricts) {
  GeoIndex geo;
  EXPECT_EQ(geo.config().zones.size(), 10u);
  EXPECT_TRUE(geo.known("Chilanzar"));
  EXPECT_TRUE(geo.known("Yunusabad"));
  EXPECT_FALSE(geo.known("Atlantis"));
}

TEST(GeoIndex, SameZoneIsZeroDistanceAndTime) {
  GeoIndex geo;
  ASSERT_TRUE(geo.distance_km("Sergeli", "Sergeli").has_value());
  EXPECT_DOUBLE_EQ(*geo.distance_km("Sergeli", "Sergeli"), 0.0);
  EXPECT_DOUBLE_EQ(geo.travel_minutes("Sergeli", "Sergeli"), 0.0);
  EXPECT_DOUBLE_EQ(geo.proximity("Sergeli", "Sergeli"), 1.0);
}

TEST(GeoIndex, DistanceIsSymmetricAndTravelUsesAverageSpeed) {
  GeoIndex geo;
  const auto ab = geo.distance_km("Chilanzar", "Yunusabad");
  const auto ba = geo.distance_km("Yunusabad", "Chilanzar");
  ASSERT_TRUE(ab && ba);
  EXPECT_GT(*ab, 0.0);
  EXPECT_NEAR(*ab, *ba, 1e-9);
  EXPECT_NEAR(geo.travel_minutes("Chilanzar", "Yunusabad"), *ab / 25.0 * 60.0, 1e-9);
}

TEST(GeoIndex, UnknownZoneIsToleratedWithNeutralValues) {
  GeoIndex geo;
  EXPECT_FALSE(geo.distance_km("Chilanzar", "Atlantis").has_value());
  EXPECT_DOUBLE_EQ(geo.proximity("Chilanzar", "Atlantis"), 0.5);
  EXPECT_DOUBLE_EQ(geo.estimated_distance_km("Atlantis", "Chilanzar"), 10.0);
  EXPECT_DOUBLE_EQ(geo.travel_minutes("Atlantis", "Chilanzar"), 10.0 / 25.0 * 60.0);
}

TEST(GeoIndex, UnknownButIdenticalLabelsAreTheSamePlace) {
  GeoIndex geo;
  ASSERT_TRUE(geo.distance_km("A", "A").has_value());
  EXPECT_DOUBLE_EQ(geo.proximity("A", "A"), 1.0);
  EXPECT_DOUBLE_EQ(geo.proximity("A", "B"), 0.5);
}

TEST(GeoIndex, ProximityFallsLinearlyToTheCeiling) {
  GeoConfig cfg = line_config();
  cfg.max_distance_km = 3.0;
  GeoIndex geo(cfg);
  const double d = *geo.distance_km("H", "A");
  EXPECT_NEAR(geo.proximity("H", "A"), 1.0 - d / 3.0, 1e-12);
  EXPECT_LT(geo.proximity("H", "B"), geo.proximity("H", "A"));
  EXPECT_DOUBLE_EQ(geo.proximity("H", "C"), 0.0);   // ~3.3 km, past the ceiling
}

TEST(GeoIndex, ConfiguredNeutralAndDefaultDistance) {
  GeoConfig cfg;
  cfg.neutral_proximity = 0.2;
  cfg.default_distance_km = 5.0;
  cfg.average_speed_kmh = 30.0;
  GeoIndex geo(cfg);
  EXPECT_DOUBLE_EQ(geo.proximity("nowhere", "Chilanzar"), 0.2);
  EXPECT_DOUBLE_EQ(geo.travel_minutes("nowhere", "Chilanzar"), 10.0);
}

TEST(GeoIndex, NearestNeighborRoute) {
  GeoIndex geo(line_config());
  const std::vector<std::string> dest = {"C", "A", "B"};
  const RouteEstimate r = geo.order_route("H", dest);
  EXPECT_EQ(r.order, (std::vector<int>{1, 2, 0}));
  EXPECT_NEAR(r.total_km, *geo.distance_km("H", "C"), 1e-6);
  EXPECT_NEAR(r.total_minutes, r.total_km / 25.0 * 60.0, 1e-6);
  EXPECT_FALSE(r.refined);
}

TEST(GeoIndex, RouteTiesGoToFirstOccurrence) {
  GeoIndex geo(line_config());
  const RouteEstimate r = geo.order_route("H", {"A", "A", "A"});
  EXPECT_EQ(r.order, (std::vector<int>{0, 1, 2}));
}

TEST(GeoIndex, EmptyRoute) {
  GeoIndex geo;
  const RouteEstimate r = geo.order_route("Chilanzar", {});
  EXPECT_TRUE(r.order.empty());
  EXPECT_DOUBLE_EQ(r.total_km, 0.0);
  EXPECT_DOUBLE_EQ(r.total_minutes, 0.0);
}

// ---------------- zone clusters and demand ----------------

namespace {

Ticket zoned(const std::string& id, const std::string& zone) {
  Ticket t;
  t.id = id;
  t.category = "general";
  t.zone = zone;
  return t;
}

}  // namespace

TEST(ZoneClusters, LargestFirstTiesByFirstAppearance) {
  GeoIndex geo(line_config());
  const std::vector<Ticket> tickets = {zoned("t0", "A"), zoned("t1", "B"), zoned("t2", "A"),
                                       zoned("t3", ""),  zoned("t4", "B"), zoned("t5", "A"),
                                       zoned("t6", "C")};
  const auto clusters = geo.cluster_by_zone(tickets);
  ASSERT_EQ(clusters.size(), 4u);
  EXPECT_EQ(clusters[0].zone, "A");
  EXPECT_EQ(clusters[0].ticket_ids, (std::vector<std::string>{"t0", "t2", "t5"}));
  EXPECT_EQ(clusters[1].zone, "B");
  EXPECT_EQ(clusters[2].zone, "");
  EXPECT_EQ(clusters[3].zone, "C");
  EXPECT_TRUE(geo.cluster_by_zone({}).empty());
}

TEST(ZoneDemand, SharesSuggestionsAndNearbyZones) {
  GeoIndex geo(line_config());
  const std::vector<Ticket> tickets = {zoned("t0", "A"), zoned("t1", "A"), zoned("t2", "A"),
                                       zoned("t3", "B"), zoned("t4", "Nowhere"), zoned("t5", "")};
  const auto demand = geo.zone_demand(tickets, 2.5, 10);

  std::vector<std::string> order;
  for (const auto& d : demand) order.push_back(d.zone);
  EXPECT_EQ(order, (std::vector<std::string>{"A", "B", "Nowhere", "C", "H"}));

  EXPECT_EQ(demand[0].tickets, 3);
  EXPECT_DOUBLE_EQ(demand[0].share, 0.6);
  EXPECT_EQ(demand[0].suggested_executors, 6);
  EXPECT_EQ(demand[1].suggested_executors, 2);
  EXPECT_TRUE(demand[2].nearby.empty());   // unknown zone has no coordinates
  EXPECT_EQ(demand[3].tickets, 0);
  EXPECT_EQ(demand[3].suggested_executors, 0);
  EXPECT_EQ(demand[4].zone, "H");
  EXPECT_EQ(demand[4].nearby, (std::vector<std::string>{"A", "B"}));
}

TEST(ZoneDemand, EveryZoneWithDemandGetsSomeone) {
  GeoIndex geo(line_config());
  const auto demand = geo.zone_demand({zoned("t0", "A"), zoned("t1", "C")}, 0.0, 0);
  for (const auto& d : demand) {
    EXPECT_EQ(d.suggested_executors, d.tickets > 0 ? 1 : 0) << d.zone;
    EXPECT_TRUE(d.nearby.empty());
  }
}

TEST(ZoneDemand, NoTicketsStillListsTheTable) {
  GeoIndex geo;
  const auto demand = geo.zone_demand({}, 5.0, 4);
  ASSERT_EQ(demand.size(), 10u);
  for (const auto& d : demand) {
    EXPECT_EQ(d.tickets, 0);
    EXPECT_DOUBLE_EQ(d.share, 0.0);
  }
}
