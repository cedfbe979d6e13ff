// geo.h
#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "types.h"

namespace dispatch {

struct ZoneCoord {
  double lat = 0.0;
  double lng = 0.0;
};

struct GeoConfig {
  std::map<std::string, ZoneCoord> zones;  // empty -> built-in district table
  double average_speed_kmh = 25.0;
  double max_distance_km = 15.0;           // proximity reaches 0 here
  double neutral_proximity = 0.5;          // used when a zone is unknown
  double default_distance_km = 10.0;       // travel estimate for unknown zones
  bool refine_routes = false;              // OR-Tools pass after nearest-neighbor
  int route_time_limit_seconds = 1;
  double coverage_radius_km = 5.0;         // "nearby" for zone demand summaries
};

// Ten districts with approximate centre coordinates.
std::map<std::string, ZoneCoord> default_zone_table();

double haversine_km(const ZoneCoord& a, const ZoneCoord& b);

struct RouteEstimate {
  std::vector<int> order;        // indices into the destination list
  double total_km = 0.0;
  double total_minutes = 0.0;
  bool refined = false;          // true if the routing solver improved the order
};

// Tickets sharing one zone label. Tickets without a zone share the "" cluster.
struct ZoneCluster {
  std::string zone;
  std::vector<std::string> ticket_ids;   // input order
};

struct ZoneDemand {
  std::string zone;
  int tickets = 0;
  double share = 0.0;                    // of all zoned tickets
  int suggested_executors = 0;           // 0 without demand, else at least 1
  std::vector<std::string> nearby;       // table zones within the radius, nearest first
};

// Zone lookups and distance estimates. Immutable after construction, safe to share.
class GeoIndex {
 public:
  explicit GeoIndex(GeoConfig cfg = {});

  bool known(const std::string& zone) const;
  const GeoConfig& config() const { return cfg_; }

  // nullopt if either zone is unknown; 0 for the same zone.
  std::optional<double> distance_km(const std::string& a, const std::string& b) const;

  // Unknown zones fall back to default_distance_km.
  double estimated_distance_km(const std::string& a, const std::string& b) const;
  double travel_minutes(const std::string& a, const std::string& b) const;

  // 1.0 same zone, linear to 0.0 at max_distance_km, neutral when unknown.
  double proximity(const std::string& a, const std::string& b) const;

  // Nearest-neighbor ordering of destinations starting from home.
  RouteEstimate order_route(const std::string& home,
                            const std::vector<std::string>& destinations) const;

  // Totals for a fixed visiting order.
  RouteEstimate measure_route(const std::string& home,
                              const std::vector<std::string>& destinations,
                              const std::vector<int>& order) const;

  // Largest cluster first; equal sizes keep first-appearance order.
  std::vector<ZoneCluster> cluster_by_zone(const std::vector<Ticket>& tickets) const;

  // One entry per table zone plus any unknown zone that has tickets, busiest
  // first. executor_pool is split across zones in proportion to demand.
  std::vector<ZoneDemand> zone_demand(const std::vector<Ticket>& tickets, double radius_km,
                                      int executor_pool) const;

 private:
  GeoConfig cfg_;
};

}  // namespace dispatch
