#include "geo.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace dispatch {

namespace {

constexpr double kEarthRadiusKm = 6371.0;
constexpr double kPi = 3.14159265358979323846;

inline double to_rad(double deg) { return deg * kPi / 180.0; }

}  // namespace

std::map<std::string, ZoneCoord> default_zone_table() {
  return {
      {"Chilanzar", {41.2856, 69.2034}},
      {"Yunusabad", {41.3265, 69.2891}},
      {"Mirzo-Ulugbek", {41.3142, 69.2856}},
      {"Yashnabad", {41.2667, 69.2167}},
      {"Sergeli", {41.2045, 69.2234}},
      {"Shaykhantakhur", {41.3058, 69.2542}},
      {"Olmazor", {41.3357, 69.2978}},
      {"Bektemir", {41.2089, 69.3367}},
      {"Uchtepa", {41.2756, 69.1892}},
      {"Yangihayot", {41.2123, 69.1234}},
  };
}

double haversine_km(const ZoneCoord& a, const ZoneCoord& b) {
  const double dlat = to_rad(b.lat - a.lat);
  const double dlng = to_rad(b.lng - a.lng);
  const double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(to_rad(a.lat)) * std::cos(to_rad(b.lat)) *
                       std::sin(dlng / 2) * std::sin(dlng / 2);
  return 2.0 * kEarthRadiusKm * std::asin(std::min(1.0, std::sqrt(h)));
}

GeoIndex::GeoIndex(GeoConfig cfg) : cfg_(std::move(cfg)) {
  if (cfg_.zones.empty()) cfg_.zones = default_zone_table();
}

bool GeoIndex::known(const std::string& zone) const {
  return cfg_.zones.count(zone) > 0;
}

std::optional<double> GeoIndex::distance_km(const std::string& a, const std::string& b) const {
  auto ia = cfg_.zones.find(a);
  auto ib = cfg_.zones.find(b);
  if (ia == cfg_.zones.end() || ib == cfg_.zones.end()) {
    // same label is still the same place, even if we can't locate it
    if (!a.empty() && a == b) return 0.0;
    return std::nullopt;
  }
  if (a == b) return 0.0;
  return haversine_km(ia->second, ib->second);
}

double GeoIndex::estimated_distance_km(const std::string& a, const std::string& b) const {
  auto d = distance_km(a, b);
  return d ? *d : cfg_.default_distance_km;
}

double GeoIndex::travel_minutes(const std::string& a, const std::string& b) const {
  if (cfg_.average_speed_kmh <= 0.0) return 0.0;
  return estimated_distance_km(a, b) / cfg_.average_speed_kmh * 60.0;
}

double GeoIndex::proximity(const std::string& a, const std::string& b) const {
  auto d = distance_km(a, b);
  if (!d) return cfg_.neutral_proximity;
  if (*d <= 0.0) return 1.0;
  if (cfg_.max_distance_km <= 0.0) return 0.0;
  return std::clamp(1.0 - *d / cfg_.max_distance_km, 0.0, 1.0);
}

RouteEstimate GeoIndex::order_route(const std::string& home,
                                    const std::vector<std::string>& destinations) const {
  const int n = static_cast<int>(destinations.size());
  std::vector<int> order;
  order.reserve(n);
  std::vector<bool> visited(n, false);

  std::string current = home;
  for (int step = 0; step < n; ++step) {
    int best = -1;
    double best_d = std::numeric_limits<double>::max();
    for (int i = 0; i < n; ++i) {
      if (visited[i]) continue;
      const double d = estimated_distance_km(current, destinations[i]);
      if (d < best_d) { best_d = d; best = i; }   // strict: first occurrence wins ties
    }
    visited[best] = true;
    order.push_back(best);
    current = destinations[best];
  }
  return measure_route(home, destinations, order);
}

RouteEstimate GeoIndex::measure_route(const std::string& home,
                                      const std::vector<std::string>& destinations,
                                      const std::vector<int>& order) const {
  RouteEstimate r;
  r.order = order;
  std::string current = home;
  for (int idx : order) {
    r.total_km += estimated_distance_km(current, destinations[idx]);
    r.total_minutes += travel_minutes(current, destinations[idx]);
    current = destinations[idx];
  }
  return r;
}

std::vector<ZoneCluster> GeoIndex::cluster_by_zone(const std::vector<Ticket>& tickets) const {
  std::vector<ZoneCluster> clusters;
  std::map<std::string, size_t> slot;
  for (const auto& t : tickets) {
    auto it = slot.find(t.zone);
    if (it == slot.end()) {
      it = slot.emplace(t.zone, clusters.size()).first;
      clusters.push_back(ZoneCluster{t.zone, {}});
    }
    clusters[it->second].ticket_ids.push_back(t.id);
  }
  std::stable_sort(clusters.begin(), clusters.end(), [](const ZoneCluster& a, const ZoneCluster& b) {
    return a.ticket_ids.size() > b.ticket_ids.size();
  });
  return clusters;
}

std::vector<ZoneDemand> GeoIndex::zone_demand(const std::vector<Ticket>& tickets, double radius_km,
                                              int executor_pool) const {
  std::map<std::string, int> counts;
  int total = 0;
  for (const auto& t : tickets) {
    if (t.zone.empty()) continue;
    ++counts[t.zone];
    ++total;
  }
  for (const auto& kv : cfg_.zones) counts.emplace(kv.first, 0);

  std::vector<ZoneDemand> out;
  out.reserve(counts.size());
  for (const auto& kv : counts) {
    ZoneDemand d;
    d.zone = kv.first;
    d.tickets = kv.second;
    if (total > 0) d.share = static_cast<double>(kv.second) / total;
    if (d.tickets > 0)
      d.suggested_executors = std::max(1, static_cast<int>(std::lround(executor_pool * d.share)));

    std::vector<std::pair<double, std::string>> near;
    auto self = cfg_.zones.find(d.zone);
    if (self != cfg_.zones.end()) {
      for (const auto& other : cfg_.zones) {
        if (other.first == d.zone) continue;
        const double km = haversine_km(self->second, other.second);
        if (km <= radius_km) near.emplace_back(km, other.first);
      }
    }
    std::sort(near.begin(), near.end());
    for (const auto& n : near) d.nearby.push_back(n.second);
    out.push_back(std::move(d));
  }

  // map order already sorts by name; keep it for ties
  std::stable_sort(out.begin(), out.end(), [](const ZoneDemand& a, const ZoneDemand& b) {
    return a.tickets > b.tickets;
  });
  return out;
}

}  // namespace dispatch
