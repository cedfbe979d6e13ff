#include "json_io.h"

#include <ctime>

namespace dispatch {

namespace {

const json& records(const json& j, const char* key) {
  if (j.is_array()) return j;
  if (j.is_object() && j.contains(key) && j.at(key).is_array()) return j.at(key);
  throw InvalidConfiguration(std::string("Expected an array or an object with '") + key + "'");
}

std::string iso_utc(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

}  // namespace

Ticket ticket_from_json(const json& j) {
  try {
    Ticket t;
    t.id = j.at("id").get<std::string>();
    t.category = j.value("category", std::string{});
    t.urgency = j.value("urgency", t.urgency);
    t.description = j.value("description", std::string{});
    t.zone = j.value("zone", std::string{});
    t.created_at = j.value("created_at", static_cast<int64_t>(0));
    return t;
  } catch (const json::exception& e) {
    throw InvalidConfiguration("Malformed ticket " + j.dump() + ": " + e.what());
  }
}

Executor executor_from_json(const json& j) {
  try {
    Executor e;
    e.id = j.at("id").get<std::string>();
    e.name = j.value("name", std::string{});
    if (j.contains("skills")) e.skills = j.at("skills").get<std::vector<std::string>>();
    e.zone = j.value("zone", std::string{});
    e.efficiency = j.value("efficiency", e.efficiency);
    e.capacity = j.value("capacity", e.capacity);
    e.current_load = j.value("current_load", e.current_load);
    e.available = j.value("available", e.available);
    return e;
  } catch (const json::exception& ex) {
    throw InvalidConfiguration("Malformed executor " + j.dump() + ": " + ex.what());
  }
}

std::vector<Ticket> tickets_from_json(const json& j) {
  std::vector<Ticket> out;
  for (const auto& r : records(j, "tickets")) out.push_back(ticket_from_json(r));
  return out;
}

std::vector<Executor> executors_from_json(const json& j) {
  std::vector<Executor> out;
  for (const auto& r : records(j, "executors")) out.push_back(executor_from_json(r));
  return out;
}

json to_json(const Ticket& t) {
  return {{"id", t.id}, {"category", t.category}, {"urgency", t.urgency},
          {"description", t.description}, {"zone", t.zone}, {"created_at", t.created_at}};
}

json to_json(const Executor& e) {
  return {{"id", e.id}, {"name", e.name}, {"skills", e.skills}, {"zone", e.zone},
          {"efficiency", e.efficiency}, {"capacity", e.capacity},
          {"current_load", e.current_load}, {"available", e.available}};
}

json to_json(const FactorValues& f) {
  return {{"skill_match", f.skill_match}, {"efficiency", f.efficiency},
          {"workload_balance", f.workload_balance}, {"availability", f.availability},
          {"geo_proximity", f.geo_proximity}, {"urgency_bonus", f.urgency_bonus}};
}

json to_json(const ScoringWeights& w) {
  return {{"skill_match", w.skill_match}, {"efficiency", w.efficiency},
          {"workload_balance", w.workload_balance}, {"availability", w.availability},
          {"geo_proximity", w.geo_proximity}};
}

json to_json(const CandidateScore& c) {
  return {{"ticket_id", c.ticket_id}, {"executor_id", c.executor_id}, {"score", c.score},
          {"factors", to_json(c.factors)}, {"weights", to_json(c.weights)},
          {"reasoning", c.reasoning}};
}

json to_json(const AssignmentDecision& d) {
  json j = {{"ticket_id", d.ticket_id},
            {"executor_id", d.executor_id},
            {"algorithm", to_string(d.algorithm)},
            {"score", d.score},
            {"factors", to_json(d.factors)},
            {"weights", to_json(d.weights)},
            {"duration_ms", d.duration_ms},
            {"fallback_used", d.fallback_used},
            {"budget_exhausted", d.budget_exhausted},
            {"service_mode", to_string(d.service_mode)},
            {"alternatives", d.alternatives},
            {"committed", d.committed}};
  if (!d.reason.empty()) j["reason"] = d.reason;
  return j;
}

json to_json(const BreakerStatus& s) {
  json j = {{"name", s.name},
            {"state", to_string(s.state)},
            {"consecutive_failures", s.consecutive_failures},
            {"failure_threshold", s.failure_threshold},
            {"cooldown_seconds", s.cooldown_seconds},
            {"total_requests", s.total_requests},
            {"successful_requests", s.successful_requests},
            {"failed_requests", s.failed_requests},
            {"rejected_requests", s.rejected_requests}};
  j["last_failure"] = s.last_failure ? json(iso_utc(*s.last_failure)) : json(nullptr);
  if (!s.last_error.empty()) j["last_error"] = s.last_error;
  return j;
}

json to_json(const RoutePlan& p) {
  return {{"executor_id", p.executor_id}, {"home_zone", p.home_zone},
          {"ticket_ids", p.ticket_ids}, {"zones", p.zones},
          {"total_km", p.total_km}, {"total_minutes", p.total_minutes},
          {"refined", p.refined}};
}

json to_json(const ZoneCluster& c) {
  return {{"zone", c.zone}, {"tickets", c.ticket_ids.size()}, {"ticket_ids", c.ticket_ids}};
}

json to_json(const ZoneDemand& d) {
  return {{"zone", d.zone}, {"tickets", d.tickets}, {"share", d.share},
          {"suggested_executors", d.suggested_executors}, {"nearby", d.nearby}};
}

json to_json(const HealthReport& h) {
  json j = {{"service_mode", to_string(h.mode)},
            {"unhealthy", h.unhealthy},
            {"fallback_data_version", h.fallback_data_version},
            {"cached_snapshots", h.cached_snapshots}};
  if (h.override_info) {
    j["override"] = {{"mode", to_string(h.override_info->mode)},
                     {"reason", h.override_info->reason}};
  } else {
    j["override"] = nullptr;
  }
  return j;
}

json breakers_to_json(const std::map<std::string, BreakerStatus>& status) {
  json j = json::object();
  for (const auto& kv : status) j[kv.first] = to_json(kv.second);
  return j;
}

}  // namespace dispatch
