// config.h
#pragma once
#include "circuit_breaker.h"
#include "geo.h"
#include "optimizer.h"
#include "scoring.h"
#include "utils.h"

#include <cstdint>
#include <map>
#include <string>

namespace dispatch {

// Everything the engine reads from the config JSON. Keys are upper-case,
// every key optional with the default shown here.
struct EngineConfig {
  ScoringConfig scoring;
  GeoConfig geo;
  OptimizerConfig optimizer;
  std::map<std::string, BreakerConfig> breakers;   // per dependency name
  long long request_budget_ms = 2000;               // batch deadline, <= 0 = none
  uint64_t rng_seed = 12345;
  bool permission_fail_open = false;   // allow when the permission check is unavailable
  bool notify_async = true;
  size_t snapshot_cache_size = 16;
  bool verbose = false;
};

// Breaker settings shipped for the five known dependencies.
std::map<std::string, BreakerConfig> default_breakers();

EngineConfig default_config();

// Throws InvalidConfiguration on wrong types or out-of-range values.
EngineConfig parse_config(const json& j);
EngineConfig load_config(const std::string& path);
void validate_config(const EngineConfig& c);

BreakerConfig breaker_config_for(const EngineConfig& c, const std::string& name);

}  // namespace dispatch
