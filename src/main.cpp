// main.cpp
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.h"
#include "facade.h"
#include "file_collaborators.h"
#include "json_io.h"
#include "types.h"
#include "utils.h"
#include "validation.h"

using namespace dispatch;

// ---------------- Minimal CLI ----------------
struct Flags {
  std::string mode = "batch";     // {one|batch|recommend|routes|zones}
  std::string tickets_path;       // required
  std::string executors_path;     // required
  std::string config_path;        // required
  std::string algorithm;          // optional batch override
  std::string user = "cli";       // requesting user for --mode one
  int top = 3;                    // --mode recommend
  std::string out_path;           // empty = stdout
  bool verbose = true;            // flipped by --quiet
};

static void print_usage() {
  std::cout <<
R"(Usage:
  smart_dispatch --mode {one|batch|recommend|routes|zones} --tickets tickets.json --executors executors.json --config config.json [options]

Required:
  --mode {one|batch|recommend|routes|zones}
  --tickets PATH
  --executors PATH
  --config PATH

Optional:
  --algorithm NAME    Batch algorithm: greedy|population|annealing|hybrid (default: auto)
  --user ID           Requesting user for --mode one (default: cli)
  --top N             Candidates per ticket for --mode recommend (default: 3)
  --out PATH          Write the result JSON here instead of stdout
  --quiet             Less logging
  --help
)";
}

static Flags parse_flags(int argc, char** argv) {
  Flags f;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };
    if (a == "--help" || a == "-h") { print_usage(); std::exit(0); }
    else if (a == "--mode")      f.mode = need("--mode");
    else if (a == "--tickets")   f.tickets_path = need("--tickets");
    else if (a == "--executors") f.executors_path = need("--executors");
    else if (a == "--config")    f.config_path = need("--config");
    else if (a == "--algorithm") f.algorithm = need("--algorithm");
    else if (a == "--user")      f.user = need("--user");
    else if (a == "--top") {
      const std::string v = need("--top");
      try { f.top = std::stoi(v); }
      catch (const std::exception&) { std::cerr << "Invalid --top: " << v << "\n"; std::exit(2); }
      if (f.top < 0) { std::cerr << "--top must be >= 0\n"; std::exit(2); }
    }
    else if (a == "--out")       f.out_path = need("--out");
    else if (a == "--quiet")     f.verbose = false;
    else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
  }
  if (f.tickets_path.empty() || f.executors_path.empty() || f.config_path.empty()) {
    std::cerr << "Missing required --tickets/--executors/--config.\n"; print_usage(); std::exit(2);
  }
  if (f.mode != "one" && f.mode != "batch" && f.mode != "recommend" && f.mode != "routes" &&
      f.mode != "zones") {
    std::cerr << "Unknown mode: " << f.mode << "\n"; print_usage(); std::exit(2);
  }
  return f;
}

static json decisions_json(const std::vector<AssignmentDecision>& decisions) {
  json arr = json::array();
  for (const auto& d : decisions) arr.push_back(to_json(d));
  return arr;
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  const Flags flags = parse_flags(argc, argv);
  // stdout carries the result JSON unless --out is given.
  if (flags.out_path.empty()) set_info_stream(std::cerr);

  json tickets_json, executors_json, cfg_json;
  try {
    tickets_json = load_json(flags.tickets_path);
    executors_json = load_json(flags.executors_path);
    cfg_json = load_json(flags.config_path);
  } catch (const std::exception& e) {
    std::cerr << "Failed to load inputs: " << e.what() << "\n"; return 1;
  }

  EngineConfig cfg;
  std::vector<Ticket> tickets;
  std::vector<Executor> executors;
  std::optional<Algorithm> algorithm;
  try {
    if (!flags.verbose) cfg_json["VERBOSE"] = false;
    else if (!cfg_json.contains("VERBOSE")) cfg_json["VERBOSE"] = true;
    cfg = parse_config(cfg_json);
    if (!flags.algorithm.empty()) algorithm = algorithm_from_string(flags.algorithm);
  } catch (const InvalidConfiguration& e) {
    std::cerr << "Invalid configuration: " << e.what() << "\n"; return 2;
  }
  try {
    tickets = tickets_from_json(tickets_json);
    executors = executors_from_json(executors_json);
    validate_all(tickets, executors, GeoIndex(cfg.geo), cfg.verbose);
  } catch (const InvalidConfiguration& e) {
    std::cerr << "Invalid input: " << e.what() << "\n"; return 1;
  }

  // Snapshot runs finish before exit; no detached notification threads.
  cfg.notify_async = false;

  auto store = std::make_shared<RecordingStore>();
  Collaborators collab;
  collab.permissions = std::make_shared<AllowAllPermissions>();
  collab.tickets = std::make_shared<SnapshotTicketService>(tickets);
  collab.roster = std::make_shared<SnapshotRosterService>(executors);
  collab.store = store;
  collab.notifier = std::make_shared<ConsoleNotifier>(cfg.verbose);

  if (cfg.verbose) {
    log_info("main", "smart_dispatch mode=" + flags.mode +
                         " tickets=" + std::to_string(tickets.size()) +
                         " executors=" + std::to_string(executors.size()));
  }

  json result;
  try {
    AssignmentFacade facade(cfg, collab);

    if (flags.mode == "one") {
      std::vector<AssignmentDecision> decisions;
      for (const auto& t : tickets) decisions.push_back(facade.assign_one(t, flags.user));
      result["decisions"] = decisions_json(decisions);
    } else if (flags.mode == "batch" || flags.mode == "routes") {
      const auto decisions = facade.assign_batch(tickets, algorithm);
      result["decisions"] = decisions_json(decisions);
      if (flags.mode == "routes") {
        json routes = json::array();
        for (const auto& p : facade.plan_routes(decisions, tickets)) routes.push_back(to_json(p));
        result["routes"] = routes;
      }
    } else if (flags.mode == "zones") {
      json clusters = json::array();
      for (const auto& c : facade.cluster_tickets(tickets)) clusters.push_back(to_json(c));
      json demand = json::array();
      for (const auto& d : facade.zone_demand(tickets)) demand.push_back(to_json(d));
      result["clusters"] = clusters;
      result["zone_demand"] = demand;
    } else {
      json recs = json::object();
      for (const auto& t : tickets) {
        json arr = json::array();
        for (const auto& c : facade.recommend(t, static_cast<size_t>(flags.top))) arr.push_back(to_json(c));
        recs[t.id] = arr;
      }
      result["recommendations"] = recs;
    }

    result["commits"] = store->to_json();
    result["circuit_breakers"] = breakers_to_json(facade.circuit_breaker_status());
    result["health"] = to_json(facade.health());
  } catch (const InvalidConfiguration& e) {
    std::cerr << "Invalid configuration: " << e.what() << "\n"; return 2;
  }

  if (flags.out_path.empty()) {
    std::cout << std::setw(2) << result << "\n";
  } else {
    try { save_json(flags.out_path, result); }
    catch (const std::exception& e) { std::cerr << "Failed to write result: " << e.what() << "\n"; return 1; }
    if (flags.verbose) log_info("main", "result written to " + flags.out_path);
  }
  return 0;
}
