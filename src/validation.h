// validation.h
#pragma once
#include "geo.h"
#include "types.h"

#include <string>
#include <vector>

namespace dispatch {

// Input snapshot checks for the command-line tool. Each throws
// InvalidConfiguration naming the first offending record.

void validate_tickets(const std::vector<Ticket>& tickets);
void validate_executors(const std::vector<Executor>& executors);

// Zones are optional; unknown ones are only reported (verbose) because the
// geo module tolerates them.
void report_unknown_zones(const GeoIndex& geo,
                          const std::vector<Ticket>& tickets,
                          const std::vector<Executor>& executors,
                          bool verbose);

void validate_all(const std::vector<Ticket>& tickets,
                  const std::vector<Executor>& executors,
                  const GeoIndex& geo,
                  bool verbose);

}  // namespace dispatch
