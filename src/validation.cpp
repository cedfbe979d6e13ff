#include "validation.h"
#include "utils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <unordered_set>

namespace dispatch
{

    namespace
    {

        bool is_blank(const std::string &s)
        {
            return std::all_of(s.begin(), s.end(), [](unsigned char c)
                               { return std::isspace(c); });
        }

        [[noreturn]] void fail(const std::string &msg)
        {
            throw InvalidConfiguration(msg);
        }

    } // namespace

    void validate_tickets(const std::vector<Ticket> &tickets)
    {
        std::unordered_set<std::string> seen_ids;
        seen_ids.reserve(tickets.size() * 2);

        for (std::size_t i = 0; i < tickets.size(); ++i)
        {
            const Ticket &t = tickets[i];

            if (t.id.empty() || is_blank(t.id))
                fail("Ticket " + std::to_string(i) + " missing required field: id");
            if (t.urgency < 1 || t.urgency > 5)
                fail("Ticket " + t.id + " has invalid urgency: " + std::to_string(t.urgency) + " (expected 1..5)");
            if (t.category.empty() || is_blank(t.category))
                fail("Ticket " + t.id + " has no category.");
            if (t.created_at < 0)
                fail("Ticket " + t.id + " has negative created_at.");

            if (!seen_ids.insert(t.id).second)
                fail("Duplicate ticket id found: " + t.id);
        }
    }

    void validate_executors(const std::vector<Executor> &executors)
    {
        std::unordered_set<std::string> seen_ids;
        seen_ids.reserve(executors.size() * 2);

        for (std::size_t i = 0; i < executors.size(); ++i)
        {
            const Executor &e = executors[i];

            if (e.id.empty() || is_blank(e.id))
                fail("Executor " + std::to_string(i) + " missing required field: id");
            if (e.id == kUnassigned)
                fail("Executor id '" + e.id + "' is reserved.");
            if (!std::isfinite(e.efficiency) || e.efficiency < 0.0 || e.efficiency > 100.0)
                fail("Executor " + e.id + " has invalid efficiency: " + fmt_double(e.efficiency, 2) + " (expected 0..100)");
            if (e.capacity < 0)
                fail("Executor " + e.id + " has negative capacity.");
            if (e.current_load < 0)
                fail("Executor " + e.id + " has negative current_load.");
            for (const auto &s : e.skills)
            {
                if (s.empty() || is_blank(s))
                    fail("Executor " + e.id + " has a blank skill tag.");
            }

            if (!seen_ids.insert(e.id).second)
                fail("Duplicate executor id found: " + e.id);
        }
    }

    void report_unknown_zones(const GeoIndex &geo,
                              const std::vector<Ticket> &tickets,
                              const std::vector<Executor> &executors,
                              bool verbose)
    {
        if (!verbose)
            return;
        std::set<std::string> unknown;
        for (const auto &t : tickets)
            if (!t.zone.empty() && !geo.known(t.zone))
                unknown.insert(t.zone);
        for (const auto &e : executors)
            if (!e.zone.empty() && !geo.known(e.zone))
                unknown.insert(e.zone);
        for (const auto &z : unknown)
            log_info("validation", "unknown zone '" + z + "', neutral proximity will be used");
    }

    void validate_all(const std::vector<Ticket> &tickets,
                      const std::vector<Executor> &executors,
                      const GeoIndex &geo,
                      bool verbose)
    {
        validate_tickets(tickets);
        validate_executors(executors);
        report_unknown_zones(geo, tickets, executors, verbose);
    }

} // namespace dispatch
