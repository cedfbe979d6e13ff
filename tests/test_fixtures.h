// test_fixtures.h
#pragma once
#include "circuit_breaker.h"
#include "collaborators.h"
#include "types.h"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

namespace dispatch {
namespace testing_support {

inline Ticket make_ticket(const std::string& id, const std::string& category, int urgency,
                          const std::string& zone = "", int64_t created_at = 0) {
  Ticket t;
  t.id = id;
  t.category = category;
  t.urgency = urgency;
  t.zone = zone;
  t.created_at = created_at;
  return t;
}

inline Executor make_executor(const std::string& id, std::vector<std::string> skills,
                              double efficiency, int load, int capacity,
                              const std::string& zone = "", bool available = true) {
  Executor e;
  e.id = id;
  e.name = id;
  e.skills = std::move(skills);
  e.efficiency = efficiency;
  e.current_load = load;
  e.capacity = capacity;
  e.zone = zone;
  e.available = available;
  return e;
}

// Plumbing specialist vs. better-rated generalist.
inline std::vector<Executor> plumbing_pool() {
  return {make_executor("plumber", {"plumbing"}, 85, 2, 5, "A"),
          make_executor("handyman", {"general"}, 92, 0, 4, "B")};
}

// Clock that only moves when told to.
class ManualClock {
 public:
  ManualClock() : now_(std::make_shared<SteadyClock::time_point>(SteadyClock::time_point{} + std::chrono::hours(1))) {}

  ClockFn fn() const {
    auto now = now_;
    return [now] { return *now; };
  }
  void advance(std::chrono::milliseconds d) { *now_ += d; }
  void advance_seconds(double s) {
    *now_ += std::chrono::duration_cast<SteadyClock::duration>(std::chrono::duration<double>(s));
  }

 private:
  std::shared_ptr<SteadyClock::time_point> now_;
};

// ---------------- fake collaborators ----------------

class FakePermissions : public PermissionService {
 public:
  bool can_assign(const std::string& user_id, const std::string&) override {
    ++calls;
    if (fail) throw std::runtime_error("permission service down");
    if (fail_with_code) throw 42;
    return denied_users.count(user_id) == 0;
  }
  std::map<std::string, bool> denied_users;
  std::atomic<bool> fail{false};
  std::atomic<bool> fail_with_code{false};   // throws a non-std::exception value
  std::atomic<int> calls{0};
};

class FakeTickets : public TicketService {
 public:
  Ticket get_ticket(const std::string& ticket_id) override {
    ++calls;
    if (fail) throw std::runtime_error("ticket store down");
    std::lock_guard<std::mutex> lk(mu);
    auto it = tickets.find(ticket_id);
    if (it == tickets.end()) throw std::runtime_error("no such ticket " + ticket_id);
    return it->second;
  }
  void add(const Ticket& t) {
    std::lock_guard<std::mutex> lk(mu);
    tickets[t.id] = t;
  }
  std::mutex mu;
  std::map<std::string, Ticket> tickets;
  std::atomic<bool> fail{false};
  std::atomic<int> calls{0};
};

class FakeRoster : public RosterService {
 public:
  explicit FakeRoster(std::vector<Executor> pool = {}) : executors(std::move(pool)) {}
  std::vector<Executor> list_available_executors(const std::optional<std::string>&) override {
    ++calls;
    if (delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms.load()));
    if (fail) throw std::runtime_error("roster down");
    return executors;
  }
  std::vector<Executor> executors;
  std::atomic<int> delay_ms{0};
  std::atomic<bool> fail{false};
  std::atomic<int> calls{0};
};

class FakeStore : public AssignmentStore {
 public:
  void update_ticket_assignment(const std::string& ticket_id, const std::string& executor_id,
                                const std::map<std::string, std::string>& metadata) override {
    if (fail) throw std::runtime_error("store down");
    std::lock_guard<std::mutex> lk(mu);
    commits.emplace_back(ticket_id, executor_id, metadata);
  }
  size_t count() {
    std::lock_guard<std::mutex> lk(mu);
    return commits.size();
  }
  std::mutex mu;
  std::vector<std::tuple<std::string, std::string, std::map<std::string, std::string>>> commits;
  std::atomic<bool> fail{false};
};

struct Notification {
  std::string user_id;
  std::string message;
  std::string priority;
};

class FakeNotifier : public Notifier {
 public:
  void notify(const std::string& user_id, const std::string& message,
              const std::string& priority) override {
    if (fail) throw std::runtime_error("notifier down");
    std::lock_guard<std::mutex> lk(mu);
    sent.push_back({user_id, message, priority});
  }
  std::mutex mu;
  std::vector<Notification> sent;
  std::atomic<bool> fail{false};
};

struct FakeWorld {
  std::shared_ptr<FakePermissions> permissions = std::make_shared<FakePermissions>();
  std::shared_ptr<FakeTickets> tickets = std::make_shared<FakeTickets>();
  std::shared_ptr<FakeRoster> roster = std::make_shared<FakeRoster>();
  std::shared_ptr<FakeStore> store = std::make_shared<FakeStore>();
  std::shared_ptr<FakeNotifier> notifier = std::make_shared<FakeNotifier>();

  Collaborators collaborators() const {
    Collaborators c;
    c.permissions = permissions;
    c.tickets = tickets;
    c.roster = roster;
    c.store = store;
    c.notifier = notifier;
    return c;
  }
};

}  // namespace testing_support
}  // namespace dispatch
