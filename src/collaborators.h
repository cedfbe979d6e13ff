// collaborators.h
#pragma once
#include "types.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dispatch {

// Outbound services the engine depends on. Implementations may block or
// throw; every call goes through the resilience layer.

class PermissionService {
 public:
  virtual ~PermissionService() = default;
  virtual bool can_assign(const std::string& user_id, const std::string& ticket_id) = 0;
};

class TicketService {
 public:
  virtual ~TicketService() = default;
  virtual Ticket get_ticket(const std::string& ticket_id) = 0;
};

class RosterService {
 public:
  virtual ~RosterService() = default;
  virtual std::vector<Executor> list_available_executors(
      const std::optional<std::string>& skill_filter) = 0;
};

class AssignmentStore {
 public:
  virtual ~AssignmentStore() = default;
  virtual void update_ticket_assignment(const std::string& ticket_id,
                                        const std::string& executor_id,
                                        const std::map<std::string, std::string>& metadata) = 0;
};

// Fire-and-forget; failures are logged, never surfaced.
class Notifier {
 public:
  virtual ~Notifier() = default;
  virtual void notify(const std::string& user_id, const std::string& message,
                      const std::string& priority) = 0;
};

struct Collaborators {
  std::shared_ptr<PermissionService> permissions;
  std::shared_ptr<TicketService> tickets;
  std::shared_ptr<RosterService> roster;
  std::shared_ptr<AssignmentStore> store;
  std::shared_ptr<Notifier> notifier;
};

}  // namespace dispatch
