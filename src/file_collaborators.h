// file_collaborators.h
#pragma once
#include "collaborators.h"
#include "utils.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace dispatch {

// Collaborators backed by JSON snapshots, used by the command-line tool.

class SnapshotTicketService : public TicketService {
 public:
  explicit SnapshotTicketService(std::vector<Ticket> tickets);
  Ticket get_ticket(const std::string& ticket_id) override;

 private:
  std::map<std::string, Ticket> by_id_;
};

class SnapshotRosterService : public RosterService {
 public:
  explicit SnapshotRosterService(std::vector<Executor> executors) : executors_(std::move(executors)) {}
  std::vector<Executor> list_available_executors(const std::optional<std::string>& skill_filter) override;

 private:
  std::vector<Executor> executors_;
};

class AllowAllPermissions : public PermissionService {
 public:
  bool can_assign(const std::string&, const std::string&) override { return true; }
};

// Collects commits; written out as the "commits" section of the result file.
class RecordingStore : public AssignmentStore {
 public:
  void update_ticket_assignment(const std::string& ticket_id,
                                const std::string& executor_id,
                                const std::map<std::string, std::string>& metadata) override;
  json to_json() const;

 private:
  mutable std::mutex mu_;
  json commits_ = json::array();
};

class ConsoleNotifier : public Notifier {
 public:
  explicit ConsoleNotifier(bool verbose) : verbose_(verbose) {}
  void notify(const std::string& user_id, const std::string& message,
              const std::string& priority) override;

 private:
  bool verbose_;
};

}  // namespace dispatch
