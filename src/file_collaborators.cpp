#include "file_collaborators.h"

#include <algorithm>

namespace dispatch {

SnapshotTicketService::SnapshotTicketService(std::vector<Ticket> tickets) {
  for (auto& t : tickets) by_id_.emplace(t.id, std::move(t));
}

Ticket SnapshotTicketService::get_ticket(const std::string& ticket_id) {
  auto it = by_id_.find(ticket_id);
  if (it == by_id_.end()) throw std::runtime_error("ticket not found: " + ticket_id);
  return it->second;
}

std::vector<Executor> SnapshotRosterService::list_available_executors(
    const std::optional<std::string>& skill_filter) {
  std::vector<Executor> out;
  for (const auto& e : executors_) {
    if (!e.available) continue;
    if (skill_filter && !e.has_skill(*skill_filter)) continue;
    out.push_back(e);
  }
  return out;
}

void RecordingStore::update_ticket_assignment(const std::string& ticket_id,
                                              const std::string& executor_id,
                                              const std::map<std::string, std::string>& metadata) {
  std::lock_guard<std::mutex> lk(mu_);
  commits_.push_back({{"ticket_id", ticket_id}, {"executor_id", executor_id}, {"metadata", metadata}});
}

json RecordingStore::to_json() const {
  std::lock_guard<std::mutex> lk(mu_);
  return commits_;
}

void ConsoleNotifier::notify(const std::string& user_id, const std::string& message,
                             const std::string& priority) {
  log_info(verbose_, "notify", "[" + priority + "] " + user_id + ": " + message);
}

}  // namespace dispatch
