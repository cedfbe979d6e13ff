#include "fallback_data.h"

namespace dispatch {

const std::vector<Executor>& fallback_executors() {
  static const std::vector<Executor> table = [] {
    auto make = [](const char* id, const char* name, std::vector<std::string> skills,
                   const char* zone, double efficiency, int capacity) {
      Executor e;
      e.id = id;
      e.name = name;
      e.skills = std::move(skills);
      e.zone = zone;
      e.efficiency = efficiency;
      e.capacity = capacity;
      e.current_load = 0;
      e.available = true;
      return e;
    };
    return std::vector<Executor>{
        make("fallback-01", "Duty generalist (north)", {"general"}, "Yunusabad", 70, 10),
        make("fallback-02", "Duty generalist (south)", {"general"}, "Chilanzar", 70, 10),
        make("fallback-03", "Duty plumber", {"plumbing", "general"}, "Mirzo-Ulugbek", 75, 6),
        make("fallback-04", "Duty electrician", {"electrical", "general"}, "Yashnabad", 75, 6),
    };
  }();
  return table;
}

}  // namespace dispatch
