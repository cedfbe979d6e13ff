// errors.h
#pragma once
#include <stdexcept>
#include <string>

namespace dispatch {

// Bad weights, unknown algorithm/mode names, malformed config or input files.
// The only error allowed to abort processing.
struct InvalidConfiguration : std::runtime_error {
  explicit InvalidConfiguration(const std::string& msg) : std::runtime_error(msg) {}
};

// An external call failed, timed out or was short-circuited by its breaker.
// Never leaves the resilience layer.
struct DependencyUnavailable : std::runtime_error {
  DependencyUnavailable(const std::string& dependency, const std::string& msg)
      : std::runtime_error(dependency + ": " + msg), dependency(dependency) {}
  std::string dependency;
};

}  // namespace dispatch
