// fallback_data.h
#pragma once
#include "types.h"

#include <vector>

namespace dispatch {

// Bump whenever the table below changes.
inline constexpr int FALLBACK_DATA_VERSION = 1;

// Static roster used when neither the live roster nor a snapshot is
// available. Deterministic; always contains at least one generalist.
const std::vector<Executor>& fallback_executors();

}  // namespace dispatch
