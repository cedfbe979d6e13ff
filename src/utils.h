// utils.h
#pragma once
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <mutex>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "errors.h"

namespace dispatch {

using json = nlohmann::json;

// Returns current steady time in milliseconds
static inline long long NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
               steady_clock::now().time_since_epoch()
           ).count();
}

// Wall-clock budget checked between iterations. Default is unlimited.
struct Deadline {
  std::chrono::steady_clock::time_point at = std::chrono::steady_clock::time_point::max();

  static Deadline in_ms(long long ms) {
    Deadline d;
    if (ms > 0) d.at = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    return d;
  }
  bool unlimited() const { return at == std::chrono::steady_clock::time_point::max(); }
  bool expired() const { return !unlimited() && std::chrono::steady_clock::now() >= at; }
};

// ---------- logging ----------
// One mutex for all console output so lines from concurrent requests don't interleave.
inline std::mutex& io_mutex() {
  static std::mutex mu;
  return mu;
}

inline void log_line(std::ostream& os, const std::string& tag, const std::string& msg) {
  std::lock_guard<std::mutex> lk(io_mutex());
  os << "[" << tag << "] " << msg << "\n";
}

// Info lines go to stdout unless redirected, e.g. when stdout carries the result.
inline std::ostream*& info_stream_slot() {
  static std::ostream* os = &std::cout;
  return os;
}

inline void set_info_stream(std::ostream& os) {
  std::lock_guard<std::mutex> lk(io_mutex());
  info_stream_slot() = &os;
}

inline void log_info(const std::string& tag, const std::string& msg) {
  std::lock_guard<std::mutex> lk(io_mutex());
  *info_stream_slot() << "[" << tag << "] " << msg << "\n";
}

inline void log_info(bool verbose, const std::string& tag, const std::string& msg) {
  if (verbose) log_info(tag, msg);
}

inline void log_warn(const std::string& tag, const std::string& msg) {
  log_line(std::cerr, tag, msg);
}

inline std::string fmt_double(double v, int precision = 3) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << v;
  return oss.str();
}

// ---------- json files ----------
static inline json load_json(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw InvalidConfiguration("Cannot open file: " + path);
  try {
    json j; in >> j; return j;
  } catch (const json::exception& e) {
    throw InvalidConfiguration("Malformed JSON in " + path + ": " + e.what());
  }
}

static inline void save_json(const std::string& path, const json& j) {
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Cannot write file: " + path);
  out << std::setw(2) << j << "\n";
}

}  // namespace dispatch
