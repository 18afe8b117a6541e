/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Clock, id and formatting helpers
 *
 *          - Log tail reading
 */

#include "live_chunker/system.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <random>
#include <string>
#include <thread>

namespace live_chunker {

// **---- Internal Helpers ----**

namespace {

/// CPUs granted by a CFS quota, -1 when unlimited or unreadable
int quota_cpus() {
  long quota = -1;
  long period = -1;

  std::ifstream v2("/sys/fs/cgroup/cpu.max");
  if (v2) {
    std::string quota_str;
    v2 >> quota_str >> period;
    if (quota_str == "max" || !v2)
      return -1;
    quota = std::strtol(quota_str.c_str(), nullptr, 10);
  } else {
    std::ifstream q("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    std::ifstream p("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (!(q >> quota) || !(p >> period))
      return -1;
  }
  if (quota <= 0 || period <= 0)
    return -1;
  return static_cast<int>((quota + period - 1) / period);
}

/// Cores listed in a cpuset file ("0-3,6"), -1 when unreadable
int cpuset_cpus(const char *path) {
  std::ifstream f(path);
  std::string line;
  if (!f || !std::getline(f, line) || line.empty())
    return -1;

  int count = 0;
  std::size_t pos = 0;
  while (pos < line.size()) {
    std::size_t comma = line.find(',', pos);
    if (comma == std::string::npos)
      comma = line.size();
    std::string item = line.substr(pos, comma - pos);
    std::size_t dash = item.find('-');
    if (dash == std::string::npos) {
      count += 1;
    } else {
      int lo = std::atoi(item.substr(0, dash).c_str());
      int hi = std::atoi(item.substr(dash + 1).c_str());
      count += hi >= lo ? hi - lo + 1 : 0;
    }
    pos = comma + 1;
  }
  return count > 0 ? count : -1;
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int cores = cpuset_cpus("/sys/fs/cgroup/cpuset.cpus.effective");
  if (cores <= 0)
    cores = cpuset_cpus("/sys/fs/cgroup/cpuset/cpuset.cpus");
  if (cores <= 0)
    cores = static_cast<int>(std::thread::hardware_concurrency());

  /// A quota narrower than the visible cores wins
  int quota = quota_cpus();
  int limit = quota > 0 && (cores <= 0 || quota < cores) ? quota : cores;
  return std::clamp(limit, 1, 64);
}

// **---- Clocks & Ids ----**

int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string random_hex(std::size_t length) {
  static const char digits[] = "0123456789abcdef";
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<int> pick(0, 15);

  std::string out;
  out.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    out.push_back(digits[pick(rng)]);
  }
  return out;
}

// **---- Files ----**

std::string read_tail(const std::string &path, std::size_t max_bytes) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f)
    return {};

  std::streamoff size = f.tellg();
  std::streamoff from =
      size > static_cast<std::streamoff>(max_bytes)
          ? size - static_cast<std::streamoff>(max_bytes)
          : 0;
  f.seekg(from);

  std::string out(static_cast<std::size_t>(size - from), '\0');
  f.read(&out[0], static_cast<std::streamsize>(out.size()));
  out.resize(static_cast<std::size_t>(f.gcount()));

  while (!out.empty() && (out.back() == '\n' || out.back() == '\r'))
    out.pop_back();
  return out;
}

} // namespace live_chunker
