/**
 * @file system.hpp
 * @brief System utilities: CPU detection, clocks, ids and file helpers
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Wall-clock milliseconds
 *
 *          - Random hex ids for chunks and jobs
 *
 *          - Tail reading of subprocess log files
 *
 * @note For Docker containers, CPU discovery respects cgroup limits set by
 *       docker-compose or docker run --cpus flags.
 */

#ifndef LIVE_CHUNKER_SYSTEM_HPP
#define LIVE_CHUNKER_SYSTEM_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace live_chunker {

// **---- CPU Detection ----**

/**
 * @brief Detect the CPU limit for this container/process.
 *
 * @details Visible cores come from the cgroup cpuset, falling back to
 *          std::thread::hardware_concurrency(). A CFS quota (cgroup v2
 *          cpu.max or v1 cfs_quota_us) lowers that count when tighter.
 *
 * @return Worker count to use (minimum 1, maximum 64)
 */
int detect_cpu_limit();

// **---- Clocks & Ids ----**

/// Milliseconds since the Unix epoch (wall clock)
int64_t now_ms();

/**
 * @brief Random lowercase hex string.
 * @param length Number of hex digits
 */
std::string random_hex(std::size_t length);

// **---- Files ----**

/**
 * @brief Read the last bytes of a text file, trimmed of trailing newlines.
 * @param path File to read
 * @param max_bytes Upper bound on returned size
 * @return Tail content, empty if the file is missing
 */
std::string read_tail(const std::string &path, std::size_t max_bytes);

} // namespace live_chunker

#endif // LIVE_CHUNKER_SYSTEM_HPP
