/**
 * @file stream_registry.hpp
 * @brief Runtime state of every supervised stream
 *
 * @details The registry is an explicit object handed to the supervisor; the
 *          supervisor is its only writer. Readers take snapshots, which copy
 *          out under the registry mutex.
 */

#ifndef LIVE_CHUNKER_STREAM_REGISTRY_HPP
#define LIVE_CHUNKER_STREAM_REGISTRY_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "event_loop.hpp"
#include "subprocess.hpp"
#include "types.hpp"

namespace live_chunker {

/**
 * @struct StreamRuntimeState
 * @brief Mutable per-stream supervision record.
 *
 * @note generation increases on every launch, restart and stop. Exit and
 *       verification events carry the generation they were issued for and
 *       are dropped when it no longer matches.
 */
struct StreamRuntimeState {
  explicit StreamRuntimeState(StreamDescriptor desc)
      : descriptor(std::move(desc)) {}

  StreamDescriptor descriptor;
  StreamStatus status = StreamStatus::Stopped;
  std::unique_ptr<ProcessHandle> process; //< At most one live handle
  int64_t start_time_ms = 0;
  int restart_count = 0;
  std::string last_error;
  bool manual_stop = false;
  std::string output_dir;
  std::string playlist_url;

  uint64_t generation = 0;
  EventLoop::TimerId verify_timer = 0;
  EventLoop::TimerId restart_timer = 0;

  StreamSnapshot snapshot() const;
};

/**
 * @class StreamRegistry
 * @brief Map of stream id to runtime state guarded by one mutex.
 *
 * @attention find(), insert(), entries() and live_count() require the caller
 *            to hold lock().
 */
class StreamRegistry {
public:
  std::unique_lock<std::mutex> lock() const {
    return std::unique_lock<std::mutex>(mutex_);
  }

  StreamRuntimeState *find(const std::string &id);
  StreamRuntimeState &insert(StreamRuntimeState state);
  std::map<std::string, StreamRuntimeState> &entries() { return entries_; }

  /// Streams that hold a capacity slot (anything not stopped)
  std::size_t live_count() const;

  std::optional<StreamSnapshot> snapshot(const std::string &id) const;
  std::vector<StreamSnapshot> snapshot_all() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, StreamRuntimeState> entries_;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_STREAM_REGISTRY_HPP
