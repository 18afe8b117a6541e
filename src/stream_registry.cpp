/**
 * @file stream_registry.cpp
 * @brief Stream registry implementation
 */

#include "live_chunker/stream_registry.hpp"

namespace live_chunker {

StreamSnapshot StreamRuntimeState::snapshot() const {
  StreamSnapshot s;
  s.id = descriptor.id;
  s.name = descriptor.name;
  s.source_kind = descriptor.source.kind();
  s.status = status;
  s.pid = (process && process->running()) ? process->pid() : 0;
  s.start_time_ms = start_time_ms;
  s.restart_count = restart_count;
  s.last_error = last_error;
  s.manually_stopped = manual_stop;
  s.output_dir = output_dir;
  s.playlist_url = playlist_url;
  return s;
}

StreamRuntimeState *StreamRegistry::find(const std::string &id) {
  auto it = entries_.find(id);
  return it == entries_.end() ? nullptr : &it->second;
}

StreamRuntimeState &StreamRegistry::insert(StreamRuntimeState state) {
  std::string id = state.descriptor.id;
  auto result = entries_.emplace(std::move(id), std::move(state));
  return result.first->second;
}

std::size_t StreamRegistry::live_count() const {
  std::size_t n = 0;
  for (const auto &entry : entries_) {
    if (entry.second.status != StreamStatus::Stopped)
      ++n;
  }
  return n;
}

std::optional<StreamSnapshot>
StreamRegistry::snapshot(const std::string &id) const {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end())
    return std::nullopt;
  return it->second.snapshot();
}

std::vector<StreamSnapshot> StreamRegistry::snapshot_all() const {
  std::lock_guard<std::mutex> guard(mutex_);
  std::vector<StreamSnapshot> out;
  out.reserve(entries_.size());
  for (const auto &entry : entries_)
    out.push_back(entry.second.snapshot());
  return out;
}

} // namespace live_chunker
