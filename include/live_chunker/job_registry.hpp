/**
 * @file job_registry.hpp
 * @brief Live processing jobs and bounded history of finished ones
 *
 * @details Injected into ProcessingQueue, which is its only writer and
 *          serialises every call under its own mutex.
 */

#ifndef LIVE_CHUNKER_JOB_REGISTRY_HPP
#define LIVE_CHUNKER_JOB_REGISTRY_HPP

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace live_chunker {

class JobRegistry {
public:
  JobRegistry(std::size_t completed_limit = 10, std::size_t failed_limit = 25);

  void set_limits(std::size_t completed_limit, std::size_t failed_limit);

  ProcessingJob &insert(ProcessingJob job);

  /// Waiting or processing job, nullptr otherwise
  ProcessingJob *find_live(const std::string &id);

  /// Live job or one still in history
  std::optional<ProcessingJob> find(const std::string &id) const;

  /// Detach a live job (it must exist)
  ProcessingJob remove_live(const std::string &id);

  /**
   * @brief Move a finished job into the completed or failed history,
   *        dropping the oldest entry past the limit.
   */
  void retire(ProcessingJob job);

  std::size_t live_count() const { return live_.size(); }
  std::vector<ProcessingJob> live() const;

  /// Newest first
  std::vector<ProcessingJob> completed() const;
  std::vector<ProcessingJob> failed() const;

private:
  std::size_t completed_limit_;
  std::size_t failed_limit_;
  std::unordered_map<std::string, ProcessingJob> live_;
  std::deque<ProcessingJob> completed_;
  std::deque<ProcessingJob> failed_;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_JOB_REGISTRY_HPP
