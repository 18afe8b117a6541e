/**
 * @file job_registry.cpp
 * @brief Job registry implementation
 */

#include "live_chunker/job_registry.hpp"

#include <stdexcept>
#include <utility>

namespace live_chunker {

JobRegistry::JobRegistry(std::size_t completed_limit, std::size_t failed_limit)
    : completed_limit_(completed_limit), failed_limit_(failed_limit) {}

void JobRegistry::set_limits(std::size_t completed_limit,
                             std::size_t failed_limit) {
  completed_limit_ = completed_limit;
  failed_limit_ = failed_limit;
  while (completed_.size() > completed_limit_)
    completed_.pop_back();
  while (failed_.size() > failed_limit_)
    failed_.pop_back();
}

ProcessingJob &JobRegistry::insert(ProcessingJob job) {
  std::string id = job.id;
  auto result = live_.insert_or_assign(std::move(id), std::move(job));
  return result.first->second;
}

ProcessingJob *JobRegistry::find_live(const std::string &id) {
  auto it = live_.find(id);
  return it == live_.end() ? nullptr : &it->second;
}

std::optional<ProcessingJob> JobRegistry::find(const std::string &id) const {
  auto it = live_.find(id);
  if (it != live_.end())
    return it->second;
  for (const auto &job : completed_) {
    if (job.id == id)
      return job;
  }
  for (const auto &job : failed_) {
    if (job.id == id)
      return job;
  }
  return std::nullopt;
}

ProcessingJob JobRegistry::remove_live(const std::string &id) {
  auto it = live_.find(id);
  if (it == live_.end())
    throw std::out_of_range("unknown job " + id);
  ProcessingJob job = std::move(it->second);
  live_.erase(it);
  return job;
}

void JobRegistry::retire(ProcessingJob job) {
  auto &history = job.status == JobStatus::Completed ? completed_ : failed_;
  std::size_t limit =
      job.status == JobStatus::Completed ? completed_limit_ : failed_limit_;
  history.push_front(std::move(job));
  while (history.size() > limit)
    history.pop_back();
}

std::vector<ProcessingJob> JobRegistry::live() const {
  std::vector<ProcessingJob> out;
  out.reserve(live_.size());
  for (const auto &entry : live_)
    out.push_back(entry.second);
  return out;
}

std::vector<ProcessingJob> JobRegistry::completed() const {
  return std::vector<ProcessingJob>(completed_.begin(), completed_.end());
}

std::vector<ProcessingJob> JobRegistry::failed() const {
  return std::vector<ProcessingJob>(failed_.begin(), failed_.end());
}

} // namespace live_chunker
