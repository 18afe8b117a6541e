/**
 * @file control_surface.hpp
 * @brief JSON control operations over a running Service
 *
 * @details Transport-independent: each operation returns an HTTP-style status
 *          code and a JSON body. ControlServer maps them onto routes.
 */

#ifndef LIVE_CHUNKER_CONTROL_SURFACE_HPP
#define LIVE_CHUNKER_CONTROL_SURFACE_HPP

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "service.hpp"

namespace live_chunker {

struct ControlResponse {
  int status = 200;
  nlohmann::json body;
};

/// JSON forms of the data model
nlohmann::json to_json(const StreamSnapshot &stream);
nlohmann::json to_json(const StreamReport &report);
nlohmann::json to_json(const ProcessingJob &job);
nlohmann::json to_json(const QueueStats &stats);
nlohmann::json to_json(const PipelineMetrics &metrics);

class ControlSurface {
public:
  explicit ControlSurface(Service &service);

  /// Marks the stream desired-active, then activates it
  ControlResponse start_stream(const std::string &id);

  /// Clears desired-active, then stops it
  ControlResponse stop_stream(const std::string &id);

  ControlResponse restart_stream(const std::string &id);
  ControlResponse stream_status(const std::string &id) const;
  ControlResponse list_streams() const;

  ControlResponse queue_status() const;
  ControlResponse job_history(std::size_t limit) const;
  ControlResponse job(const std::string &id) const;

  ControlResponse sweep();
  ControlResponse reload_catalog();

  /// 503 when unhealthy
  ControlResponse health() const;

private:
  Service &service_;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_CONTROL_SURFACE_HPP
