/**
 * @file control_server.hpp
 * @brief HTTP front end for ControlSurface
 */

#ifndef LIVE_CHUNKER_CONTROL_SERVER_HPP
#define LIVE_CHUNKER_CONTROL_SERVER_HPP

#include <memory>
#include <string>
#include <thread>

#include "control_surface.hpp"

namespace httplib {
class Server;
}

namespace live_chunker {

class ControlServer {
public:
  explicit ControlServer(ControlSurface &surface);
  ~ControlServer();

  ControlServer(const ControlServer &) = delete;
  ControlServer &operator=(const ControlServer &) = delete;

  /**
   * @brief Binds and starts serving on a background thread
   * @return false when the port could not be bound
   */
  bool start(const std::string &host, int port);

  void stop();

private:
  void register_routes();

  ControlSurface &surface_;
  std::unique_ptr<httplib::Server> http_srv_;
  std::thread http_thread_;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_CONTROL_SERVER_HPP
