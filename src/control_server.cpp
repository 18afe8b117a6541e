/**
 * @file control_server.cpp
 * @brief Route table for the control API
 */

#include "live_chunker/control_server.hpp"

#include <cstdlib>

#include <httplib.h>

#include "live_chunker/logging.hpp"

namespace live_chunker {

namespace {

void reply(httplib::Response &res, const ControlResponse &response) {
  res.status = response.status;
  res.set_content(response.body.dump(), "application/json");
}

std::size_t limit_param(const httplib::Request &req) {
  constexpr std::size_t DEFAULT_LIMIT = 25;
  if (!req.has_param("limit"))
    return DEFAULT_LIMIT;
  long value = std::strtol(req.get_param_value("limit").c_str(), nullptr, 10);
  return value > 0 ? static_cast<std::size_t>(value) : DEFAULT_LIMIT;
}

} // anonymous namespace

ControlServer::ControlServer(ControlSurface &surface)
    : surface_(surface), http_srv_(std::make_unique<httplib::Server>()) {
  register_routes();
}

ControlServer::~ControlServer() { stop(); }

void ControlServer::register_routes() {
  http_srv_->Post(R"(/api/streams/([^/]+)/start)",
                  [this](const httplib::Request &req, httplib::Response &res) {
                    reply(res, surface_.start_stream(req.matches[1]));
                  });
  http_srv_->Post(R"(/api/streams/([^/]+)/stop)",
                  [this](const httplib::Request &req, httplib::Response &res) {
                    reply(res, surface_.stop_stream(req.matches[1]));
                  });
  http_srv_->Post(R"(/api/streams/([^/]+)/restart)",
                  [this](const httplib::Request &req, httplib::Response &res) {
                    reply(res, surface_.restart_stream(req.matches[1]));
                  });
  http_srv_->Get("/api/streams",
                 [this](const httplib::Request &, httplib::Response &res) {
                   reply(res, surface_.list_streams());
                 });
  http_srv_->Get(R"(/api/streams/([^/]+))",
                 [this](const httplib::Request &req, httplib::Response &res) {
                   reply(res, surface_.stream_status(req.matches[1]));
                 });
  http_srv_->Post("/api/streams/reload",
                  [this](const httplib::Request &, httplib::Response &res) {
                    reply(res, surface_.reload_catalog());
                  });

  http_srv_->Get("/api/processing/queue",
                 [this](const httplib::Request &, httplib::Response &res) {
                   reply(res, surface_.queue_status());
                 });
  http_srv_->Get("/api/processing/jobs",
                 [this](const httplib::Request &req, httplib::Response &res) {
                   reply(res, surface_.job_history(limit_param(req)));
                 });
  http_srv_->Get(R"(/api/processing/jobs/([^/]+))",
                 [this](const httplib::Request &req, httplib::Response &res) {
                   reply(res, surface_.job(req.matches[1]));
                 });
  http_srv_->Post("/api/processing/sweep",
                  [this](const httplib::Request &, httplib::Response &res) {
                    reply(res, surface_.sweep());
                  });

  http_srv_->Get("/health",
                 [this](const httplib::Request &, httplib::Response &res) {
                   reply(res, surface_.health());
                 });
}

bool ControlServer::start(const std::string &host, int port) {
  if (!http_srv_->bind_to_port(host.c_str(), port)) {
    LOG_ERROR("[Control] Could not bind {}:{}", host, port);
    return false;
  }
  http_thread_ = std::thread([this] { http_srv_->listen_after_bind(); });
  LOG_INFO("[Control] Listening on {}:{}", host, port);
  return true;
}

void ControlServer::stop() {
  if (http_srv_)
    http_srv_->stop();
  if (http_thread_.joinable())
    http_thread_.join();
}

} // namespace live_chunker
