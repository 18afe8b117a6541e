/**
 * @file source_adapter.cpp
 * @brief Source validation and transcoder input arguments
 */

#include "live_chunker/source_adapter.hpp"

#include <stdexcept>

#include <fmt/core.h>

#include "live_chunker/config.hpp"

namespace live_chunker {

namespace {

bool starts_with(const std::string &s, const char *prefix) {
  return s.rfind(prefix, 0) == 0;
}

bool scheme_matches(Transport transport, const std::string &url) {
  switch (transport) {
  case Transport::Rtsp:
    return starts_with(url, "rtsp://") || starts_with(url, "rtsps://");
  case Transport::Rtmp:
    return starts_with(url, "rtmp://") || starts_with(url, "rtmps://");
  case Transport::Http:
    return starts_with(url, "http://") || starts_with(url, "https://");
  }
  return false;
}

/// [begin, end) of the authority's userinfo, or npos if none
bool find_userinfo(const std::string &url, size_t &begin, size_t &at) {
  size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos)
    return false;
  begin = scheme_end + 3;
  size_t authority_end = url.find_first_of("/?#", begin);
  if (authority_end == std::string::npos)
    authority_end = url.size();
  at = url.rfind('@', authority_end);
  return at != std::string::npos && at >= begin && at < authority_end;
}

} // anonymous namespace

// **----- Source Model -----**

const char *to_string(SourceKind kind) {
  switch (kind) {
  case SourceKind::LoopedFile:
    return "looped_file";
  case SourceKind::NetworkFeed:
    return "network_feed";
  }
  return "unknown";
}

const char *to_string(Transport transport) {
  switch (transport) {
  case Transport::Rtsp:
    return "rtsp";
  case Transport::Rtmp:
    return "rtmp";
  case Transport::Http:
    return "http";
  }
  return "unknown";
}

SourceSpec SourceSpec::looped_file(std::string path) {
  if (path.empty())
    throw std::invalid_argument("looped file source requires a path");
  return SourceSpec(LoopedFileSource{std::move(path)});
}

SourceSpec SourceSpec::network_feed(Transport transport, std::string url) {
  if (url.empty())
    throw std::invalid_argument("network feed source requires a url");
  if (!scheme_matches(transport, url)) {
    throw std::invalid_argument(fmt::format(
        "url '{}' does not match transport {}", redact_url(url),
        to_string(transport)));
  }
  return SourceSpec(NetworkFeedSource{transport, std::move(url)});
}

SourceSpec SourceSpec::parse(const std::string &kind,
                             const std::string &locator) {
  if (kind == "file")
    return looped_file(locator);
  if (kind == "rtsp")
    return network_feed(Transport::Rtsp, locator);
  if (kind == "rtmp")
    return network_feed(Transport::Rtmp, locator);
  if (kind == "http")
    return network_feed(Transport::Http, locator);
  throw std::invalid_argument(fmt::format("unknown source kind '{}'", kind));
}

SourceKind SourceSpec::kind() const {
  return std::holds_alternative<LoopedFileSource>(source_)
             ? SourceKind::LoopedFile
             : SourceKind::NetworkFeed;
}

const std::string &SourceSpec::locator() const {
  if (const auto *file = std::get_if<LoopedFileSource>(&source_))
    return file->path;
  return std::get<NetworkFeedSource>(source_).url;
}

// **----- Credentials -----**

UrlCredentials split_credentials(const std::string &url) {
  UrlCredentials out;
  size_t begin = 0, at = 0;
  if (!find_userinfo(url, begin, at)) {
    out.url = url;
    return out;
  }

  std::string userinfo = url.substr(begin, at - begin);
  size_t colon = userinfo.find(':');
  if (colon == std::string::npos) {
    out.user = userinfo;
  } else {
    out.user = userinfo.substr(0, colon);
    out.password = userinfo.substr(colon + 1);
  }
  out.url = url.substr(0, begin) + url.substr(at + 1);
  return out;
}

std::string redact_url(const std::string &url) {
  size_t begin = 0, at = 0;
  if (!find_userinfo(url, begin, at))
    return url;
  size_t colon = url.find(':', begin);
  if (colon == std::string::npos || colon > at)
    return url;
  return url.substr(0, colon + 1) + "***" + url.substr(at);
}

// **----- Transcoder Arguments -----**

SourceAdapterOptions SourceAdapterOptions::from_env() {
  SourceAdapterOptions opts;
  opts.network_timeout_us = Config::rtsp_timeout_us();
  return opts;
}

std::vector<std::string> transcoder_input_args(const SourceSpec &source,
                                               const SourceAdapterOptions &opts) {
  if (const auto *file = std::get_if<LoopedFileSource>(&source.value())) {
    return {"-re", "-stream_loop", "-1", "-i", file->path};
  }

  const auto &feed = std::get<NetworkFeedSource>(source.value());
  if (feed.transport != Transport::Rtsp) {
    return {"-i", feed.url};
  }

  std::vector<std::string> args = {"-rtsp_transport", "tcp", "-timeout",
                                   std::to_string(opts.network_timeout_us)};
  UrlCredentials creds = split_credentials(feed.url);
  if (creds.present()) {
    args.push_back("-rtsp_user");
    args.push_back(creds.user);
    args.push_back("-rtsp_password");
    args.push_back(creds.password);
  }
  args.push_back("-i");
  args.push_back(creds.url);
  return args;
}

std::string render_command(const std::string &program,
                           const std::vector<std::string> &args) {
  std::string out = program;
  bool mask_next = false;
  for (const auto &arg : args) {
    out += ' ';
    if (mask_next) {
      out += "***";
      mask_next = false;
      continue;
    }
    out += redact_url(arg);
    mask_next = (arg == "-rtsp_password");
  }
  return out;
}

} // namespace live_chunker
