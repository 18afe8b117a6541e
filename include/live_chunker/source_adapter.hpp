/**
 * @file source_adapter.hpp
 * @brief Video source model and transcoder input arguments
 *
 * @details Provides:
 *          - SourceSpec: validated tagged union of the supported origins
 *            (looped local file, network feed over RTSP/RTMP/HTTP)
 *
 *          - transcoder_input_args(): ffmpeg flags placed before the output
 *            section, per source kind
 *
 *          - Credential splitting and redaction for logged command lines
 */

#ifndef LIVE_CHUNKER_SOURCE_ADAPTER_HPP
#define LIVE_CHUNKER_SOURCE_ADAPTER_HPP

#include <string>
#include <variant>
#include <vector>

namespace live_chunker {

// **----- Source Model -----**

enum class SourceKind { LoopedFile, NetworkFeed };

enum class Transport { Rtsp, Rtmp, Http };

const char *to_string(SourceKind kind);
const char *to_string(Transport transport);

/// Local file replayed forever at native rate
struct LoopedFileSource {
  std::string path;
};

/// Live network feed
struct NetworkFeedSource {
  Transport transport = Transport::Rtsp;
  std::string url;
};

/**
 * @class SourceSpec
 * @brief Immutable, validated description of where a stream's video comes
 *        from.
 *
 * @note Construct through the named factories; they throw
 *       std::invalid_argument when a kind-specific field is missing or the URL
 *       scheme does not match the transport.
 */
class SourceSpec {
public:
  using Variant = std::variant<LoopedFileSource, NetworkFeedSource>;

  static SourceSpec looped_file(std::string path);
  static SourceSpec network_feed(Transport transport, std::string url);

  /**
   * @brief Build from catalog strings.
   * @param kind One of "file", "rtsp", "rtmp", "http"
   * @param locator File path or URL
   */
  static SourceSpec parse(const std::string &kind, const std::string &locator);

  SourceKind kind() const;
  const Variant &value() const { return source_; }

  /// File path or URL, as configured (may contain credentials)
  const std::string &locator() const;

private:
  explicit SourceSpec(Variant source) : source_(std::move(source)) {}

  Variant source_;
};

// **----- Credentials -----**

/// URL split into credential-free form plus user/password
struct UrlCredentials {
  std::string url; //< URL with user:pass@ removed
  std::string user;
  std::string password;

  bool present() const { return !user.empty() || !password.empty(); }
};

/**
 * @brief Remove "user:pass@" from a URL authority.
 * @note Percent-encoded credentials are passed through undecoded.
 */
UrlCredentials split_credentials(const std::string &url);

/// Replace any password in a URL with "***"
std::string redact_url(const std::string &url);

// **----- Transcoder Arguments -----**

struct SourceAdapterOptions {
  long long network_timeout_us = 10000000; //< -timeout for network feeds

  static SourceAdapterOptions from_env();
};

/**
 * @brief Input section of an ffmpeg command line for a source.
 *
 * @details LoopedFile: -re -stream_loop -1 -i <path>
 *
 *          Rtsp: -rtsp_transport tcp -timeout <us> [-rtsp_user u
 *                -rtsp_password p] -i <url without credentials>
 *
 *          Rtmp/Http: -i <url>
 */
std::vector<std::string> transcoder_input_args(const SourceSpec &source,
                                               const SourceAdapterOptions &opts);

/**
 * @brief Render a command line for logs with secrets masked.
 * @note Masks the value after -rtsp_password and any URL password.
 */
std::string render_command(const std::string &program,
                           const std::vector<std::string> &args);

} // namespace live_chunker

#endif // LIVE_CHUNKER_SOURCE_ADAPTER_HPP
