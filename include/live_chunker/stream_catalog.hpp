/**
 * @file stream_catalog.hpp
 * @brief Stream descriptors and their desired-active flags
 *
 * @details Stands in for the external configuration store. Loaded from a JSON
 *          file of the form:
 *
 *          { "streams": [ { "id": "stream_001", "name": "Paddock",
 *                           "source": { "kind": "file", "path": "/m/a.mp4" },
 *                           "active": true } ] }
 *
 *          Network sources use { "kind": "rtsp|rtmp|http", "url": "..." }.
 */

#ifndef LIVE_CHUNKER_STREAM_CATALOG_HPP
#define LIVE_CHUNKER_STREAM_CATALOG_HPP

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace live_chunker {

/**
 * @class StreamCatalog
 * @brief Thread-safe in-memory catalog, optionally backed by a file.
 */
class StreamCatalog {
public:
  /**
   * @brief Replace the catalog with the contents of a JSON file.
   * @return Number of streams loaded
   * @throws std::runtime_error if the file cannot be read or parsed
   * @throws std::invalid_argument if an entry is malformed
   */
  std::size_t load(const std::string &path);

  /// Re-read the file given to the last load()
  std::size_t reload();

  void upsert(StreamDescriptor desc);

  /// @return false if the id is unknown
  bool set_desired_active(const std::string &id, bool active);

  std::optional<StreamDescriptor> find(const std::string &id) const;

  /// nullopt when the stream is not in the catalog
  std::optional<bool> desired_active(const std::string &id) const;

  std::vector<StreamDescriptor> all() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, StreamDescriptor> streams_;
  std::string path_;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_STREAM_CATALOG_HPP
