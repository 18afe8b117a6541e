/**
 * @file stream_catalog.cpp
 * @brief JSON-backed stream catalog
 */

#include "live_chunker/stream_catalog.hpp"

#include <fstream>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "live_chunker/logging.hpp"

namespace live_chunker {

namespace {

StreamDescriptor parse_entry(const nlohmann::json &entry) {
  if (!entry.is_object() || !entry.contains("id") || !entry.contains("source"))
    throw std::invalid_argument("stream entry needs 'id' and 'source'");

  std::string id = entry.at("id").get<std::string>();
  if (id.empty())
    throw std::invalid_argument("stream id must not be empty");

  const auto &source = entry.at("source");
  std::string kind = source.value("kind", "");
  std::string locator =
      kind == "file" ? source.value("path", "") : source.value("url", "");

  StreamDescriptor desc{id, entry.value("name", id),
                        SourceSpec::parse(kind, locator),
                        entry.value("active", false)};
  return desc;
}

} // anonymous namespace

std::size_t StreamCatalog::load(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw std::runtime_error(fmt::format("cannot open stream catalog '{}'", path));

  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(
        fmt::format("invalid stream catalog '{}': {}", path, e.what()));
  }

  std::map<std::string, StreamDescriptor> loaded;
  try {
    for (const auto &entry : doc.at("streams")) {
      StreamDescriptor desc = parse_entry(entry);
      std::string id = desc.id;
      loaded.insert_or_assign(id, std::move(desc));
    }
  } catch (const nlohmann::json::exception &e) {
    throw std::invalid_argument(
        fmt::format("malformed stream catalog '{}': {}", path, e.what()));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  streams_ = std::move(loaded);
  path_ = path;
  LOG_INFO("[Catalog] Loaded {} streams from {}", streams_.size(), path);
  return streams_.size();
}

std::size_t StreamCatalog::reload() {
  std::string path;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    path = path_;
  }
  if (path.empty())
    return 0;
  return load(path);
}

void StreamCatalog::upsert(StreamDescriptor desc) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string id = desc.id;
  streams_.insert_or_assign(id, std::move(desc));
}

bool StreamCatalog::set_desired_active(const std::string &id, bool active) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(id);
  if (it == streams_.end())
    return false;
  it->second.desired_active = active;
  return true;
}

std::optional<StreamDescriptor>
StreamCatalog::find(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(id);
  if (it == streams_.end())
    return std::nullopt;
  return it->second;
}

std::optional<bool> StreamCatalog::desired_active(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(id);
  if (it == streams_.end())
    return std::nullopt;
  return it->second.desired_active;
}

std::vector<StreamDescriptor> StreamCatalog::all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<StreamDescriptor> out;
  out.reserve(streams_.size());
  for (const auto &entry : streams_)
    out.push_back(entry.second);
  return out;
}

} // namespace live_chunker
