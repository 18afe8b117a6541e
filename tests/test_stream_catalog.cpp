// Component: JSON stream catalog

#include <gtest/gtest.h>

#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

#include "fakes/fake_process_launcher.hpp"
#include "live_chunker/stream_catalog.hpp"

namespace live_chunker {
namespace {

using testing::make_temp_dir;

std::string WriteCatalog(const std::string& name, const std::string& body) {
  std::string path = make_temp_dir("catalog_" + name) + "/streams.json";
  std::ofstream(path) << body;
  return path;
}

// -----------------------------------------------------------------------------
// Loading
// -----------------------------------------------------------------------------
TEST(StreamCatalogTest, LoadsFileAndNetworkStreams) {
  std::string path = WriteCatalog("valid", R"({
    "streams": [
      {"id": "stream_1", "name": "Lobby", "source": {"kind": "file", "path": "/v/lobby.mp4"},
       "active": true},
      {"id": "dock", "source": {"kind": "rtsp", "url": "rtsp://u:p@cam/1"}}
    ]
  })");

  StreamCatalog catalog;
  EXPECT_EQ(catalog.load(path), 2u);

  auto lobby = catalog.find("stream_1");
  ASSERT_TRUE(lobby.has_value());
  EXPECT_EQ(lobby->name, "Lobby");
  EXPECT_EQ(lobby->source.kind(), SourceKind::LoopedFile);
  EXPECT_EQ(lobby->source.locator(), "/v/lobby.mp4");
  EXPECT_TRUE(lobby->desired_active);

  auto dock = catalog.find("dock");
  ASSERT_TRUE(dock.has_value());
  EXPECT_EQ(dock->name, "dock");  // name defaults to id
  EXPECT_EQ(dock->source.kind(), SourceKind::NetworkFeed);
  EXPECT_FALSE(dock->desired_active);

  EXPECT_EQ(catalog.all().size(), 2u);
}

TEST(StreamCatalogTest, RejectsUnreadableOrMalformedFiles) {
  StreamCatalog catalog;
  EXPECT_THROW(catalog.load("/nonexistent/streams.json"), std::runtime_error);
  EXPECT_THROW(catalog.load(WriteCatalog("garbage", "{not json")), std::runtime_error);
  EXPECT_THROW(catalog.load(WriteCatalog("no_source", R"({"streams":[{"id":"a"}]})")),
               std::invalid_argument);
  EXPECT_THROW(
      catalog.load(WriteCatalog("bad_kind",
                                R"({"streams":[{"id":"a","source":{"kind":"ftp","url":"ftp://x"}}]})")),
      std::invalid_argument);
  EXPECT_TRUE(catalog.all().empty());
}

// -----------------------------------------------------------------------------
// Desired state
// -----------------------------------------------------------------------------
TEST(StreamCatalogTest, DesiredActiveCanBeToggled) {
  StreamCatalog catalog;
  catalog.upsert(StreamDescriptor{"cam", "Cam", SourceSpec::looped_file("/v.mp4"), false});

  EXPECT_EQ(catalog.desired_active("cam"), std::optional<bool>(false));
  EXPECT_TRUE(catalog.set_desired_active("cam", true));
  EXPECT_EQ(catalog.desired_active("cam"), std::optional<bool>(true));

  EXPECT_FALSE(catalog.set_desired_active("ghost", true));
  EXPECT_FALSE(catalog.desired_active("ghost").has_value());
}

TEST(StreamCatalogTest, ReloadPicksUpEdits) {
  std::string path = WriteCatalog("reload", R"({"streams":[
    {"id":"a","source":{"kind":"file","path":"/a.mp4"}}]})");
  StreamCatalog catalog;
  EXPECT_EQ(catalog.reload(), 0u);  // nothing loaded yet
  ASSERT_EQ(catalog.load(path), 1u);

  std::ofstream(path) << R"({"streams":[
    {"id":"a","source":{"kind":"file","path":"/a.mp4"}},
    {"id":"b","source":{"kind":"http","url":"http://h/b.m3u8"}}]})";
  EXPECT_EQ(catalog.reload(), 2u);
  EXPECT_TRUE(catalog.find("b").has_value());
}

}  // namespace
}  // namespace live_chunker
