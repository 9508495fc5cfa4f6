#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "ramcp_core/diagnostics_store.h"

using ramcp::DiagnosticsStore;
using json = nlohmann::json;

TEST(DiagnosticsStoreTest, KeepsLatestPublishPerUri) {
  DiagnosticsStore store;
  store.Publish({{"uri", "file:///a.rs"}, {"version", 1}, {"diagnostics", json::array({1})}});
  store.Publish({{"uri", "file:///a.rs"}, {"version", 2}, {"diagnostics", json::array()}});
  store.Publish({{"uri", "file:///b.rs"}, {"diagnostics", json::array({1, 2})}});

  auto a = store.Get("file:///a.rs");
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->version, 2);
  EXPECT_TRUE(a->diagnostics.empty());
  EXPECT_EQ(a->generation, 2u);
  auto b = store.Get("file:///b.rs");
  ASSERT_TRUE(b.has_value());
  EXPECT_FALSE(b->version.has_value());
  EXPECT_EQ(store.generation(), 3u);
  EXPECT_FALSE(store.Get("file:///c.rs").has_value());
}

TEST(DiagnosticsStoreTest, IgnoresPublishWithoutUri) {
  DiagnosticsStore store;
  store.Publish({{"diagnostics", json::array()}});
  store.Publish(json::array());
  EXPECT_EQ(store.generation(), 0u);
}

TEST(DiagnosticsStoreTest, WaitReturnsOnNewerPublish) {
  DiagnosticsStore store;
  store.Publish({{"uri", "file:///a.rs"}, {"diagnostics", json::array()}});
  uint64_t mark = store.generation();

  std::thread publisher([&store]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    // A publish for another file does not satisfy the wait.
    store.Publish({{"uri", "file:///b.rs"}, {"diagnostics", json::array()}});
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    store.Publish({{"uri", "file:///a.rs"}, {"version", 5}, {"diagnostics", json::array({1})}});
  });
  bool fresh = false;
  auto entry = store.WaitForNewer("file:///a.rs", mark, std::chrono::milliseconds(3000), &fresh);
  publisher.join();
  EXPECT_TRUE(fresh);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->version, 5);
}

TEST(DiagnosticsStoreTest, WaitTimesOutWithStaleEntry) {
  DiagnosticsStore store;
  store.Publish({{"uri", "file:///a.rs"}, {"version", 1}, {"diagnostics", json::array()}});
  bool fresh = true;
  auto entry = store.WaitForNewer("file:///a.rs", store.generation(),
                                  std::chrono::milliseconds(50), &fresh);
  EXPECT_FALSE(fresh);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->version, 1);
}

TEST(DiagnosticsStoreTest, CloseReleasesWaiters) {
  DiagnosticsStore store;
  std::thread closer([&store]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    store.Close();
  });
  auto start = std::chrono::steady_clock::now();
  bool fresh = true;
  auto entry = store.WaitForNewer("file:///a.rs", 0, std::chrono::seconds(10), &fresh);
  closer.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
  EXPECT_FALSE(fresh);
  EXPECT_FALSE(entry.has_value());
}
