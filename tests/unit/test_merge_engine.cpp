/**
 * @file test_merge_engine.cpp
 * @brief Unit tests for the multi-transport merge table
 */

#include <gtest/gtest.h>
#include <pdrop/merge_engine.h>

#include <chrono>

using namespace pdrop;
using namespace std::chrono_literals;

namespace {

DiscoveryEvent found(const std::string &id, std::optional<int> rssi = {}) {
  PeerInfo info;
  info.id = PeerId(id);
  info.signal_dbm = rssi;
  return DiscoveryEvent::discovered(info);
}

DiscoveryEvent lost(const std::string &id) {
  PeerInfo info;
  info.id = PeerId(id);
  return DiscoveryEvent::lost(info);
}

} // namespace

class MergeEngineTest : public ::testing::Test {
protected:
  MergeEngineTest() : engine(MergeOptions{10s, true}) {}

  TimePoint at(std::chrono::milliseconds offset) const { return t0 + offset; }

  TimePoint t0 = SteadyClock::now();
  MergeEngine engine;
};

// ============================================================================
// Discovery
// ============================================================================

TEST_F(MergeEngineTest, FirstSightingEmitsDiscovered) {
  auto out = engine.apply("ble", found("P1", -50), at(0ms));

  ASSERT_EQ(out.size(), 1u);
  EXPECT_TRUE(out[0].is_discovered());
  EXPECT_EQ(out[0].peer.id, PeerId("P1"));
  EXPECT_EQ(out[0].peer.transports, std::set<BackendId>{"ble"});
  EXPECT_EQ(out[0].peer.last_seen, at(0ms));
  EXPECT_EQ(out[0].peer.signal_dbm, -50);
  EXPECT_EQ(engine.size(), 1u);
}

TEST_F(MergeEngineTest, RepeatedSightingIsSuppressed) {
  engine.apply("ble", found("P1"), at(0ms));
  auto out = engine.apply("ble", found("P1", -40), at(500ms));

  EXPECT_TRUE(out.empty());
  auto entry = engine.find(PeerId("P1"));
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->last_seen, at(500ms));
  EXPECT_EQ(entry->signal_dbm, -40);
}

TEST_F(MergeEngineTest, CrossTransportSightingJoinsEntry) {
  engine.apply("ble", found("P1"), at(0ms));
  auto out = engine.apply("wifi-direct", found("P1"), at(1ms));

  EXPECT_TRUE(out.empty());
  auto entry = engine.find(PeerId("P1"));
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->transports, (std::set<BackendId>{"ble", "wifi-direct"}));
}

TEST_F(MergeEngineTest, LastSeenNeverMovesBackwards) {
  engine.apply("ble", found("P1"), at(100ms));
  engine.apply("wifi-direct", found("P1"), at(50ms));
  EXPECT_EQ(engine.find(PeerId("P1"))->last_seen, at(100ms));
}

TEST_F(MergeEngineTest, MetadataIsMerged) {
  PeerInfo a;
  a.id = PeerId("P1");
  a.metadata["address"] = "aa:bb";
  PeerInfo b;
  b.id = PeerId("P1");
  b.metadata["name"] = "Laptop";

  engine.apply("ble", DiscoveryEvent::discovered(a), at(0ms));
  engine.apply("wifi-direct", DiscoveryEvent::discovered(b), at(1ms));

  auto entry = engine.find(PeerId("P1"));
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->metadata_value("address"), "aa:bb");
  EXPECT_EQ(entry->metadata_value("name"), "Laptop");
}

TEST_F(MergeEngineTest, EventWithoutIdentityIsDropped) {
  auto out = engine.apply("ble", found(""), at(0ms));
  EXPECT_TRUE(out.empty());
  EXPECT_TRUE(engine.empty());
}

// ============================================================================
// Loss
// ============================================================================

TEST_F(MergeEngineTest, LossEmitsOnlyWhenLastContributorLeaves) {
  engine.apply("ble", found("P1"), at(0ms));
  engine.apply("wifi-direct", found("P1"), at(0ms));

  EXPECT_TRUE(engine.apply("ble", lost("P1"), at(1ms)).empty());
  EXPECT_EQ(engine.size(), 1u);

  auto out = engine.apply("wifi-direct", lost("P1"), at(2ms));
  ASSERT_EQ(out.size(), 1u);
  EXPECT_TRUE(out[0].is_lost());
  EXPECT_EQ(out[0].peer.id, PeerId("P1"));
  EXPECT_TRUE(engine.empty());
}

TEST_F(MergeEngineTest, LossFromNonContributorIsIgnored) {
  engine.apply("ble", found("P1"), at(0ms));
  EXPECT_TRUE(engine.apply("wifi-direct", lost("P1"), at(1ms)).empty());
  EXPECT_EQ(engine.find(PeerId("P1"))->transports,
            std::set<BackendId>{"ble"});
}

TEST_F(MergeEngineTest, LossOfUnknownPeerIsIgnored) {
  EXPECT_TRUE(engine.apply("ble", lost("ghost"), at(0ms)).empty());
}

TEST_F(MergeEngineTest, RemoveBackendCascades) {
  engine.apply("ble", found("only-ble"), at(0ms));
  engine.apply("ble", found("shared"), at(0ms));
  engine.apply("wifi-direct", found("shared"), at(0ms));

  auto out = engine.remove_backend("ble");

  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].peer.id, PeerId("only-ble"));
  EXPECT_TRUE(out[0].is_lost());
  EXPECT_EQ(engine.find(PeerId("shared"))->transports,
            std::set<BackendId>{"wifi-direct"});
}

// ============================================================================
// Expiry
// ============================================================================

TEST_F(MergeEngineTest, SweepExpiresStaleEntriesOnce) {
  engine.apply("ble", found("P1"), at(0ms));

  EXPECT_TRUE(engine.sweep(at(9999ms)).empty());

  auto out = engine.sweep(at(10s));
  ASSERT_EQ(out.size(), 1u);
  EXPECT_TRUE(out[0].is_lost());
  EXPECT_EQ(out[0].peer.id, PeerId("P1"));

  EXPECT_TRUE(engine.sweep(at(20s)).empty());
  EXPECT_TRUE(engine.empty());
}

TEST_F(MergeEngineTest, SightingAfterExpiryIsFresh) {
  engine.apply("ble", found("P1"), at(0ms));
  engine.sweep(at(11s));

  auto out = engine.apply("ble", found("P1"), at(12s));
  ASSERT_EQ(out.size(), 1u);
  EXPECT_TRUE(out[0].is_discovered());
}

TEST_F(MergeEngineTest, LateLossAfterExpiryIsIgnored) {
  engine.apply("ble", found("P1"), at(0ms));
  engine.sweep(at(11s));
  EXPECT_TRUE(engine.apply("ble", lost("P1"), at(12s)).empty());
}

TEST_F(MergeEngineTest, ZeroTtlNeverExpires) {
  MergeEngine forever(MergeOptions{0ms, true});
  forever.apply("ble", found("P1"), at(0ms));
  EXPECT_TRUE(forever.sweep(at(1000s)).empty());
  EXPECT_EQ(forever.size(), 1u);
}

TEST_F(MergeEngineTest, TwoBackendsThenSilenceScenario) {
  const auto ttl = 10s;

  auto first = engine.apply("X", found("P1"), at(0s));
  ASSERT_EQ(first.size(), 1u);
  EXPECT_TRUE(first[0].is_discovered());

  EXPECT_TRUE(engine.apply("Y", found("P1"), at(1s)).empty());

  // Y's sighting at t=1 refreshed the entry
  EXPECT_TRUE(engine.sweep(at(ttl)).empty());

  auto expired = engine.sweep(at(ttl + 1s));
  ASSERT_EQ(expired.size(), 1u);
  EXPECT_TRUE(expired[0].is_lost());
  EXPECT_EQ(expired[0].peer.id, PeerId("P1"));
  EXPECT_TRUE(engine.sweep(at(ttl + 2s)).empty());
}

// ============================================================================
// Dedupe disabled
// ============================================================================

TEST(MergeEngineNoDedupeTest, EachBackendReportedSeparately) {
  MergeEngine engine(MergeOptions{10s, false});
  auto now = SteadyClock::now();

  auto a = engine.apply("ble", found("P1"), now);
  auto b = engine.apply("wifi-direct", found("P1"), now);
  ASSERT_EQ(a.size(), 1u);
  ASSERT_EQ(b.size(), 1u);
  EXPECT_EQ(b[0].peer.transports, std::set<BackendId>{"wifi-direct"});
  EXPECT_EQ(engine.size(), 2u);

  // Still suppresses repeats within one backend
  EXPECT_TRUE(engine.apply("ble", found("P1"), now).empty());

  auto gone = engine.apply("ble", lost("P1"), now);
  ASSERT_EQ(gone.size(), 1u);
  EXPECT_EQ(gone[0].peer.transports, std::set<BackendId>{"ble"});
  EXPECT_EQ(engine.size(), 1u);
}

// ============================================================================
// Snapshot
// ============================================================================

TEST_F(MergeEngineTest, SnapshotIsOrderedCopy) {
  engine.apply("ble", found("b"), at(0ms));
  engine.apply("ble", found("a"), at(0ms));

  auto snap = engine.snapshot();
  ASSERT_EQ(snap.size(), 2u);
  EXPECT_EQ(snap[0].id, PeerId("a"));
  EXPECT_EQ(snap[1].id, PeerId("b"));

  engine.apply("ble", lost("a"), at(1ms));
  EXPECT_EQ(snap.size(), 2u);
  EXPECT_EQ(engine.snapshot().size(), 1u);
}
