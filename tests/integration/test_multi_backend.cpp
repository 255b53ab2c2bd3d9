/**
 * @file test_multi_backend.cpp
 * @brief Integration test: several transports feeding one orchestrator
 */

#include <gtest/gtest.h>
#include <pdrop/pdrop.h>

#include "common/test_util.h"

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace pdrop;
using namespace pdrop::test;
using namespace std::chrono_literals;

class MultiBackendTest : public ::testing::Test {
protected:
  void SetUp() override {
    ble = make_loopback("ble", Capabilities::both(), TransportKind::Ble);
    wifi = make_loopback("wifi-direct", Capabilities::both(),
                         TransportKind::WifiDirect);
    ASSERT_NE(ble, nullptr);
    ASSERT_NE(wifi, nullptr);
  }

  void TearDown() override {
    ble->unblock_all();
    wifi->unblock_all();
  }

  std::shared_ptr<LoopbackBackend> ble;
  std::shared_ptr<LoopbackBackend> wifi;
};

// ============================================================================
// Full Session
// ============================================================================

TEST_F(MultiBackendTest, DiscoverAcrossTransportsThenShutDown) {
  ManualClock clock;
  auto cfg = fast_config();
  cfg.scan_ttl_seconds = 10;
  Orchestrator orch(cfg, clock.fn());

  ASSERT_TRUE(orch.register_backend(ble, Roles::both()).is_ok());
  ASSERT_TRUE(orch.register_backend(wifi).is_ok());

  auto sub = orch.subscribe();
  auto report = orch.start();
  ASSERT_TRUE(report.all_succeeded());
  EXPECT_TRUE(ble->is_broadcasting());
  EXPECT_FALSE(wifi->is_broadcasting());

  // t = 0: seen over BLE
  ASSERT_TRUE(ble->inject_discovered("laptop", -55, {{"address", "aa:bb"}}));
  auto found = next_event(sub);
  ASSERT_TRUE(found.has_value());
  EXPECT_TRUE(found->is_discovered());
  EXPECT_EQ(found->peer.id, PeerId("laptop"));

  // t = 1: same peer over Wi-Fi Direct, no second announcement
  clock.advance(1s);
  ASSERT_TRUE(wifi->inject_discovered("laptop", std::nullopt,
                                      {{"name", "Laptop"}}));
  ASSERT_TRUE(wait_for([&] {
    auto peer = orch.find_peer(PeerId("laptop"));
    return peer && peer->transports.size() == 2;
  }));
  EXPECT_TRUE(drain(sub, 50ms).empty());

  auto merged = orch.find_peer(PeerId("laptop"));
  ASSERT_TRUE(merged.has_value());
  EXPECT_EQ(merged->metadata_value("address"), "aa:bb");
  EXPECT_EQ(merged->metadata_value("name"), "Laptop");
  EXPECT_EQ(merged->signal_dbm, -55);

  // t = 11: silence for a full TTL since the last sighting
  clock.advance(10s);
  auto lost = next_event(sub);
  ASSERT_TRUE(lost.has_value());
  EXPECT_TRUE(lost->is_lost());
  EXPECT_EQ(lost->peer.id, PeerId("laptop"));
  EXPECT_TRUE(drain(sub, 50ms).empty());

  ASSERT_TRUE(orch.stop().is_ok());
  EXPECT_FALSE(ble->is_scanning());
  EXPECT_FALSE(ble->is_broadcasting());
  EXPECT_FALSE(wifi->is_scanning());

  DiscoveryEvent ev;
  EXPECT_EQ(sub.next(ev, 1s), ChannelStatus::Closed);
}

TEST_F(MultiBackendTest, ConcurrentSightingsAnnouncedOncePerPeer) {
  Orchestrator orch(fast_config());
  ASSERT_TRUE(orch.register_backend(ble).is_ok());
  ASSERT_TRUE(orch.register_backend(wifi).is_ok());
  auto sub = orch.subscribe();
  ASSERT_TRUE(orch.start().all_succeeded());

  constexpr int kPeers = 50;
  auto flood = [](LoopbackBackend &backend) {
    for (int round = 0; round < 3; ++round) {
      for (int i = 0; i < kPeers; ++i) {
        backend.inject_discovered("peer-" + std::to_string(i));
      }
    }
  };

  std::thread t1([&] { flood(*ble); });
  std::thread t2([&] { flood(*wifi); });
  t1.join();
  t2.join();

  ASSERT_TRUE(wait_for([&] {
    auto peers = orch.query_peers();
    if (peers.size() != static_cast<size_t>(kPeers)) {
      return false;
    }
    for (const auto &p : peers) {
      if (p.transports.size() != 2) {
        return false;
      }
    }
    return true;
  }));

  auto events = drain(sub, 100ms);
  std::set<PeerId> announced;
  for (const auto &ev : events) {
    EXPECT_TRUE(ev.is_discovered());
    EXPECT_TRUE(announced.insert(ev.peer.id).second)
        << "duplicate announcement of " << ev.peer.id.str();
  }
  EXPECT_EQ(announced.size(), static_cast<size_t>(kPeers));
}

TEST_F(MultiBackendTest, FailingTransportDoesNotStopTheOther) {
  auto cfg = fast_config();
  cfg.backend_start_timeout_ms = 100;
  Orchestrator orch(cfg);
  ASSERT_TRUE(orch.register_backend(ble).is_ok());
  ASSERT_TRUE(orch.register_backend(wifi).is_ok());
  auto sub = orch.subscribe();

  wifi->block(LoopbackOp::StartScan);
  auto report = orch.start();

  EXPECT_EQ(report.failed(), std::vector<BackendId>{"wifi-direct"});
  EXPECT_TRUE(report.find("ble")->ok());

  ASSERT_TRUE(ble->inject_discovered("phone"));
  auto ev = next_event(sub);
  ASSERT_TRUE(ev.has_value());
  EXPECT_EQ(ev->peer.transports, std::set<BackendId>{"ble"});

  // Recover the hung transport
  wifi->unblock_all();
  ASSERT_TRUE(wait_for([&] {
    return wifi->stats().stop_scan_calls == 1 && !wifi->is_scanning();
  }));
  ASSERT_TRUE(orch.reset_backend("wifi-direct").is_ok());
  ASSERT_TRUE(orch.start().all_succeeded());

  ASSERT_TRUE(wifi->inject_discovered("phone"));
  ASSERT_TRUE(wait_for([&] {
    auto peer = orch.find_peer(PeerId("phone"));
    return peer && peer->transports.size() == 2;
  }));

  ASSERT_TRUE(orch.stop().is_ok());
  for (const auto &status : orch.backend_status()) {
    EXPECT_EQ(status.state, BackendState::Idle) << status.id;
  }
}

TEST_F(MultiBackendTest, TransportDropoutWithdrawsItsPeers) {
  Orchestrator orch(fast_config());
  ASSERT_TRUE(orch.register_backend(ble).is_ok());
  ASSERT_TRUE(orch.register_backend(wifi).is_ok());
  auto sub = orch.subscribe();
  ASSERT_TRUE(orch.start().all_succeeded());

  ASSERT_TRUE(ble->inject_discovered("watch"));
  ASSERT_TRUE(wifi->inject_discovered("tv"));
  ASSERT_TRUE(wait_for([&] { return orch.query_peers().size() == 2; }));
  drain(sub, 20ms);

  ble->close_stream();

  auto lost = next_event(sub);
  ASSERT_TRUE(lost.has_value());
  EXPECT_TRUE(lost->is_lost());
  EXPECT_EQ(lost->peer.id, PeerId("watch"));

  auto failure = BackendFailure{};
  ASSERT_EQ(sub.next_failure(failure, 1s), ChannelStatus::Ok);
  EXPECT_EQ(failure.backend, "ble");
  EXPECT_EQ(failure.error.code, ErrorCode::StreamClosed);

  auto peers = orch.query_peers();
  ASSERT_EQ(peers.size(), 1u);
  EXPECT_EQ(peers[0].id, PeerId("tv"));
}
