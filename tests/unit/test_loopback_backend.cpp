/**
 * @file test_loopback_backend.cpp
 * @brief Unit tests for the scriptable in-process backend
 */

#include <gtest/gtest.h>
#include <pdrop/loopback_backend.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace pdrop;
using namespace std::chrono_literals;

namespace {

std::unique_ptr<LoopbackBackend> make(Capabilities caps =
                                          Capabilities::scan_only()) {
  LoopbackConfig config;
  config.name = "loop";
  config.capabilities = caps;
  auto created = LoopbackBackend::create(config);
  EXPECT_TRUE(created.is_ok());
  return std::move(created.value());
}

} // namespace

// ============================================================================
// Creation
// ============================================================================

TEST(LoopbackBackendTest, CreateRejectsBadConfig) {
  LoopbackConfig unnamed;
  unnamed.name = "";
  EXPECT_EQ(LoopbackBackend::create(unnamed).error().code,
            ErrorCode::InitializationError);

  LoopbackConfig mute;
  mute.capabilities = Capabilities{};
  EXPECT_EQ(LoopbackBackend::create(mute).error().code,
            ErrorCode::InitializationError);
}

TEST(LoopbackBackendTest, InterfacesFollowCapabilities) {
  auto scanner = make(Capabilities::scan_only());
  EXPECT_NE(scanner->discovery(), nullptr);
  EXPECT_EQ(scanner->advertiser(), nullptr);
  EXPECT_TRUE(validate_backend(*scanner).is_ok());

  auto beacon = make(Capabilities::advertise_only());
  EXPECT_EQ(beacon->discovery(), nullptr);
  EXPECT_NE(beacon->advertiser(), nullptr);
  EXPECT_TRUE(beacon->broadcast().is_ok());

  EXPECT_EQ(scanner->broadcast().error().code,
            ErrorCode::CapabilityUnsupported);
}

// ============================================================================
// Scanning
// ============================================================================

TEST(LoopbackBackendTest, StartScanIsIdempotent) {
  auto b = make();
  ASSERT_TRUE(b->start_scan().is_ok());
  auto first = b->poll_events();
  ASSERT_TRUE(b->start_scan().is_ok());

  EXPECT_EQ(b->poll_events(), first);
  EXPECT_EQ(b->stats().streams_created, 1u);
  EXPECT_EQ(b->stats().start_scan_calls, 2u);
  EXPECT_TRUE(b->is_scanning());
}

TEST(LoopbackBackendTest, PollBeforeScanIsClosedStream) {
  auto b = make();
  auto stream = b->poll_events();
  ASSERT_NE(stream, nullptr);
  EXPECT_TRUE(stream->is_finished());
}

TEST(LoopbackBackendTest, InjectedEventsArriveInOrder) {
  auto b = make();
  EXPECT_FALSE(b->inject_discovered("early"));

  ASSERT_TRUE(b->start_scan().is_ok());
  EXPECT_TRUE(b->inject_discovered("p1", -70, {{"name", "phone"}}));
  EXPECT_TRUE(b->inject_lost("p1"));

  auto stream = b->poll_events();
  DiscoveryEvent ev;
  ASSERT_EQ(stream->receive(ev, 100ms), ChannelStatus::Ok);
  EXPECT_TRUE(ev.is_discovered());
  EXPECT_EQ(ev.peer.id, PeerId("p1"));
  EXPECT_EQ(ev.peer.signal_dbm, -70);
  EXPECT_EQ(ev.peer.metadata_value("name"), "phone");

  ASSERT_EQ(stream->receive(ev, 100ms), ChannelStatus::Ok);
  EXPECT_TRUE(ev.is_lost());
}

TEST(LoopbackBackendTest, StopScanEndsStream) {
  auto b = make();
  ASSERT_TRUE(b->start_scan().is_ok());
  auto stream = b->poll_events();

  ASSERT_TRUE(b->stop_scan().is_ok());
  EXPECT_TRUE(stream->is_closed());
  EXPECT_FALSE(b->is_scanning());
  EXPECT_FALSE(b->inject_discovered("late"));

  // Idempotent
  EXPECT_TRUE(b->stop_scan().is_ok());

  ASSERT_TRUE(b->start_scan().is_ok());
  EXPECT_NE(b->poll_events(), stream);
  EXPECT_EQ(b->stats().streams_created, 2u);
}

TEST(LoopbackBackendTest, CloseStreamSimulatesTransportLoss) {
  auto b = make();
  ASSERT_TRUE(b->start_scan().is_ok());
  auto stream = b->poll_events();

  b->close_stream();
  EXPECT_TRUE(stream->is_finished());
  EXPECT_FALSE(b->is_scanning());
}

// ============================================================================
// Scripting
// ============================================================================

TEST(LoopbackBackendTest, FailNextFailsOnce) {
  auto b = make();
  b->fail_next(LoopbackOp::StartScan,
               Error(ErrorCode::OperationError, "radio busy"));

  auto result = b->start_scan();
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::OperationError);
  EXPECT_EQ(result.error().location, "loop");
  EXPECT_FALSE(b->is_scanning());

  EXPECT_TRUE(b->start_scan().is_ok());
}

TEST(LoopbackBackendTest, DelaySlowsCalls) {
  auto b = make();
  b->set_delay(LoopbackOp::StartScan, 30ms);

  auto began = std::chrono::steady_clock::now();
  ASSERT_TRUE(b->start_scan().is_ok());
  EXPECT_GE(std::chrono::steady_clock::now() - began, 30ms);
}

TEST(LoopbackBackendTest, BlockHangsUntilReleased) {
  auto b = make();
  b->block(LoopbackOp::StartScan);

  std::atomic<bool> done{false};
  std::thread caller([&] {
    auto result = b->start_scan();
    EXPECT_TRUE(result.is_ok());
    done = true;
  });

  std::this_thread::sleep_for(30ms);
  EXPECT_FALSE(done.load());

  b->unblock_all();
  caller.join();
  EXPECT_TRUE(done.load());
  EXPECT_TRUE(b->is_scanning());
}

TEST(LoopbackBackendTest, BroadcastLifecycle) {
  auto b = make(Capabilities::both());
  ASSERT_TRUE(b->broadcast().is_ok());
  EXPECT_TRUE(b->is_broadcasting());
  ASSERT_TRUE(b->stop_broadcast().is_ok());
  EXPECT_FALSE(b->is_broadcasting());
  EXPECT_EQ(b->stats().broadcast_calls, 1u);
  EXPECT_EQ(b->stats().stop_broadcast_calls, 1u);
}
