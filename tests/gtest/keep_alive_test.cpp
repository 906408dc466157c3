/**
 * @file keep_alive_test.cpp
 * @brief Background Tester Present and session tracking (session.cpp)
 */

#include <gtest/gtest.h>
#include "ecudiag/client.hpp"
#include "ecudiag/session.hpp"
#include "scripted_transport.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace ecudiag;
using ecudiag_test::ScriptedTransport;
using namespace std::chrono_literals;

namespace {

std::vector<Bytes> permissive_ecu(const Bytes& req) {
  Bytes rsp{static_cast<uint8_t>(req[0] + 0x40)};
  rsp.insert(rsp.end(), req.begin() + 1, req.end());
  return {rsp};
}

} // namespace

class KeepAliveTest : public ::testing::Test {
protected:
  void SetUp() override {
    ClientConfig cfg;
    cfg.log_sink = [](LogLevel, const std::string&) {};
    cfg.keep_alive_interval = 1500ms;
    client_ = std::make_unique<Client>(transport_, cfg);
  }

  ScriptedTransport transport_;
  std::unique_ptr<Client> client_;
};

TEST_F(KeepAliveTest, SendsTesterPresentPeriodically) {
  transport_.set_responder(permissive_ecu);
  KeepAlive ka(*client_, 10ms);
  ka.start();
  EXPECT_TRUE(ka.is_running());
  std::this_thread::sleep_for(120ms);
  ka.stop();
  EXPECT_FALSE(ka.is_running());

  EXPECT_GE(ka.sent_count(), 3u);
  EXPECT_EQ(ka.failure_count(), 0u);
  for (const auto& frame : transport_.sent()) {
    EXPECT_EQ(frame, (Bytes{0x3E, 0x00}));
  }
}

TEST_F(KeepAliveTest, DefaultIntervalComesFromConfig) {
  KeepAlive ka(*client_);
  EXPECT_EQ(ka.interval(), 1500ms);
  ka.set_interval(250ms);
  EXPECT_EQ(ka.interval(), 250ms);
  ka.set_interval(0ms);
  EXPECT_EQ(ka.interval(), 250ms);
}

TEST_F(KeepAliveTest, StopWakesThreadImmediately) {
  KeepAlive ka(*client_, 10s);
  ka.start();
  auto t0 = std::chrono::steady_clock::now();
  ka.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
  EXPECT_EQ(transport_.sent_count(), 0u);
}

TEST_F(KeepAliveTest, ShorterIntervalAppliesToCurrentWait) {
  transport_.set_responder(permissive_ecu);
  KeepAlive ka(*client_, 10s);
  ka.start();
  std::this_thread::sleep_for(20ms);
  ka.set_interval(10ms);
  std::this_thread::sleep_for(150ms);
  ka.stop();
  EXPECT_GE(ka.sent_count(), 2u);
}

TEST_F(KeepAliveTest, StartTwiceIsHarmless) {
  transport_.set_responder(permissive_ecu);
  KeepAlive ka(*client_, 10ms);
  ka.start();
  ka.start();
  std::this_thread::sleep_for(30ms);
  ka.stop();
  ka.stop();
  EXPECT_FALSE(ka.is_running());
}

TEST_F(KeepAliveTest, DestructorStopsThread) {
  transport_.set_responder(permissive_ecu);
  {
    KeepAlive ka(*client_, 5ms);
    ka.start();
    std::this_thread::sleep_for(20ms);
  }
  const size_t after = transport_.sent_count();
  std::this_thread::sleep_for(30ms);
  EXPECT_EQ(transport_.sent_count(), after);
}

TEST_F(KeepAliveTest, FailuresAreCountedAndReported) {
  transport_.set_responder([](const Bytes& req) -> std::vector<Bytes> {
    return {{0x7F, req[0], 0x22}};
  });
  std::atomic<int> callbacks{0};
  KeepAlive ka(*client_, 5ms);
  ka.set_error_callback([&callbacks](const std::string& msg) {
    if (msg.find("Tester present failed") != std::string::npos) ++callbacks;
  });
  ka.start();
  std::this_thread::sleep_for(60ms);

  // Failures do not stop the loop.
  EXPECT_TRUE(ka.is_running());
  ka.stop();

  EXPECT_GE(ka.failure_count(), 2u);
  EXPECT_EQ(ka.failure_count(), ka.sent_count());
  EXPECT_EQ(callbacks.load(), static_cast<int>(ka.failure_count()));
}

TEST_F(KeepAliveTest, PositiveReplyRefreshesActivity) {
  transport_.set_responder(permissive_ecu);
  const auto before = client_->session().last_activity();
  std::this_thread::sleep_for(5ms);

  KeepAlive ka(*client_, 5ms);
  ka.start();
  std::this_thread::sleep_for(40ms);
  ka.stop();

  EXPECT_GT(client_->session().last_activity(), before);
  EXPECT_EQ(client_->session().session_type(), 0x01);
}

TEST_F(KeepAliveTest, NeverInterleavesWithForegroundRequests) {
  transport_.set_responder(permissive_ecu);
  transport_.set_receive_delay(1ms);

  KeepAlive ka(*client_, 1ms);
  ka.start();

  int failures = 0;
  for (int i = 0; i < 40; ++i) {
    auto r = client_->read_data_by_identifier(0xF190);
    if (!r.ok() || r.data != Bytes{0xF1, 0x90}) ++failures;
  }
  ka.stop();

  EXPECT_EQ(failures, 0);
  EXPECT_EQ(transport_.overlapping_calls(), 0);
  EXPECT_GT(ka.sent_count(), 0u);
}

// ============================================================================
// SessionTracker
// ============================================================================

TEST(SessionTrackerTest, DefaultState) {
  SessionTracker t;
  auto s = t.snapshot();
  EXPECT_EQ(s.session_type, 0x01);
  EXPECT_EQ(s.security_level, 0);
  EXPECT_TRUE(s.is_default());
  EXPECT_FALSE(s.is_unlocked());
}

TEST(SessionTrackerTest, TransitionsAndRelock) {
  SessionTracker t;
  t.on_session_changed(0x03);
  t.on_security_unlocked(0x01);
  EXPECT_TRUE(t.snapshot().is_unlocked());
  EXPECT_EQ(t.snapshot().kind(), SessionKind::Extended);

  t.on_session_changed(0x02);
  EXPECT_EQ(t.security_level(), 0);
  EXPECT_EQ(t.snapshot().kind(), SessionKind::Programming);

  t.on_security_unlocked(0x05);
  t.on_reset();
  EXPECT_EQ(t.session_type(), 0x01);
  EXPECT_EQ(t.security_level(), 0);
}

TEST(SessionTrackerTest, ServiceAvailability) {
  SessionTracker t;
  for (uint8_t sid : {0x27, 0x28, 0x2F, 0x34, 0x35, 0x36, 0x37, 0x38, 0x83, 0x85, 0x87}) {
    EXPECT_TRUE(SessionTracker::requires_non_default_session(sid)) << static_cast<int>(sid);
    EXPECT_FALSE(t.is_service_allowed(sid)) << static_cast<int>(sid);
  }
  for (uint8_t sid : {0x10, 0x11, 0x14, 0x19, 0x22, 0x3E, 0x31, 0x2E}) {
    EXPECT_TRUE(t.is_service_allowed(sid)) << static_cast<int>(sid);
  }

  t.on_session_changed(0x03);
  EXPECT_TRUE(t.is_service_allowed(0x27));
  EXPECT_TRUE(t.is_service_allowed(0x85));
}

TEST(SessionTrackerTest, SessionClassification) {
  EXPECT_EQ(classify_session(0x01), SessionKind::Default);
  EXPECT_EQ(classify_session(0x04), SessionKind::SafetySystem);
  EXPECT_EQ(classify_session(0x40), SessionKind::VehicleManufacturer);
  EXPECT_EQ(classify_session(0x5F), SessionKind::VehicleManufacturer);
  EXPECT_EQ(classify_session(0x60), SessionKind::SystemSupplier);
  EXPECT_EQ(classify_session(0x7E), SessionKind::SystemSupplier);
  EXPECT_EQ(classify_session(0x00), SessionKind::Reserved);
  EXPECT_EQ(classify_session(0x05), SessionKind::Reserved);
  EXPECT_EQ(classify_session(0x7F), SessionKind::Reserved);
}

TEST(SessionTrackerTest, IdleTimeGrows) {
  SessionTracker t;
  std::this_thread::sleep_for(30ms);
  EXPECT_GE(t.idle_time(), 30ms);
  t.touch();
  EXPECT_LT(t.idle_time(), 30ms);
}
