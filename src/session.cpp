#include "ecudiag/session.hpp"
#include "ecudiag/client.hpp"
#include "ecudiag/log.hpp"
#include <string>
#include <utility>

namespace ecudiag {

// ================================================================
// SessionTracker
// ================================================================

SessionTracker::SessionTracker() {
  state_.last_activity = std::chrono::steady_clock::now();
}

SessionState SessionTracker::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

uint8_t SessionTracker::session_type() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.session_type;
}

uint8_t SessionTracker::security_level() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.security_level;
}

std::chrono::steady_clock::time_point SessionTracker::last_activity() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.last_activity;
}

std::chrono::milliseconds SessionTracker::idle_time() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - last_activity());
}

void SessionTracker::on_session_changed(uint8_t session_type) {
  std::lock_guard<std::mutex> lock(mutex_);
  // ISO 14229-1 9.2.1: any session transition relocks the server.
  state_.session_type = session_type;
  state_.security_level = 0;
  state_.last_activity = std::chrono::steady_clock::now();
}

void SessionTracker::on_security_unlocked(uint8_t level) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.security_level = level;
  state_.last_activity = std::chrono::steady_clock::now();
}

void SessionTracker::on_reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.session_type = static_cast<uint8_t>(Session::DefaultSession);
  state_.security_level = 0;
  state_.last_activity = std::chrono::steady_clock::now();
}

void SessionTracker::touch() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.last_activity = std::chrono::steady_clock::now();
}

bool SessionTracker::requires_non_default_session(uint8_t sid) {
  switch (static_cast<SID>(sid)) {
    case SID::SecurityAccess:
    case SID::CommunicationControl:
    case SID::InputOutputControlByIdentifier:
    case SID::RequestDownload:
    case SID::RequestUpload:
    case SID::TransferData:
    case SID::RequestTransferExit:
    case SID::RequestFileTransfer:
    case SID::AccessTimingParameters:
    case SID::ControlDTCSetting:
    case SID::LinkControl:
      return true;
    default:
      return false;
  }
}

bool SessionTracker::is_service_allowed(uint8_t sid) const {
  if (!requires_non_default_session(sid)) return true;
  return !snapshot().is_default();
}

// ================================================================
// KeepAlive
// ================================================================

KeepAlive::KeepAlive(Client& client, std::chrono::milliseconds interval)
  : client_(client),
    interval_(interval.count() > 0 ? interval : client.config().keep_alive_interval) {}

KeepAlive::~KeepAlive() {
  stop();
}

void KeepAlive::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_ = std::thread(&KeepAlive::loop, this);
  client_.logger().info("Tester present keep-alive started (interval " +
                        std::to_string(interval_.count()) + "ms)");
}

void KeepAlive::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  client_.logger().info("Tester present keep-alive stopped");
}

void KeepAlive::set_interval(std::chrono::milliseconds interval) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (interval.count() > 0) {
      interval_ = interval;
      ++interval_generation_;
    }
  }
  cv_.notify_all();
}

std::chrono::milliseconds KeepAlive::interval() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return interval_;
}

void KeepAlive::set_error_callback(ErrorCallback cb) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_error_ = std::move(cb);
}

void KeepAlive::loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    const auto period_start = std::chrono::steady_clock::now();
    uint64_t seen = interval_generation_;
    // A new interval re-arms the wait from the start of the current period.
    while (cv_.wait_until(lock, period_start + interval_, [this, &seen] {
      return !running_ || interval_generation_ != seen;
    })) {
      if (!running_) break;
      seen = interval_generation_;
    }
    if (!running_) break;

    lock.unlock();
    // [0x3E 0x00]: the positive reply only refreshes the session's activity clock.
    auto rsp = client_.tester_present(false);
    ++sent_;

    ErrorCallback cb;
    std::string error;
    if (!rsp.ok()) {
      ++failures_;
      error = "Tester present failed: " + describe(rsp);
      client_.logger().warn(error);
    }

    lock.lock();
    if (!error.empty()) {
      cb = on_error_;
      if (cb) {
        lock.unlock();
        cb(error);
        lock.lock();
      }
    }
  }
}

} // namespace ecudiag
