#ifndef ECUDIAG_SESSION_HPP
#define ECUDIAG_SESSION_HPP

/**
 * @file session.hpp
 * @brief Diagnostic session state and Tester Present keep-alive
 *
 * DiagnosticSessionControl (0x10) - Section 9.2 (p. 36):
 *   The server drops back to the default session when no request arrives
 *   within S3server (5000ms default). Non-default sessions are held open by
 *   sending TesterPresent (0x3E) periodically.
 *
 * TesterPresent (0x3E) - Section 9.6 (p. 58):
 *   Request:  [0x3E] [0x00]        (0x80 = suppress positive response)
 *   Response: [0x7E] [0x00]
 *
 * Services not available in the default session (Table 23):
 *   0x27, 0x28, 0x2F, 0x34-0x38, 0x83, 0x85, 0x87
 */

#include "ecudiag/uds.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace ecudiag {

class Client;

struct SessionState {
  uint8_t session_type{static_cast<uint8_t>(Session::DefaultSession)};
  uint8_t security_level{0};  ///< unlocked seed level, 0 = locked
  std::chrono::steady_clock::time_point last_activity{};

  SessionKind kind() const { return classify_session(session_type); }
  bool is_default() const { return kind() == SessionKind::Default; }
  bool is_unlocked() const { return security_level != 0; }
};

/**
 * Holds the SessionState of one ECU connection.
 *
 * Mutators are called by the Client from inside its transaction critical
 * section; readers may run on any thread and get a consistent snapshot.
 */
class SessionTracker {
public:
  SessionTracker();

  SessionState snapshot() const;

  uint8_t session_type() const;
  uint8_t security_level() const;
  std::chrono::steady_clock::time_point last_activity() const;
  std::chrono::milliseconds idle_time() const;

  /// Positive DiagnosticSessionControl. A session change re-locks security.
  void on_session_changed(uint8_t session_type);

  /// Positive SecurityAccess sendKey for seed level @p level.
  void on_security_unlocked(uint8_t level);

  /// Positive ECUReset: server is back in the default, locked state.
  void on_reset();

  /// Any positive response.
  void touch();

  /// True when @p sid is normally available in the current session.
  bool is_service_allowed(uint8_t sid) const;

  static bool requires_non_default_session(uint8_t sid);

private:
  mutable std::mutex mutex_;
  SessionState state_;
};

/**
 * Background Tester Present sender.
 *
 * Sends [0x3E 0x00] through Client::tester_present every interval until
 * stopped. Each exchange goes through the client's transaction lock, so it
 * never interleaves with foreground requests.
 */
class KeepAlive {
public:
  using ErrorCallback = std::function<void(const std::string&)>;

  /// Interval 0 uses ClientConfig::keep_alive_interval.
  explicit KeepAlive(Client& client,
                     std::chrono::milliseconds interval = std::chrono::milliseconds(0));
  ~KeepAlive();

  KeepAlive(const KeepAlive&) = delete;
  KeepAlive& operator=(const KeepAlive&) = delete;

  void start();
  void stop();
  bool is_running() const { return running_; }

  void set_interval(std::chrono::milliseconds interval);
  std::chrono::milliseconds interval() const;

  void set_error_callback(ErrorCallback cb);

  uint64_t sent_count() const { return sent_; }
  uint64_t failure_count() const { return failures_; }

private:
  void loop();

  Client& client_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::chrono::milliseconds interval_;
  uint64_t interval_generation_{0};  ///< bumped by set_interval, guarded by mutex_
  ErrorCallback on_error_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> sent_{0};
  std::atomic<uint64_t> failures_{0};
  std::thread thread_;
};

} // namespace ecudiag

#endif // ECUDIAG_SESSION_HPP
