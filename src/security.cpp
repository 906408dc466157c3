#include "ecudiag/security.hpp"
#include "ecudiag/client.hpp"
#include "ecudiag/log.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace ecudiag {
namespace security {

const char* state_name(State state) {
  switch (state) {
    case State::Idle: return "Idle";
    case State::SeedRequested: return "SeedRequested";
    case State::Unlocked: return "Unlocked";
  }
  return "Unknown";
}

const char* status_name(HandshakeResult::Status status) {
  using S = HandshakeResult::Status;
  switch (status) {
    case S::Unlocked: return "Unlocked";
    case S::InvalidLevel: return "InvalidLevel";
    case S::KeyDerivationFailed: return "KeyDerivationFailed";
    case S::SeedMalformed: return "SeedMalformed";
    case S::Negative: return "Negative";
    case S::Timeout: return "Timeout";
    case S::Malformed: return "Malformed";
    case S::TransportError: return "TransportError";
  }
  return "Unknown";
}

SecurityAccess::SecurityAccess(Client& client) : client_(client) {}

State SecurityAccess::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

uint8_t SecurityAccess::level() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

void SecurityAccess::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = State::Idle;
  level_ = 0;
}

HandshakeResult::Status SecurityAccess::status_from(const ServiceResponse& rsp) {
  switch (rsp.kind) {
    case Outcome::Positive: return HandshakeResult::Status::Unlocked;
    case Outcome::Negative: return HandshakeResult::Status::Negative;
    case Outcome::Timeout: return HandshakeResult::Status::Timeout;
    case Outcome::Malformed: return HandshakeResult::Status::Malformed;
    case Outcome::TransportError: return HandshakeResult::Status::TransportError;
  }
  return HandshakeResult::Status::Malformed;
}

HandshakeResult SecurityAccess::fail(HandshakeResult::Status status, ServiceResponse last, Bytes seed) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::Idle;
    level_ = 0;
  }
  std::string msg = std::string("Security access failed: ") + status_name(status);
  if (last.is_negative()) {
    msg += " (" + nrc::Interpreter::format_for_log(last.nrc.raw) + ")";
  }
  client_.logger().warn(msg);

  HandshakeResult r;
  r.status = status;
  r.last = std::move(last);
  r.seed = std::move(seed);
  return r;
}

HandshakeResult SecurityAccess::request(uint8_t level, SeedKeyStrategy& strategy) {
  if (!is_seed_level(level)) {
    return fail(HandshakeResult::Status::InvalidLevel, ServiceResponse{});
  }

  // Step 1: requestSeed
  auto seed_rsp = client_.security_access_request_seed(level);
  if (!seed_rsp.ok()) {
    return fail(status_from(seed_rsp), std::move(seed_rsp));
  }
  if (seed_rsp.data.empty() || seed_rsp.data[0] != level) {
    return fail(HandshakeResult::Status::SeedMalformed, std::move(seed_rsp));
  }

  Bytes seed(seed_rsp.data.begin() + 1, seed_rsp.data.end());
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::SeedRequested;
    level_ = level;
  }
  client_.logger().debug("Seed received for level " + hex_byte(level) + ": " + hex_dump(seed));

  // Empty or all-zero seed: nothing to unlock
  const bool already_unlocked =
      std::all_of(seed.begin(), seed.end(), [](uint8_t b) { return b == 0; });
  if (already_unlocked) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      state_ = State::Unlocked;
    }
    client_.logger().info("Security level " + hex_byte(level) + " already unlocked");
    HandshakeResult r;
    r.status = HandshakeResult::Status::Unlocked;
    r.last = std::move(seed_rsp);
    r.seed = std::move(seed);
    return r;
  }

  // Step 2: derive key
  Bytes key = strategy.derive_key(seed, level);
  if (key.empty()) {
    return fail(HandshakeResult::Status::KeyDerivationFailed, std::move(seed_rsp), std::move(seed));
  }

  // Step 3: sendKey
  const uint8_t key_level = static_cast<uint8_t>(level + 1);
  auto key_rsp = client_.security_access_send_key(key_level, key);
  if (!key_rsp.ok()) {
    return fail(status_from(key_rsp), std::move(key_rsp), std::move(seed));
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::Unlocked;
  }
  HandshakeResult r;
  r.status = HandshakeResult::Status::Unlocked;
  r.last = std::move(key_rsp);
  r.seed = std::move(seed);
  return r;
}

HandshakeResult SecurityAccess::send_static_key(uint8_t key_level, const Bytes& key) {
  if (!is_key_level(key_level)) {
    return fail(HandshakeResult::Status::InvalidLevel, ServiceResponse{});
  }
  if (key.empty()) {
    return fail(HandshakeResult::Status::KeyDerivationFailed, ServiceResponse{});
  }

  auto rsp = client_.security_access_send_key(key_level, key);
  if (!rsp.ok()) {
    return fail(status_from(rsp), std::move(rsp));
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::Unlocked;
    level_ = static_cast<uint8_t>(key_level - 1);
  }
  HandshakeResult r;
  r.status = HandshakeResult::Status::Unlocked;
  r.last = std::move(rsp);
  return r;
}

} // namespace security
} // namespace ecudiag
