#ifndef ECUDIAG_SECURITY_HPP
#define ECUDIAG_SECURITY_HPP

/**
 * @file security.hpp
 * @brief SecurityAccess (0x27) seed/key handshake - ISO 14229-1:2013 Section 9.4
 *
 *   Sub-functions:
 *     Odd values (0x01, 0x03, ...): requestSeed
 *     Even values (0x02, 0x04, ...): sendKey for the preceding odd level
 *
 *   Request Format:
 *     requestSeed: [0x27] [securityAccessType (odd)]
 *     sendKey:     [0x27] [securityAccessType (even)] [securityKey...]
 *
 *   Response Format:
 *     requestSeed: [0x67] [securityAccessType] [securitySeed...]
 *     sendKey:     [0x67] [securityAccessType]
 *
 *   A seed of all zero bytes means the level is already unlocked.
 *
 *   Security NRCs (Annex A, Table A.1):
 *     0x35: invalidKey
 *     0x36: exceededNumberOfAttempts
 *     0x37: requiredTimeDelayNotExpired
 *
 * The key algorithm is always supplied by the caller through SeedKeyStrategy.
 *
 * Usage:
 * @code
 *   ecudiag::security::FunctionSeedKey algo([](const ecudiag::Bytes& seed, uint8_t) {
 *     return oem_key_from_seed(seed);
 *   });
 *   ecudiag::security::SecurityAccess sa(client);
 *   auto r = sa.request(0x01, algo);
 *   if (!r.ok()) { ... r.last ... }
 * @endcode
 */

#include "ecudiag/uds.hpp"
#include "ecudiag/codec.hpp"
#include <functional>
#include <mutex>
#include <utility>

namespace ecudiag {

class Client;

namespace security {

/// Common seed levels. Odd values = requestSeed.
namespace Level {
  constexpr uint8_t Basic       = 0x01;
  constexpr uint8_t Extended    = 0x03;
  constexpr uint8_t Programming = 0x05;
  constexpr uint8_t Calibration = 0x07;
  // 0x09-0x41: OEM-specific levels
  // 0x61-0x7E: System supplier specific
}

inline bool is_seed_level(uint8_t level) { return level != 0 && level <= 0x7E && (level % 2) == 1; }
inline bool is_key_level(uint8_t level) { return level != 0 && level <= 0x7E && (level % 2) == 0; }

/**
 * Computes the key for a seed. Implement this for the OEM algorithm.
 * Return an empty vector to abort the handshake.
 */
class SeedKeyStrategy {
public:
  virtual ~SeedKeyStrategy() = default;
  virtual Bytes derive_key(const Bytes& seed, uint8_t level) = 0;
};

/// Adapts a callable into a SeedKeyStrategy.
class FunctionSeedKey : public SeedKeyStrategy {
public:
  using Fn = std::function<Bytes(const Bytes& seed, uint8_t level)>;

  explicit FunctionSeedKey(Fn fn) : fn_(std::move(fn)) {}

  Bytes derive_key(const Bytes& seed, uint8_t level) override {
    return fn_ ? fn_(seed, level) : Bytes{};
  }

private:
  Fn fn_;
};

enum class State : uint8_t {
  Idle,
  SeedRequested,
  Unlocked
};

const char* state_name(State state);

struct HandshakeResult {
  enum class Status : uint8_t {
    Unlocked,             ///< Key accepted (or seed said no key needed)
    InvalidLevel,         ///< Level is not a valid odd/even sub-function
    KeyDerivationFailed,  ///< Strategy returned no key, nothing sent
    SeedMalformed,        ///< Positive seed response without the level echo
    Negative,             ///< ECU rejected seed or key, see last.nrc
    Timeout,
    Malformed,
    TransportError
  };

  Status status{Status::InvalidLevel};
  ServiceResponse last{};  ///< last exchange, empty when nothing was sent
  Bytes seed;              ///< seed as received, if any

  bool ok() const { return status == Status::Unlocked; }
};

const char* status_name(HandshakeResult::Status status);

/**
 * Seed/key state machine for one client.
 *
 *   Idle -> SeedRequested(level) -> Unlocked(level) | Idle
 *
 * Any failure returns to Idle. Nothing is retried: 0x36 and 0x37 are
 * handed back to the caller.
 */
class SecurityAccess {
public:
  explicit SecurityAccess(Client& client);

  /// Full handshake for odd seed level @p level.
  HandshakeResult request(uint8_t level, SeedKeyStrategy& strategy);

  /// Send a precomputed key at even level @p key_level without requesting a seed.
  HandshakeResult send_static_key(uint8_t key_level, const Bytes& key);

  /**
   * Handshake state as seen by this object, not by the ECU.
   *
   * It can differ from Client::session().security_level(): an empty or
   * all-zero seed reports Unlocked without any key acknowledgement, so the
   * client's tracker stays at 0. A later session change or ECU reset relocks
   * the tracker but leaves this state alone until reset() is called.
   */
  State state() const;
  uint8_t level() const;  ///< seed level of the current handshake, 0 when Idle

  /// Back to Idle, e.g. after the session changed.
  void reset();

private:
  HandshakeResult fail(HandshakeResult::Status status, ServiceResponse last, Bytes seed = {});
  static HandshakeResult::Status status_from(const ServiceResponse& rsp);

  Client& client_;
  mutable std::mutex mutex_;
  State state_{State::Idle};
  uint8_t level_{0};
};

} // namespace security
} // namespace ecudiag

#endif // ECUDIAG_SECURITY_HPP
