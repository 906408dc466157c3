#ifndef ECUDIAG_UDS_HPP
#define ECUDIAG_UDS_HPP

/**
 * @file uds.hpp
 * @brief Unified Diagnostic Services (UDS) – ISO 14229-1:2013 protocol types
 *
 * Service identifiers, sub-function parameters, timing configuration and the
 * transport abstraction shared by every ecudiag module.
 *
 * ============================================================================
 * ISO 14229-1:2013 REFERENCE GUIDE
 * ============================================================================
 *
 * - Section 7.2: Application Layer Protocol, timing (pp. 16-18)
 * - Section 8.3/8.4: Positive / negative response format (pp. 33-34)
 * - Section 9: Diagnostic and Communication Management (pp. 35-105)
 * - Section 10: Data Transmission (pp. 106-173)
 * - Section 11: Stored Data Transmission (pp. 174-244)
 * - Section 12: InputOutput Control (pp. 245-258)
 * - Section 13: Routine Functional Unit (pp. 259-269)
 * - Section 14: Upload Download (pp. 270-302)
 * - Annex A: Negative Response Codes (p. 325)
 *
 * MESSAGE FORMAT (Section 7.2, pp. 16-17):
 * - Request:  [SID] [Sub-function / parameters...]
 * - Positive: [SID+0x40] [Data...]
 * - Negative: [0x7F] [SID] [NRC] [service specific extra data...]
 *
 * TIMING PARAMETERS (Section 7.2, Table 2):
 * - P2server_max: Max time for initial response (default 50ms)
 * - P2*server_max: Max time for response after NRC 0x78 (default 5000ms)
 * - S3server: Session timeout (default 5000ms)
 */

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <functional>

namespace ecudiag {

using Bytes = std::vector<uint8_t>;

// ============================================================================
// 1) Service identifiers (SID)
//    ISO 14229-1:2013 Table 1 (p. 7). Positive responses use SID + 0x40.
// ============================================================================

enum class SID : uint8_t {
  // === Diagnostic and communication management (Section 9) ===
  DiagnosticSessionControl        = 0x10,  ///< Section 9.2 (p. 36)
  ECUReset                        = 0x11,  ///< Section 9.3 (p. 43)
  SecurityAccess                  = 0x27,  ///< Section 9.4 (p. 47)
  CommunicationControl            = 0x28,  ///< Section 9.5 (p. 53)
  Authentication                  = 0x29,  ///< ISO 14229-1:2020 Section 10
  TesterPresent                   = 0x3E,  ///< Section 9.6 (p. 58)
  AccessTimingParameters          = 0x83,  ///< Section 9.7 (p. 61)
  SecuredDataTransmission         = 0x84,  ///< Section 9.8 (p. 66)
  ControlDTCSetting               = 0x85,  ///< Section 9.9 (p. 71)
  ResponseOnEvent                 = 0x86,  ///< Section 9.10 (p. 75)
  LinkControl                     = 0x87,  ///< Section 9.11 (p. 99)

  // === Data transmission (Section 10) ===
  ReadDataByIdentifier            = 0x22,  ///< Section 10.2 (p. 106)
  ReadMemoryByAddress             = 0x23,  ///< Section 10.3 (p. 113)
  ReadScalingDataByIdentifier     = 0x24,  ///< Section 10.4 (p. 119)
  ReadDataByPeriodicIdentifier    = 0x2A,  ///< Section 10.5 (p. 126)
  DynamicallyDefineDataIdentifier = 0x2C,  ///< Section 10.6 (p. 140)
  WriteDataByIdentifier           = 0x2E,  ///< Section 10.7 (p. 162)
  WriteMemoryByAddress            = 0x3D,  ///< Section 10.8 (p. 167)

  // === Stored data transmission (Section 11) ===
  ClearDiagnosticInformation      = 0x14,  ///< Section 11.2 (p. 175)
  ReadDTCInformation              = 0x19,  ///< Section 11.3 (p. 178)

  // === InputOutput / Routine (Sections 12-13) ===
  InputOutputControlByIdentifier  = 0x2F,  ///< Section 12.2 (p. 245)
  RoutineControl                  = 0x31,  ///< Section 13.2 (p. 260)

  // === Upload / Download (Section 14) ===
  RequestDownload                 = 0x34,  ///< Section 14.2 (p. 270)
  RequestUpload                   = 0x35,  ///< Section 14.3 (p. 275)
  TransferData                    = 0x36,  ///< Section 14.4 (p. 280)
  RequestTransferExit             = 0x37,  ///< Section 14.5 (p. 285)
  RequestFileTransfer             = 0x38   ///< Section 14.6 (p. 295)
};

constexpr uint8_t kPositiveResponseOffset = 0x40;
constexpr uint8_t kNegativeResponseSid = 0x7F;

/// Bit 7 of a sub-function byte: suppressPosRspMsgIndicationBit
constexpr uint8_t kSuppressPositiveResponse = 0x80;

inline constexpr uint8_t to_byte(SID sid) { return static_cast<uint8_t>(sid); }

inline bool is_positive_response(uint8_t sid_rx, uint8_t sid_req) {
  return sid_rx == static_cast<uint8_t>(sid_req + kPositiveResponseOffset);
}

/// Human readable service name, "Unknown" for SIDs outside the catalogue.
const char* service_name(uint8_t sid);

// ============================================================================
// 2) Sub-function parameters
// ============================================================================

/**
 * @brief DiagnosticSessionControl (0x10) session types
 *
 * ISO 14229-1:2013 Table 25 (p. 39):
 * - 0x05-0x3F: Reserved
 * - 0x40-0x5F: Vehicle manufacturer specific
 * - 0x60-0x7E: System supplier specific
 */
enum class Session : uint8_t {
  DefaultSession      = 0x01,
  ProgrammingSession  = 0x02,
  ExtendedSession     = 0x03,
  SafetySystemSession = 0x04
};

/// Classification of a raw session type byte.
enum class SessionKind : uint8_t {
  Default,
  Programming,
  Extended,
  SafetySystem,
  VehicleManufacturer,  ///< 0x40-0x5F
  SystemSupplier,       ///< 0x60-0x7E
  Reserved
};

SessionKind classify_session(uint8_t session_type);

/// ECUReset (0x11) reset types, Table 33 (p. 44)
enum class EcuResetType : uint8_t {
  HardReset             = 0x01,
  KeyOffOnReset         = 0x02,
  SoftReset             = 0x03,
  EnableRapidPowerShut  = 0x04,
  DisableRapidPowerShut = 0x05
};

/// CommunicationControl (0x28) control types, Table 54 (p. 54)
enum class CommunicationControlType : uint8_t {
  EnableRxAndTx                          = 0x00,
  EnableRxDisableTx                      = 0x01,
  DisableRxEnableTx                      = 0x02,
  DisableRxAndTx                         = 0x03,
  EnableRxAndTxWithEnhancedAddrInfo      = 0x04,
  EnableRxDisableTxWithEnhancedAddrInfo  = 0x05,
  DisableRxEnableTxWithEnhancedAddrInfo  = 0x06,
  DisableRxAndTxWithEnhancedAddrInfo     = 0x07
};

/// CommunicationControl (0x28) communication type bitfield, Table 55 (p. 55)
enum class CommunicationType : uint8_t {
  NormalCommunicationMessages = 0x01,
  NetworkManagementMessages   = 0x02,
  NetworkDownloadUpload       = 0x03
};

/// RoutineControl (0x31) sub-functions, Table 379 (p. 262)
enum class RoutineAction : uint8_t {
  Start  = 0x01,
  Stop   = 0x02,
  Result = 0x03
};

/// ControlDTCSetting (0x85) sub-functions, Table 87 (p. 72)
enum class DTCSettingType : uint8_t {
  On  = 0x01,
  Off = 0x02
};

/// AccessTimingParameters (0x83) sub-functions, Table 74 (p. 63)
enum class AccessTimingParametersType : uint8_t {
  ReadExtendedTimingParameterSet      = 0x01,
  SetTimingParametersToDefaultValues  = 0x02,
  ReadCurrentlyActiveTimingParameters = 0x03,
  SetTimingParametersToGivenValues    = 0x04
};

/// ReadDataByPeriodicIdentifier (0x2A) transmission modes
enum class PeriodicTransmissionMode : uint8_t {
  SendAtSlowRate   = 0x01,
  SendAtMediumRate = 0x02,
  SendAtFastRate   = 0x03,
  StopSending      = 0x04
};

/// DynamicallyDefineDataIdentifier (0x2C) sub-functions
enum class DDDISubFunction : uint8_t {
  DefineByIdentifier                    = 0x01,
  DefineByMemoryAddress                 = 0x02,
  ClearDynamicallyDefinedDataIdentifier = 0x03
};

/// LinkControl (0x87) sub-functions, Table 165
enum class LinkControlType : uint8_t {
  VerifyModeTransitionWithFixedParameter    = 0x01,
  VerifyModeTransitionWithSpecificParameter = 0x02,
  TransitionMode                            = 0x03
};

/// RequestFileTransfer (0x38) modeOfOperation
enum class FileTransferMode : uint8_t {
  AddFile     = 0x01,
  DeleteFile  = 0x02,
  ReplaceFile = 0x03,
  ReadFile    = 0x04,
  ReadDir     = 0x05,
  ResumeFile  = 0x06
};

using DID = uint16_t;        // Data Identifier
using RoutineId = uint16_t;  // Routine Identifier
using PeriodicDID = uint8_t;
using BlockCounter = uint8_t;

/// DynamicallyDefineDataIdentifier source by DID
struct DDDI_SourceByDID {
  DID source_did;
  uint8_t position{1};   // 1-based byte position inside the source record
  uint8_t mem_size{0};   // number of bytes taken from the source
};

/// DynamicallyDefineDataIdentifier source by memory address
struct DDDI_SourceByMemory {
  uint32_t address{0};
  uint32_t size{0};
};

// ============================================================================
// 3) Configuration
// ============================================================================

/**
 * @brief UDS timing parameters
 *
 * ISO 14229-1:2013 Section 7.2 Table 2 (pp. 17-18). P2 and P2* are updated
 * from the server's DiagnosticSessionControl and AccessTimingParameters
 * responses.
 */
struct Timings {
  std::chrono::milliseconds p2{std::chrono::milliseconds(50)};      ///< P2server_max
  std::chrono::milliseconds p2_star{std::chrono::milliseconds(5000)}; ///< P2*server_max
  std::chrono::milliseconds s3{std::chrono::milliseconds(5000)};    ///< S3server session timeout
  std::chrono::milliseconds req_gap{std::chrono::milliseconds(0)};  ///< Minimum inter-request gap

  /// Upper bound on the total time spent waiting across repeated NRC 0x78.
  /// Once exceeded the exchange is abandoned as a timeout.
  std::chrono::milliseconds max_pending_wait{std::chrono::milliseconds(60000)};

  /// Poll window used to drain a late response owed by an abandoned exchange.
  std::chrono::milliseconds drain_timeout{std::chrono::milliseconds(10)};

  /// Timings suited to flash programming where erase/write routines pend long.
  static Timings programming() {
    Timings t;
    t.p2_star = std::chrono::milliseconds(10000);
    t.max_pending_wait = std::chrono::milliseconds(300000);
    return t;
  }
};

enum class LogLevel : uint8_t {
  Debug,
  Info,
  Warning,
  Error
};

using LogSink = std::function<void(LogLevel, const std::string&)>;

struct ClientConfig {
  Timings timings{};

  /// Tester Present period for KeepAlive, kept well below S3.
  std::chrono::milliseconds keep_alive_interval{std::chrono::milliseconds(2000)};

  /// Warn when a service is requested in a session where it is normally
  /// unavailable. The request is still sent.
  bool advisory_session_checks{true};

  /// Receives every log line; warnings/errors go to std::cerr when unset.
  LogSink log_sink;
};

// ============================================================================
// 4) Transport abstraction
// ============================================================================

enum class TransportStatus : uint8_t {
  Ok,
  Timeout,
  Error
};

/**
 * Transport collaborator: carries complete UDS messages. Implementations own
 * segmentation into bus frames (ISO-TP), flow control and addressing.
 * Calls are serialized by the Client; implementations need not be reentrant.
 */
class Transport {
public:
  virtual ~Transport() = default;

  /// Send one complete request. Returns false on I/O error.
  virtual bool send(const Bytes& tx) = 0;

  /// Wait up to @p timeout for one complete message.
  virtual TransportStatus receive(Bytes& rx, std::chrono::milliseconds timeout) = 0;
};

// Helper: big-endian building blocks
namespace codec {
  inline void be16(Bytes& v, uint16_t x){ v.push_back(uint8_t(x>>8)); v.push_back(uint8_t(x)); }
  inline void be24(Bytes& v, uint32_t x){ v.push_back(uint8_t(x>>16)); v.push_back(uint8_t(x>>8)); v.push_back(uint8_t(x)); }
  inline void be32(Bytes& v, uint32_t x){ v.push_back(uint8_t(x>>24)); v.push_back(uint8_t(x>>16)); v.push_back(uint8_t(x>>8)); v.push_back(uint8_t(x)); }
}

} // namespace ecudiag

#endif // ECUDIAG_UDS_HPP
