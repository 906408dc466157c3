#pragma once
/**
 * @file nrc.hpp
 * @brief Negative Response Codes (NRC) - ISO 14229-1:2013 Annex A
 *
 * Negative Response Message Format (Section 8.4, p. 34):
 *   [0x7F] [Request SID] [NRC]
 *
 * NRC Ranges (Table A.1):
 *   0x00:       Reserved (positive response indicator)
 *   0x10-0x2F:  General NRCs
 *   0x31-0x37:  Request/security NRCs
 *   0x70-0x78:  Upload/download NRCs
 *   0x7E-0x7F:  Session NRCs
 *   0x80-0xFF:  Vehicle manufacturer specific conditions
 *
 * The code space is open: servers may send values this library does not
 * know. Those decode to Code::Unknown while the raw byte is kept by the
 * caller (see ecudiag::NegativeResponse), so nothing is ever dropped.
 */

#include <cstdint>
#include <string>
#include <optional>
#include <vector>

namespace ecudiag {
namespace nrc {

/**
 * @brief Negative Response Codes per ISO 14229-1:2013 Table A.1
 *
 * CRITICAL NRCs for implementation:
 * - 0x78: ResponsePending - Wait P2* and keep listening
 * - 0x73: WrongBlockSequenceCounter - Transfer is desynchronized
 */
enum class Code : uint8_t {
    /// 0x00 is reserved in the NRC slot, so it doubles as the unknown marker.
    Unknown                                     = 0x00,

    // === General NRCs (0x10-0x14) ===
    GeneralReject                               = 0x10,
    ServiceNotSupported                         = 0x11,
    SubFunctionNotSupported                     = 0x12,
    IncorrectMessageLengthOrInvalidFormat       = 0x13,
    ResponseTooLong                             = 0x14,

    // === Busy / condition NRCs (0x21-0x26) ===
    BusyRepeatRequest                           = 0x21,
    ConditionsNotCorrect                        = 0x22,
    RequestSequenceError                        = 0x24,
    NoResponseFromSubnetComponent               = 0x25,
    FailurePreventsExecutionOfRequestedAction   = 0x26,

    // === Range / security NRCs (0x31-0x37) ===
    RequestOutOfRange                           = 0x31,
    SecurityAccessDenied                        = 0x33,
    InvalidKey                                  = 0x35,
    ExceededNumberOfAttempts                    = 0x36,
    RequiredTimeDelayNotExpired                 = 0x37,

    // === Upload/Download NRCs (0x70-0x73) ===
    UploadDownloadNotAccepted                   = 0x70,
    TransferDataSuspended                       = 0x71,
    GeneralProgrammingFailure                   = 0x72,
    WrongBlockSequenceCounter                   = 0x73,

    // === Response Pending (0x78) ===
    RequestCorrectlyReceivedResponsePending     = 0x78,

    // === Session NRCs (0x7E-0x7F) ===
    SubFunctionNotSupportedInActiveSession      = 0x7E,
    ServiceNotSupportedInActiveSession          = 0x7F,

    // === Vehicle condition NRCs (0x81-0x93) ===
    RpmTooHigh                                  = 0x81,
    RpmTooLow                                   = 0x82,
    EngineIsRunning                             = 0x83,
    EngineIsNotRunning                          = 0x84,
    EngineRunTimeTooLow                         = 0x85,
    TemperatureTooHigh                          = 0x86,
    TemperatureTooLow                           = 0x87,
    VehicleSpeedTooHigh                         = 0x88,
    VehicleSpeedTooLow                          = 0x89,
    ThrottlePedalTooHigh                        = 0x8A,
    ThrottlePedalTooLow                         = 0x8B,
    TransmissionRangeNotInNeutral               = 0x8C,
    TransmissionRangeNotInGear                  = 0x8D,
    BrakeSwitchNotClosed                        = 0x8F,
    ShifterLeverNotInPark                       = 0x90,
    TorqueConverterClutchLocked                 = 0x91,
    VoltageTooHigh                              = 0x92,
    VoltageTooLow                               = 0x93
};

/// True when @p raw is one of the codes enumerated above.
bool is_known(uint8_t raw);

/// Map a raw NRC byte to the closed enumeration; unknown bytes give Code::Unknown.
Code from_byte(uint8_t raw);

// ============================================================================
// Caller guidance. The client never acts on these except for 0x78.
// ============================================================================

enum class Action {
    Abort,              // Unrecoverable error, stop
    Retry,              // Retrying the request may succeed
    Wait,               // Wait before continuing (security delay)
    WaitAndRetry,       // Wait then retry the same request
    ContinuePending,    // Keep waiting for the response (NRC 0x78)
    Unsupported         // Service/sub-function not supported
};

enum class Category {
    GeneralReject,      // Unrecoverable errors
    Busy,               // ECU is busy, retry may succeed
    ConditionsNotMet,   // Preconditions not satisfied
    SecurityIssue,      // Security access problems
    ProgrammingError,   // Flash/programming errors
    SessionIssue,       // Wrong diagnostic session
    VehicleCondition,   // Vehicle state not suitable
    ResponsePending,    // Long operation in progress
    Unknown
};

class Interpreter {
public:
    /// Human-readable description; "Unknown NRC" for codes outside the table.
    static std::string get_description(Code nrc);
    static std::string get_description(uint8_t raw);

    static Category get_category(Code nrc);

    /// Recommended action for a caller-side retry policy.
    static Action get_action(Code nrc);
    static std::string get_recommended_action(Code nrc);

    static bool is_recoverable(Code nrc);

    static bool is_response_pending(Code nrc) {
        return nrc == Code::RequestCorrectlyReceivedResponsePending;
    }

    static bool is_security_error(Code nrc);
    static bool is_programming_error(Code nrc);
    static bool is_session_error(Code nrc);

    /// Extract the NRC from a raw [0x7F, SID, NRC] frame.
    static std::optional<Code> parse_from_response(const std::vector<uint8_t>& response);

    /// Format for logging, e.g. "0x22: Conditions Not Correct"
    static std::string format_for_log(uint8_t raw);
    static std::string format_for_log(Code nrc) {
        return format_for_log(static_cast<uint8_t>(nrc));
    }
};

} // namespace nrc
} // namespace ecudiag
