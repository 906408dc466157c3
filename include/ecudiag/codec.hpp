#ifndef ECUDIAG_CODEC_HPP
#define ECUDIAG_CODEC_HPP

/**
 * @file codec.hpp
 * @brief Frame codec - ISO 14229-1:2013 Sections 8.3, 8.4 and Annex G
 *
 * Request:   [SID] [parameters...]
 * Positive:  [SID + 0x40] [data...]
 * Negative:  [0x7F] [SID] [NRC] [service specific extra data...]
 *
 * Decoding never throws: every input maps to a tagged ServiceResponse.
 *
 * addressAndLengthFormatIdentifier (Annex G):
 *   bits 7-4: memoryAddress byte count (1..4 supported)
 *   bits 3-0: memorySize byte count (1..4 supported)
 */

#include "ecudiag/uds.hpp"
#include "ecudiag/nrc.hpp"
#include <optional>
#include <string>

namespace ecudiag {

enum class Outcome : uint8_t {
  Positive,
  Negative,
  Timeout,
  Malformed,
  TransportError
};

const char* outcome_name(Outcome outcome);

struct NegativeResponse {
  uint8_t service_id{0};            ///< service that was rejected
  nrc::Code code{nrc::Code::Unknown};
  uint8_t raw{0};                   ///< NRC byte as received

  bool is_known() const { return code != nrc::Code::Unknown; }
};

/**
 * Tagged outcome of one exchange.
 *
 * Positive: service_id is the request SID, data is everything after the
 * response SID. Negative: nrc is set and data holds any trailing bytes after
 * the NRC. Malformed: data holds the raw frame. TransportError: error holds
 * the reason.
 */
struct ServiceResponse {
  Outcome kind{Outcome::Malformed};
  uint8_t service_id{0};
  Bytes data;
  NegativeResponse nrc{};
  std::string error;

  bool ok() const { return kind == Outcome::Positive; }
  bool is_negative() const { return kind == Outcome::Negative; }
  bool is_timeout() const { return kind == Outcome::Timeout; }
  bool is_malformed() const { return kind == Outcome::Malformed; }
  bool is_transport_error() const { return kind == Outcome::TransportError; }

  bool has_nrc(nrc::Code code) const { return kind == Outcome::Negative && nrc.code == code; }

  static ServiceResponse positive(uint8_t sid, Bytes payload);
  static ServiceResponse negative(uint8_t sid, uint8_t raw_nrc, Bytes extra = {});
  static ServiceResponse timeout(uint8_t sid);
  static ServiceResponse malformed(uint8_t sid, Bytes raw = {});
  static ServiceResponse transport_error(uint8_t sid, std::string reason);
};

/// Short description for log lines, e.g. "negative 0x31: Request Out Of Range".
std::string describe(const ServiceResponse& response);

namespace codec {

/// [sid][params...]
Bytes encode(uint8_t sid, const Bytes& params);
inline Bytes encode(SID sid, const Bytes& params) { return encode(to_byte(sid), params); }

/// Classify @p rx as the answer to a request for @p request_sid.
ServiceResponse decode(uint8_t request_sid, const Bytes& rx);

/// Server-side framing, used by simulated ECUs.
Bytes encode_positive_response(uint8_t sid, const Bytes& data);
Bytes encode_negative_response(uint8_t sid, uint8_t raw_nrc, const Bytes& extra = {});
inline Bytes encode_negative_response(uint8_t sid, nrc::Code code, const Bytes& extra = {}) {
  return encode_negative_response(sid, static_cast<uint8_t>(code), extra);
}

constexpr uint8_t kMinFieldWidth = 1;
constexpr uint8_t kMaxFieldWidth = 4;

inline bool valid_field_width(uint8_t width) {
  return width >= kMinFieldWidth && width <= kMaxFieldWidth;
}

/// Append @p value big-endian in @p width bytes. False when it does not fit.
bool append_be(Bytes& out, uint32_t value, uint8_t width);

/// Read @p width big-endian bytes starting at @p offset.
std::optional<uint32_t> read_be(const Bytes& in, size_t offset, uint8_t width);

/// (addr_len << 4) | size_len, or nullopt when either is outside 1..4.
std::optional<uint8_t> make_address_and_length_format(uint8_t addr_len, uint8_t size_len);

/// [format][address][size]; nullopt for invalid widths or values that overflow them.
std::optional<Bytes> encode_address_and_size(uint32_t address, uint32_t size,
                                             uint8_t addr_len, uint8_t size_len);

struct LengthFormat {
  uint8_t high{0};  ///< high nibble
  uint8_t low{0};   ///< low nibble
};

inline LengthFormat split_format(uint8_t format) {
  return LengthFormat{static_cast<uint8_t>(format >> 4), static_cast<uint8_t>(format & 0x0F)};
}

} // namespace codec
} // namespace ecudiag

#endif // ECUDIAG_CODEC_HPP
