#include "ecudiag/codec.hpp"
#include "ecudiag/log.hpp"
#include <utility>

namespace ecudiag {

const char* outcome_name(Outcome outcome) {
  switch (outcome) {
    case Outcome::Positive: return "positive";
    case Outcome::Negative: return "negative";
    case Outcome::Timeout: return "timeout";
    case Outcome::Malformed: return "malformed";
    case Outcome::TransportError: return "transport error";
  }
  return "unknown";
}

ServiceResponse ServiceResponse::positive(uint8_t sid, Bytes payload) {
  ServiceResponse r;
  r.kind = Outcome::Positive;
  r.service_id = sid;
  r.data = std::move(payload);
  return r;
}

ServiceResponse ServiceResponse::negative(uint8_t sid, uint8_t raw_nrc, Bytes extra) {
  ServiceResponse r;
  r.kind = Outcome::Negative;
  r.service_id = sid;
  r.nrc.service_id = sid;
  r.nrc.raw = raw_nrc;
  r.nrc.code = nrc::from_byte(raw_nrc);
  r.data = std::move(extra);
  return r;
}

ServiceResponse ServiceResponse::timeout(uint8_t sid) {
  ServiceResponse r;
  r.kind = Outcome::Timeout;
  r.service_id = sid;
  return r;
}

ServiceResponse ServiceResponse::malformed(uint8_t sid, Bytes raw) {
  ServiceResponse r;
  r.kind = Outcome::Malformed;
  r.service_id = sid;
  r.data = std::move(raw);
  return r;
}

ServiceResponse ServiceResponse::transport_error(uint8_t sid, std::string reason) {
  ServiceResponse r;
  r.kind = Outcome::TransportError;
  r.service_id = sid;
  r.error = std::move(reason);
  return r;
}

std::string describe(const ServiceResponse& response) {
  std::string out = outcome_name(response.kind);
  switch (response.kind) {
    case Outcome::Negative:
      out += " " + nrc::Interpreter::format_for_log(response.nrc.raw);
      break;
    case Outcome::Malformed:
      if (!response.data.empty()) out += " [" + hex_dump(response.data) + "]";
      break;
    case Outcome::TransportError:
      if (!response.error.empty()) out += ": " + response.error;
      break;
    default:
      break;
  }
  return out;
}

namespace codec {

Bytes encode(uint8_t sid, const Bytes& params) {
  Bytes tx;
  tx.reserve(1 + params.size());
  tx.push_back(sid);
  tx.insert(tx.end(), params.begin(), params.end());
  return tx;
}

ServiceResponse decode(uint8_t request_sid, const Bytes& rx) {
  if (rx.empty()) {
    return ServiceResponse::malformed(request_sid);
  }

  const uint8_t sid_rx = rx[0];

  if (sid_rx == kNegativeResponseSid) {
    // [0x7F][original SID][NRC][extra...]
    if (rx.size() < 3) {
      return ServiceResponse::malformed(request_sid, rx);
    }
    return ServiceResponse::negative(rx[1], rx[2], Bytes(rx.begin() + 3, rx.end()));
  }

  if (is_positive_response(sid_rx, request_sid)) {
    return ServiceResponse::positive(request_sid, Bytes(rx.begin() + 1, rx.end()));
  }

  return ServiceResponse::malformed(request_sid, rx);
}

Bytes encode_positive_response(uint8_t sid, const Bytes& data) {
  return encode(static_cast<uint8_t>(sid + kPositiveResponseOffset), data);
}

Bytes encode_negative_response(uint8_t sid, uint8_t raw_nrc, const Bytes& extra) {
  Bytes rx{kNegativeResponseSid, sid, raw_nrc};
  rx.insert(rx.end(), extra.begin(), extra.end());
  return rx;
}

bool append_be(Bytes& out, uint32_t value, uint8_t width) {
  if (!valid_field_width(width)) return false;
  if (width < 4 && (value >> (8 * width)) != 0) return false;
  for (int shift = 8 * (width - 1); shift >= 0; shift -= 8) {
    out.push_back(static_cast<uint8_t>(value >> shift));
  }
  return true;
}

std::optional<uint32_t> read_be(const Bytes& in, size_t offset, uint8_t width) {
  if (!valid_field_width(width) || offset + width > in.size()) {
    return std::nullopt;
  }
  uint32_t value = 0;
  for (uint8_t i = 0; i < width; ++i) {
    value = (value << 8) | in[offset + i];
  }
  return value;
}

std::optional<uint8_t> make_address_and_length_format(uint8_t addr_len, uint8_t size_len) {
  if (!valid_field_width(addr_len) || !valid_field_width(size_len)) {
    return std::nullopt;
  }
  return static_cast<uint8_t>((addr_len << 4) | size_len);
}

std::optional<Bytes> encode_address_and_size(uint32_t address, uint32_t size,
                                             uint8_t addr_len, uint8_t size_len) {
  auto format = make_address_and_length_format(addr_len, size_len);
  if (!format) return std::nullopt;

  Bytes out;
  out.reserve(1 + addr_len + size_len);
  out.push_back(*format);
  if (!append_be(out, address, addr_len)) return std::nullopt;
  if (!append_be(out, size, size_len)) return std::nullopt;
  return out;
}

} // namespace codec
} // namespace ecudiag
