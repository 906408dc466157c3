#include "ecudiag/client.hpp"
#include "ecudiag/nrc.hpp"
#include <algorithm>
#include <cstring>
#include <thread>
#include <utility>

namespace ecudiag {

namespace {

using clock_type = std::chrono::steady_clock;

// Frames pulled off the transport while draining, at most.
constexpr int kMaxDrainFrames = 16;

std::chrono::milliseconds remaining_until(clock_type::time_point deadline) {
  auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - clock_type::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

// Positive response SID of a catalogued service other than @p request_sid.
bool is_foreign_positive_response(uint8_t sid_rx, uint8_t request_sid) {
  if (sid_rx < kPositiveResponseOffset) return false;
  const uint8_t sid = static_cast<uint8_t>(sid_rx - kPositiveResponseOffset);
  return sid != request_sid && std::strcmp(service_name(sid), "Unknown") != 0;
}

// Leading request bytes a positive response echoes back. The first echoed
// byte of a sub-function service is compared without the suppress bit.
struct EchoRule {
  size_t length;
  bool sub_function;
};

EchoRule echo_rule(uint8_t sid) {
  switch (static_cast<SID>(sid)) {
    case SID::DiagnosticSessionControl:
    case SID::ECUReset:
    case SID::ReadDTCInformation:
    case SID::SecurityAccess:
    case SID::CommunicationControl:
    case SID::TesterPresent:
    case SID::AccessTimingParameters:
    case SID::ControlDTCSetting:
    case SID::LinkControl:
      return {1, true};
    case SID::ReadDataByIdentifier:
    case SID::ReadScalingDataByIdentifier:
    case SID::WriteDataByIdentifier:
    case SID::InputOutputControlByIdentifier:
      return {2, false};
    case SID::RoutineControl:
      // [sub-function][routine id (2)]
      return {3, true};
    default:
      return {0, false};
  }
}

// Short positive replies are compared only as far as they go.
bool echo_matches(uint8_t sid, const Bytes& params, const Bytes& data) {
  const EchoRule rule = echo_rule(sid);
  const size_t n = std::min({rule.length, params.size(), data.size()});
  for (size_t i = 0; i < n; ++i) {
    uint8_t expected = params[i];
    if (i == 0 && rule.sub_function) expected &= static_cast<uint8_t>(~kSuppressPositiveResponse);
    if (data[i] != expected) return false;
  }
  return true;
}

std::string sid_label(uint8_t sid) {
  return std::string(service_name(sid)) + " (" + hex_byte(sid) + ")";
}

} // namespace

Client::Client(Transport& t, ClientConfig config)
  : t_(t), config_(std::move(config)), log_(config_.log_sink), timings_(config_.timings) {}

Timings Client::timings() const {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  return timings_;
}

void Client::set_timings(const Timings& t) {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  timings_ = t;
}

Client::CommunicationState Client::communication_state() const {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  return comm_state_;
}

bool Client::is_dtc_setting_enabled() const {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  return dtc_setting_enabled_;
}

// ================================================================
// Core exchange
// ================================================================

ServiceResponse Client::transact(uint8_t sid, const Bytes& params,
                                 std::chrono::milliseconds timeout) {
  check_session_advisory(sid);
  std::lock_guard<std::mutex> lock(tx_mutex_);
  return transact_locked(sid, params, timeout, false);
}

void Client::check_session_advisory(uint8_t sid) const {
  if (!config_.advisory_session_checks) return;
  if (!session_.is_service_allowed(sid)) {
    log_.warn(sid_label(sid) + " is normally unavailable in the default session; sending anyway");
  }
}

void Client::drain_stale_locked() {
  Bytes rx;
  for (int i = 0; i < kMaxDrainFrames; ++i) {
    rx.clear();
    const TransportStatus st = t_.receive(rx, timings_.drain_timeout);
    if (st == TransportStatus::Error) {
      log_.warn("Transport error while draining a stale response");
      break;
    }
    if (st == TransportStatus::Timeout) {
      break;
    }
    log_.warn("Discarded late response from an abandoned exchange: " + hex_dump(rx));
  }
  stale_response_expected_ = false;
}

// Send [SID | params], then wait for the correlated response. NRC 0x78 extends
// the wait by P2* each time it is received; nothing else is retried.
ServiceResponse Client::transact_locked(uint8_t sid, const Bytes& params,
                                        std::chrono::milliseconds timeout,
                                        bool suppressed) {
  if (stale_response_expected_) {
    drain_stale_locked();
  }

  if (timings_.req_gap.count() > 0) {
    const auto since = clock_type::now() - last_request_;
    if (since < timings_.req_gap) {
      std::this_thread::sleep_for(timings_.req_gap - since);
    }
  }

  if (timeout.count() == 0) timeout = timings_.p2;

  const Bytes tx = codec::encode(sid, params);
  log_.debug("-> " + hex_dump(tx));

  if (!t_.send(tx)) {
    log_.error("Transport send failed for " + sid_label(sid));
    return ServiceResponse::transport_error(sid, "send failed");
  }
  last_request_ = clock_type::now();

  auto deadline = last_request_ + timeout;
  const auto pending_limit = last_request_ + timings_.max_pending_wait;
  bool pending = false;
  Bytes rx;

  for (;;) {
    if (clock_type::now() >= deadline) break;

    rx.clear();
    const TransportStatus st = t_.receive(rx, remaining_until(deadline));
    if (st == TransportStatus::Error) {
      log_.error("Transport receive failed for " + sid_label(sid));
      // The exchange may still be answered; drop whatever arrives next time.
      stale_response_expected_ = true;
      return ServiceResponse::transport_error(sid, "receive failed");
    }
    if (st == TransportStatus::Timeout) break;

    log_.debug("<- " + hex_dump(rx));
    ServiceResponse rsp = codec::decode(sid, rx);

    if (rsp.is_negative() && rsp.nrc.service_id != sid) {
      log_.warn("Discarded uncorrelated negative response for " + sid_label(rsp.nrc.service_id));
      continue;
    }
    if (rsp.is_malformed() && !rx.empty() && is_foreign_positive_response(rx[0], sid)) {
      log_.warn("Discarded uncorrelated positive response " + hex_byte(rx[0]));
      continue;
    }
    if (rsp.ok() && !echo_matches(sid, params, rsp.data)) {
      log_.warn("Discarded positive response with mismatched echo for " + sid_label(sid) +
                ": " + hex_dump(rx));
      continue;
    }

    if (rsp.has_nrc(nrc::Code::RequestCorrectlyReceivedResponsePending)) {
      pending = true;
      const auto now = clock_type::now();
      if (now >= pending_limit) {
        log_.warn(sid_label(sid) + " still pending after " +
                  std::to_string(timings_.max_pending_wait.count()) + "ms, giving up");
        stale_response_expected_ = true;
        return ServiceResponse::timeout(sid);
      }
      deadline = std::min(now + timings_.p2_star, pending_limit);
      log_.debug(sid_label(sid) + " response pending, waiting up to P2*");
      continue;
    }

    if (rsp.ok()) {
      apply_positive_locked(sid, params, rsp);
    } else if (rsp.is_negative()) {
      log_.info(sid_label(sid) + " rejected: " + nrc::Interpreter::format_for_log(rsp.nrc.raw));
    } else {
      log_.warn("Malformed response to " + sid_label(sid) + ": " + hex_dump(rx));
    }
    return rsp;
  }

  // With the suppress bit set, silence until P2 counts as success.
  if (suppressed && !pending) {
    session_.touch();
    return ServiceResponse::positive(sid, {});
  }

  stale_response_expected_ = true;
  log_.warn("Timeout waiting for " + sid_label(sid) + (pending ? " after response pending" : ""));
  return ServiceResponse::timeout(sid);
}

void Client::apply_positive_locked(uint8_t sid, const Bytes& params, const ServiceResponse& rsp) {
  session_.touch();
  const uint8_t sub = params.empty() ? 0 : static_cast<uint8_t>(params[0] & 0x7F);

  switch (static_cast<SID>(sid)) {
    case SID::DiagnosticSessionControl: {
      if (params.empty()) break;
      session_.on_session_changed(sub);
      log_.info("Session changed to " + hex_byte(sub));

      // [session echo][P2server_max ms (2)][P2*server_max 10ms (2)]
      // Not all ECUs fill these in, so only update if present.
      if (rsp.data.size() >= 5) {
        const uint16_t p2_ms = static_cast<uint16_t>((rsp.data[1] << 8) | rsp.data[2]);
        const uint16_t p2_star_10ms = static_cast<uint16_t>((rsp.data[3] << 8) | rsp.data[4]);
        if (p2_ms != 0) timings_.p2 = std::chrono::milliseconds(p2_ms);
        if (p2_star_10ms != 0) timings_.p2_star = std::chrono::milliseconds(p2_star_10ms * 10);
      }
      break;
    }

    case SID::ECUReset:
      session_.on_reset();
      comm_state_ = CommunicationState{};
      dtc_setting_enabled_ = true;
      log_.info("ECU reset acknowledged, session back to default");
      break;

    case SID::SecurityAccess:
      // Even sub-function = sendKey accepted for seed level sub - 1.
      if (sub != 0 && (sub % 2) == 0) {
        session_.on_security_unlocked(static_cast<uint8_t>(sub - 1));
        log_.info("Security level " + hex_byte(static_cast<uint8_t>(sub - 1)) + " unlocked");
      }
      break;

    case SID::CommunicationControl:
      switch (sub) {
        case 0x00: // EnableRxAndTx
        case 0x04: // EnableRxAndTxWithEnhancedAddrInfo
          comm_state_.rx_enabled = true;
          comm_state_.tx_enabled = true;
          break;
        case 0x01: // EnableRxDisableTx
        case 0x05:
          comm_state_.rx_enabled = true;
          comm_state_.tx_enabled = false;
          break;
        case 0x02: // DisableRxEnableTx
        case 0x06:
          comm_state_.rx_enabled = false;
          comm_state_.tx_enabled = true;
          break;
        case 0x03: // DisableRxAndTx
        case 0x07:
          comm_state_.rx_enabled = false;
          comm_state_.tx_enabled = false;
          break;
        default:
          // OEM-specific or reserved control types leave the state as is
          break;
      }
      if (params.size() >= 2) comm_state_.active_comm_type = params[1];
      break;

    case SID::ControlDTCSetting:
      if (sub == static_cast<uint8_t>(DTCSettingType::On)) dtc_setting_enabled_ = true;
      if (sub == static_cast<uint8_t>(DTCSettingType::Off)) dtc_setting_enabled_ = false;
      break;

    case SID::AccessTimingParameters:
      // [sub echo][P2 ms (2)][P2* 10ms (2)]
      if ((sub == static_cast<uint8_t>(AccessTimingParametersType::ReadCurrentlyActiveTimingParameters) ||
           sub == static_cast<uint8_t>(AccessTimingParametersType::ReadExtendedTimingParameterSet)) &&
          rsp.data.size() >= 5) {
        const uint16_t p2_ms = static_cast<uint16_t>((rsp.data[1] << 8) | rsp.data[2]);
        const uint16_t p2_star_10ms = static_cast<uint16_t>((rsp.data[3] << 8) | rsp.data[4]);
        // Zero would leave no time to wait for any reply.
        if (p2_ms != 0) timings_.p2 = std::chrono::milliseconds(p2_ms);
        if (p2_star_10ms != 0) timings_.p2_star = std::chrono::milliseconds(p2_star_10ms * 10);
      }
      break;

    default:
      break;
  }
}

// ================================================================
// Diagnostic and communication management
// ================================================================

ServiceResponse Client::diagnostic_session_control(Session s) {
  return diagnostic_session_control(static_cast<uint8_t>(s));
}

ServiceResponse Client::diagnostic_session_control(uint8_t session_type) {
  return transact(SID::DiagnosticSessionControl, { session_type });
}

ServiceResponse Client::ecu_reset(EcuResetType type) {
  return transact(SID::ECUReset, { static_cast<uint8_t>(type) });
}

ServiceResponse Client::tester_present(bool suppress_response) {
  const uint8_t sub = suppress_response ? kSuppressPositiveResponse : 0x00;
  const uint8_t sid = to_byte(SID::TesterPresent);
  std::lock_guard<std::mutex> lock(tx_mutex_);
  return transact_locked(sid, { sub }, std::chrono::milliseconds(0), suppress_response);
}

ServiceResponse Client::security_access_request_seed(uint8_t level) {
  return transact(SID::SecurityAccess, { level });
}

ServiceResponse Client::security_access_send_key(uint8_t level, const Bytes& key) {
  Bytes p{ level };
  p.insert(p.end(), key.begin(), key.end());
  return transact(SID::SecurityAccess, p);
}

ServiceResponse Client::communication_control(uint8_t control_type, uint8_t communication_type) {
  return transact(SID::CommunicationControl, { control_type, communication_type });
}

ServiceResponse Client::authentication(uint8_t task, const Bytes& record) {
  Bytes p{ task };
  p.insert(p.end(), record.begin(), record.end());
  return transact(SID::Authentication, p);
}

ServiceResponse Client::access_timing_parameters(AccessTimingParametersType type, const Bytes& record) {
  Bytes p{ static_cast<uint8_t>(type) };
  p.insert(p.end(), record.begin(), record.end());
  return transact(SID::AccessTimingParameters, p);
}

ServiceResponse Client::secured_data_transmission(const Bytes& record) {
  return transact(SID::SecuredDataTransmission, record);
}

ServiceResponse Client::control_dtc_setting(uint8_t setting_type, const Bytes& record) {
  Bytes p{ setting_type };
  p.insert(p.end(), record.begin(), record.end());
  return transact(SID::ControlDTCSetting, p);
}

ServiceResponse Client::response_on_event(uint8_t event_type, uint8_t window_time, const Bytes& record) {
  // [eventType][eventWindowTime][eventTypeRecord + serviceToRespondToRecord]
  Bytes p{ event_type, window_time };
  p.insert(p.end(), record.begin(), record.end());
  return transact(SID::ResponseOnEvent, p);
}

ServiceResponse Client::link_control(uint8_t type, const Bytes& record) {
  Bytes p{ type };
  p.insert(p.end(), record.begin(), record.end());
  return transact(SID::LinkControl, p);
}

// ================================================================
// Data transmission
// ================================================================

ServiceResponse Client::read_data_by_identifier(DID did) {
  Bytes p; p.reserve(2);
  codec::be16(p, did);
  return transact(SID::ReadDataByIdentifier, p);
}

ServiceResponse Client::read_data_by_identifier(const std::vector<DID>& dids) {
  Bytes p; p.reserve(2 * dids.size());
  for (DID did : dids) codec::be16(p, did);
  return transact(SID::ReadDataByIdentifier, p);
}

// Shared layout of the memory services:
//   [prefix?][addressAndLengthFormatIdentifier][address...][size...][trailer...]
ServiceResponse Client::address_request(SID sid, uint8_t prefix, bool with_prefix,
                                        uint32_t address, uint32_t size,
                                        uint8_t addr_len, uint8_t size_len,
                                        const Bytes& trailer) {
  auto fields = codec::encode_address_and_size(address, size, addr_len, size_len);
  if (!fields) {
    log_.error(sid_label(to_byte(sid)) + ": address/size do not fit format " +
               std::to_string(addr_len) + "/" + std::to_string(size_len));
    ServiceResponse r = ServiceResponse::malformed(to_byte(sid));
    r.error = "invalid addressAndLengthFormatIdentifier";
    return r;
  }

  Bytes p;
  p.reserve(1 + fields->size() + trailer.size());
  if (with_prefix) p.push_back(prefix);
  p.insert(p.end(), fields->begin(), fields->end());
  p.insert(p.end(), trailer.begin(), trailer.end());
  return transact(sid, p, timings().p2_star);
}

ServiceResponse Client::read_memory_by_address(uint32_t address, uint32_t size,
                                               uint8_t addr_len, uint8_t size_len) {
  return address_request(SID::ReadMemoryByAddress, 0, false, address, size, addr_len, size_len, {});
}

ServiceResponse Client::read_scaling_data_by_identifier(DID did) {
  Bytes p; p.reserve(2);
  codec::be16(p, did);
  return transact(SID::ReadScalingDataByIdentifier, p);
}

ServiceResponse Client::read_data_by_periodic_identifier(PeriodicTransmissionMode mode,
                                                         const std::vector<PeriodicDID>& identifiers) {
  // [transmissionMode][periodicDataIdentifier...]
  Bytes p;
  p.reserve(1 + identifiers.size());
  p.push_back(static_cast<uint8_t>(mode));
  p.insert(p.end(), identifiers.begin(), identifiers.end());
  return transact(SID::ReadDataByPeriodicIdentifier, p);
}

ServiceResponse Client::dynamically_define_by_identifier(DID dynamic_did,
                                                         const std::vector<DDDI_SourceByDID>& sources) {
  // [0x01][dynamicDID][sourceDID][position][memorySize]...
  Bytes p;
  p.reserve(3 + sources.size() * 4);
  p.push_back(static_cast<uint8_t>(DDDISubFunction::DefineByIdentifier));
  codec::be16(p, dynamic_did);
  for (const auto& src : sources) {
    codec::be16(p, src.source_did);
    p.push_back(src.position);
    p.push_back(src.mem_size);
  }
  return transact(SID::DynamicallyDefineDataIdentifier, p);
}

ServiceResponse Client::dynamically_define_by_memory_address(DID dynamic_did,
                                                             const std::vector<DDDI_SourceByMemory>& sources,
                                                             uint8_t addr_len, uint8_t size_len) {
  // [0x02][dynamicDID][ALFID][address][size][address][size]...
  const uint8_t sid = to_byte(SID::DynamicallyDefineDataIdentifier);
  auto format = codec::make_address_and_length_format(addr_len, size_len);
  Bytes p;
  bool valid = format.has_value();
  if (valid) {
    p.push_back(static_cast<uint8_t>(DDDISubFunction::DefineByMemoryAddress));
    codec::be16(p, dynamic_did);
    p.push_back(*format);
    for (const auto& src : sources) {
      valid = valid && codec::append_be(p, src.address, addr_len) &&
              codec::append_be(p, src.size, size_len);
    }
  }
  if (!valid) {
    log_.error(sid_label(sid) + ": memory source does not fit format " +
               std::to_string(addr_len) + "/" + std::to_string(size_len));
    ServiceResponse r = ServiceResponse::malformed(sid);
    r.error = "invalid addressAndLengthFormatIdentifier";
    return r;
  }
  return transact(sid, p);
}

ServiceResponse Client::clear_dynamically_defined_identifier(DID dynamic_did) {
  Bytes p;
  p.reserve(3);
  p.push_back(static_cast<uint8_t>(DDDISubFunction::ClearDynamicallyDefinedDataIdentifier));
  codec::be16(p, dynamic_did);
  return transact(SID::DynamicallyDefineDataIdentifier, p);
}

ServiceResponse Client::write_data_by_identifier(DID did, const Bytes& data) {
  Bytes p; p.reserve(2 + data.size());
  codec::be16(p, did);
  p.insert(p.end(), data.begin(), data.end());
  return transact(SID::WriteDataByIdentifier, p);
}

ServiceResponse Client::write_memory_by_address(uint32_t address, const Bytes& data,
                                                uint8_t addr_len, uint8_t size_len) {
  return address_request(SID::WriteMemoryByAddress, 0, false, address,
                         static_cast<uint32_t>(data.size()), addr_len, size_len, data);
}

// ================================================================
// Stored data transmission
// ================================================================

ServiceResponse Client::clear_diagnostic_information(uint32_t group_of_dtc) {
  Bytes p; p.reserve(3);
  codec::be24(p, group_of_dtc);
  return transact(SID::ClearDiagnosticInformation, p, timings().p2_star);
}

ServiceResponse Client::read_dtc_information(uint8_t sub_function, const Bytes& record) {
  Bytes p{ sub_function };
  p.insert(p.end(), record.begin(), record.end());
  return transact(SID::ReadDTCInformation, p);
}

// ================================================================
// InputOutput / Routine
// ================================================================

ServiceResponse Client::input_output_control_by_identifier(DID did, const Bytes& control_option,
                                                           const Bytes& enable_mask) {
  // [DID][controlOptionRecord][controlEnableMaskRecord]
  Bytes p; p.reserve(2 + control_option.size() + enable_mask.size());
  codec::be16(p, did);
  p.insert(p.end(), control_option.begin(), control_option.end());
  p.insert(p.end(), enable_mask.begin(), enable_mask.end());
  return transact(SID::InputOutputControlByIdentifier, p);
}

ServiceResponse Client::routine_control(RoutineAction action, RoutineId id, const Bytes& record) {
  // [routineControlType][routineIdentifier (2)][routineControlOptionRecord]
  Bytes p; p.reserve(3 + record.size());
  p.push_back(static_cast<uint8_t>(action));
  codec::be16(p, id);
  p.insert(p.end(), record.begin(), record.end());
  return transact(SID::RoutineControl, p, timings().p2_star);
}

// ================================================================
// Upload / Download
// ================================================================

ServiceResponse Client::request_download(uint32_t address, uint32_t size,
                                         uint8_t addr_len, uint8_t size_len,
                                         uint8_t data_format) {
  // [dataFormatIdentifier][ALFID][memoryAddress][memorySize]
  return address_request(SID::RequestDownload, data_format, true, address, size,
                         addr_len, size_len, {});
}

ServiceResponse Client::request_upload(uint32_t address, uint32_t size,
                                       uint8_t addr_len, uint8_t size_len,
                                       uint8_t data_format) {
  // Identical layout to RequestDownload, different SID
  return address_request(SID::RequestUpload, data_format, true, address, size,
                         addr_len, size_len, {});
}

ServiceResponse Client::transfer_data(BlockCounter block, const Bytes& data) {
  Bytes p; p.reserve(1 + data.size());
  p.push_back(block);
  p.insert(p.end(), data.begin(), data.end());
  return transact(SID::TransferData, p, timings().p2_star);
}

ServiceResponse Client::request_transfer_exit(const Bytes& record) {
  return transact(SID::RequestTransferExit, record, timings().p2_star);
}

ServiceResponse Client::request_file_transfer(FileTransferMode mode, const std::string& path,
                                              uint32_t file_size, uint8_t data_format) {
  // [modeOfOperation][filePathAndNameLength (2)][filePathAndName]
  //   AddFile/ReplaceFile/ResumeFile: [DFI][fileSizeParameterLength][sizeUncompressed][sizeCompressed]
  //   ReadFile: [DFI]
  if (path.size() > 0xFFFF) {
    log_.error(sid_label(to_byte(SID::RequestFileTransfer)) + ": path of " +
               std::to_string(path.size()) + " bytes exceeds filePathAndNameLength");
    ServiceResponse r = ServiceResponse::malformed(to_byte(SID::RequestFileTransfer));
    r.error = "file path too long";
    return r;
  }

  Bytes p;
  p.push_back(static_cast<uint8_t>(mode));
  codec::be16(p, static_cast<uint16_t>(path.size()));
  p.insert(p.end(), path.begin(), path.end());

  switch (mode) {
    case FileTransferMode::AddFile:
    case FileTransferMode::ReplaceFile:
    case FileTransferMode::ResumeFile:
      p.push_back(data_format);
      p.push_back(4);
      codec::be32(p, file_size);
      codec::be32(p, file_size);
      break;
    case FileTransferMode::ReadFile:
      p.push_back(data_format);
      break;
    case FileTransferMode::DeleteFile:
    case FileTransferMode::ReadDir:
      break;
  }
  return transact(SID::RequestFileTransfer, p, timings().p2_star);
}

std::vector<uint8_t> Client::supported_services() {
  return {
    0x10, 0x11, 0x14, 0x19, 0x22, 0x23, 0x24, 0x27, 0x28, 0x29, 0x2A, 0x2C,
    0x2E, 0x2F, 0x31, 0x34, 0x35, 0x36, 0x37, 0x38, 0x3D, 0x3E, 0x83, 0x84,
    0x85, 0x86, 0x87
  };
}

} // namespace ecudiag
