#ifndef ECUDIAG_CLIENT_HPP
#define ECUDIAG_CLIENT_HPP

/**
 * @file client.hpp
 * @brief UDS transaction manager and service catalogue
 *
 * Client::transact is the single primitive every service goes through. It
 * holds the client's transaction lock for the complete exchange:
 *
 *   1. drain a late response owed by a previously abandoned exchange
 *   2. send [SID][params]
 *   3. wait P2 for the response
 *   4. on NRC 0x78 keep waiting, P2* per pending indication, up to
 *      Timings::max_pending_wait in total
 *   5. decode, apply local state on a positive response
 *
 * Negative responses naming a different service are discarded as
 * uncorrelated. No automatic retries are performed (0x21 is returned).
 *
 * Usage:
 * @code
 *   ecudiag::Client client(transport);
 *   client.diagnostic_session_control(ecudiag::Session::ExtendedSession);
 *   auto vin = client.read_data_by_identifier(0xF190);
 *   if (vin.ok()) { ... vin.data ... }
 * @endcode
 */

#include "ecudiag/uds.hpp"
#include "ecudiag/codec.hpp"
#include "ecudiag/log.hpp"
#include "ecudiag/session.hpp"
#include <chrono>
#include <mutex>
#include <vector>

namespace ecudiag {

class Client {
public:
  explicit Client(Transport& t, ClientConfig config = {});

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  // Core exchange primitive. timeout 0 = P2.
  ServiceResponse transact(uint8_t sid, const Bytes& params,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
  ServiceResponse transact(SID sid, const Bytes& params,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) {
    return transact(to_byte(sid), params, timeout);
  }

  // --------- Diagnostic and communication management
  ServiceResponse diagnostic_session_control(Session s);
  ServiceResponse diagnostic_session_control(uint8_t session_type);
  ServiceResponse ecu_reset(EcuResetType type);
  ServiceResponse tester_present(bool suppress_response = false);

  /// SecurityAccess requestSeed (odd sub-function).
  ServiceResponse security_access_request_seed(uint8_t level);
  /// SecurityAccess sendKey (even sub-function, seed level + 1).
  ServiceResponse security_access_send_key(uint8_t level, const Bytes& key);

  ServiceResponse communication_control(uint8_t control_type, uint8_t communication_type);
  ServiceResponse communication_control(CommunicationControlType control_type,
                                        CommunicationType communication_type) {
    return communication_control(static_cast<uint8_t>(control_type),
                                 static_cast<uint8_t>(communication_type));
  }
  ServiceResponse authentication(uint8_t task, const Bytes& record = {});
  ServiceResponse access_timing_parameters(AccessTimingParametersType type, const Bytes& record = {});
  ServiceResponse secured_data_transmission(const Bytes& record);
  ServiceResponse control_dtc_setting(uint8_t setting_type, const Bytes& record = {});
  ServiceResponse control_dtc_setting(DTCSettingType setting_type, const Bytes& record = {}) {
    return control_dtc_setting(static_cast<uint8_t>(setting_type), record);
  }
  ServiceResponse response_on_event(uint8_t event_type, uint8_t window_time, const Bytes& record = {});
  ServiceResponse link_control(uint8_t type, const Bytes& record = {});
  ServiceResponse link_control(LinkControlType type, const Bytes& record = {}) {
    return link_control(static_cast<uint8_t>(type), record);
  }

  // --------- Data transmission
  ServiceResponse read_data_by_identifier(DID did);
  ServiceResponse read_data_by_identifier(const std::vector<DID>& dids);
  ServiceResponse read_memory_by_address(uint32_t address, uint32_t size,
                                         uint8_t addr_len = 4, uint8_t size_len = 4);
  ServiceResponse read_scaling_data_by_identifier(DID did);
  ServiceResponse read_data_by_periodic_identifier(PeriodicTransmissionMode mode,
                                                   const std::vector<PeriodicDID>& identifiers);
  ServiceResponse dynamically_define_by_identifier(DID dynamic_did,
                                                   const std::vector<DDDI_SourceByDID>& sources);
  ServiceResponse dynamically_define_by_memory_address(DID dynamic_did,
                                                       const std::vector<DDDI_SourceByMemory>& sources,
                                                       uint8_t addr_len = 4, uint8_t size_len = 4);
  ServiceResponse clear_dynamically_defined_identifier(DID dynamic_did);
  ServiceResponse write_data_by_identifier(DID did, const Bytes& data);
  ServiceResponse write_memory_by_address(uint32_t address, const Bytes& data,
                                          uint8_t addr_len = 4, uint8_t size_len = 4);

  // --------- Stored data transmission
  ServiceResponse clear_diagnostic_information(uint32_t group_of_dtc = 0xFFFFFF);
  ServiceResponse read_dtc_information(uint8_t sub_function, const Bytes& record = {});

  // --------- InputOutput / Routine
  ServiceResponse input_output_control_by_identifier(DID did, const Bytes& control_option,
                                                     const Bytes& enable_mask = {});
  ServiceResponse routine_control(RoutineAction action, RoutineId id, const Bytes& record = {});

  // --------- Upload / Download
  ServiceResponse request_download(uint32_t address, uint32_t size,
                                   uint8_t addr_len, uint8_t size_len,
                                   uint8_t data_format = 0x00);
  ServiceResponse request_upload(uint32_t address, uint32_t size,
                                 uint8_t addr_len, uint8_t size_len,
                                 uint8_t data_format = 0x00);
  ServiceResponse transfer_data(BlockCounter block, const Bytes& data);
  ServiceResponse request_transfer_exit(const Bytes& record = {});
  ServiceResponse request_file_transfer(FileTransferMode mode, const std::string& path,
                                        uint32_t file_size = 0, uint8_t data_format = 0x00);

  /// SIDs this client can issue.
  static std::vector<uint8_t> supported_services();

  // Accessors
  const ClientConfig& config() const { return config_; }
  Timings timings() const;
  void set_timings(const Timings& t);

  const SessionTracker& session() const { return session_; }
  const Logger& logger() const { return log_; }

  struct CommunicationState {
    bool rx_enabled{true};
    bool tx_enabled{true};
    uint8_t active_comm_type{0x01};
  };

  CommunicationState communication_state() const;
  bool is_dtc_setting_enabled() const;

private:
  ServiceResponse transact_locked(uint8_t sid, const Bytes& params,
                                  std::chrono::milliseconds timeout, bool suppressed);
  ServiceResponse address_request(SID sid, uint8_t prefix, bool with_prefix,
                                  uint32_t address, uint32_t size,
                                  uint8_t addr_len, uint8_t size_len,
                                  const Bytes& trailer);
  void drain_stale_locked();
  void apply_positive_locked(uint8_t sid, const Bytes& params, const ServiceResponse& rsp);
  void check_session_advisory(uint8_t sid) const;

  Transport& t_;
  ClientConfig config_;
  Logger log_;
  SessionTracker session_;

  // Guards the transport and everything below.
  mutable std::mutex tx_mutex_;
  Timings timings_{};
  CommunicationState comm_state_{};
  bool dtc_setting_enabled_{true};
  bool stale_response_expected_{false};
  std::chrono::steady_clock::time_point last_request_{};
};

} // namespace ecudiag

#endif // ECUDIAG_CLIENT_HPP
