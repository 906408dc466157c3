/*
  Example: programming download with a background Tester Present

  Walks a simulated ECU through the usual flash sequence:
    programming session -> security access -> DTC setting off ->
    communication control -> erase routine (answers 0x78 first) ->
    RequestDownload / TransferData / RequestTransferExit -> ECU reset

  The KeepAlive thread holds the session open while the foreground thread
  works; both go through the same Client, one exchange at a time.
*/

#include "ecudiag/client.hpp"
#include "ecudiag/security.hpp"
#include "ecudiag/session.hpp"
#include "ecudiag/transfer.hpp"
#include <algorithm>
#include <deque>
#include <iostream>
#include <mutex>
#include <vector>

using ecudiag::Bytes;

// In-process ECU answering on the same thread that sends.
class SimulatedEcu : public ecudiag::Transport {
public:
  bool send(const Bytes& tx) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tx.empty()) return false;
    handle(tx);
    return true;
  }

  ecudiag::TransportStatus receive(Bytes& rx, std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outbox_.empty()) return ecudiag::TransportStatus::Timeout;
    rx = outbox_.front();
    outbox_.pop_front();
    return ecudiag::TransportStatus::Ok;
  }

  size_t bytes_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flash_.size();
  }

private:
  void positive(uint8_t sid, const Bytes& data) {
    outbox_.push_back(ecudiag::codec::encode_positive_response(sid, data));
  }
  void negative(uint8_t sid, ecudiag::nrc::Code code) {
    outbox_.push_back(ecudiag::codec::encode_negative_response(sid, code));
  }

  void handle(const Bytes& tx) {
    const uint8_t sid = tx[0];
    const uint8_t sub = tx.size() > 1 ? tx[1] : 0;
    switch (sid) {
      case 0x10:
        // P2 = 50ms, P2* = 5000ms
        positive(sid, {sub, 0x00, 0x32, 0x01, 0xF4});
        break;
      case 0x3E:
        if ((sub & 0x80) == 0) positive(sid, {0x00});
        break;
      case 0x27:
        if (sub == 0x01) {
          positive(sid, {0x01, 0x11, 0x22, 0x33, 0x44});
        } else if (sub == 0x02) {
          const Bytes expected{0x11 ^ 0xAA, 0x22 ^ 0xAA, 0x33 ^ 0xAA, 0x44 ^ 0xAA};
          if (Bytes(tx.begin() + 2, tx.end()) == expected) {
            positive(sid, {0x02});
          } else {
            negative(sid, ecudiag::nrc::Code::InvalidKey);
          }
        }
        break;
      case 0x85:
      case 0x28:
        positive(sid, {sub});
        break;
      case 0x31:
        // Erase takes a while
        negative(sid, ecudiag::nrc::Code::RequestCorrectlyReceivedResponsePending);
        positive(sid, Bytes(tx.begin() + 1, tx.end()));
        break;
      case 0x34:
        // maxNumberOfBlockLength = 0x0082 (128 data bytes per block)
        positive(sid, {0x20, 0x00, 0x82});
        break;
      case 0x36:
        flash_.insert(flash_.end(), tx.begin() + 2, tx.end());
        positive(sid, {tx[1]});
        break;
      case 0x37:
        positive(sid, {});
        break;
      case 0x11:
        positive(sid, {sub});
        break;
      default:
        negative(sid, ecudiag::nrc::Code::ServiceNotSupported);
        break;
    }
  }

  mutable std::mutex mutex_;
  std::deque<Bytes> outbox_;
  Bytes flash_;
};

static bool check(const char* step, const ecudiag::ServiceResponse& r) {
  if (r.ok()) {
    std::cout << "  ok   " << step << "\n";
    return true;
  }
  std::cerr << "  FAIL " << step << ": " << ecudiag::describe(r) << "\n";
  return false;
}

int main() {
  SimulatedEcu ecu;

  ecudiag::ClientConfig config;
  config.timings = ecudiag::Timings::programming();
  config.keep_alive_interval = std::chrono::milliseconds(20);
  config.log_sink = [](ecudiag::LogLevel level, const std::string& msg) {
    if (level != ecudiag::LogLevel::Debug) {
      std::cout << "  [" << ecudiag::Logger::level_name(level) << "] " << msg << "\n";
    }
  };

  ecudiag::Client client(ecu, config);
  ecudiag::KeepAlive keep_alive(client);

  std::cout << "=== Keep-alive download example ===\n";

  if (!check("DiagnosticSessionControl(programming)",
             client.diagnostic_session_control(ecudiag::Session::ProgrammingSession))) {
    return 1;
  }
  keep_alive.start();

  ecudiag::security::SecurityAccess security(client);
  ecudiag::security::FunctionSeedKey algo([](const Bytes& seed, uint8_t) {
    Bytes key(seed);
    for (auto& b : key) b = static_cast<uint8_t>(b ^ 0xAA);
    return key;
  });
  auto unlock = security.request(ecudiag::security::Level::Basic, algo);
  if (!unlock.ok()) {
    std::cerr << "  FAIL SecurityAccess: " << ecudiag::security::status_name(unlock.status) << "\n";
    return 1;
  }
  std::cout << "  ok   SecurityAccess level 0x01\n";

  if (!check("ControlDTCSetting(off)", client.control_dtc_setting(ecudiag::DTCSettingType::Off)) ||
      !check("CommunicationControl(disable rx/tx)",
             client.communication_control(ecudiag::CommunicationControlType::DisableRxAndTx,
                                          ecudiag::CommunicationType::NormalCommunicationMessages)) ||
      !check("RoutineControl(erase)",
             client.routine_control(ecudiag::RoutineAction::Start, 0xFF00,
                                    {0x00, 0x02, 0x00, 0x00, 0x00, 0x00, 0x04, 0x00}))) {
    return 1;
  }

  Bytes image(1000);
  for (size_t i = 0; i < image.size(); ++i) image[i] = static_cast<uint8_t>(i * 7);

  ecudiag::transfer::TransferController transfer(client);
  auto start = transfer.request_download(0x00020000, static_cast<uint32_t>(image.size()), 4, 4);
  if (!start.ok()) {
    std::cerr << "  FAIL RequestDownload: " << ecudiag::transfer::status_name(start.status) << "\n";
    return 1;
  }
  const uint32_t chunk = transfer.max_chunk_size();
  std::cout << "  ok   RequestDownload, " << chunk << " bytes per block\n";

  for (size_t offset = 0; offset < image.size(); offset += chunk) {
    const size_t n = std::min<size_t>(chunk, image.size() - offset);
    auto r = transfer.transfer_data(Bytes(image.begin() + offset, image.begin() + offset + n));
    if (!r.ok()) {
      std::cerr << "  FAIL TransferData at " << offset << ": "
                << ecudiag::transfer::status_name(r.status) << "\n";
      transfer.abort();
      return 1;
    }
  }
  if (!check("RequestTransferExit", transfer.request_transfer_exit().response)) {
    return 1;
  }

  keep_alive.stop();
  std::cout << "  Tester Present sent " << keep_alive.sent_count() << " times, "
            << keep_alive.failure_count() << " failures\n";

  check("ECUReset(hard)", client.ecu_reset(ecudiag::EcuResetType::HardReset));
  std::cout << "  ECU received " << ecu.bytes_written() << " of " << image.size() << " bytes\n";
  return ecu.bytes_written() == image.size() ? 0 : 1;
}
