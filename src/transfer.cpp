#include "ecudiag/transfer.hpp"
#include "ecudiag/client.hpp"
#include "ecudiag/log.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace ecudiag {
namespace transfer {

namespace {

// SID + blockSequenceCounter
constexpr uint32_t kTransferDataOverhead = 2;

TransferResult::Status status_from(const ServiceResponse& rsp) {
    switch (rsp.kind) {
        case Outcome::Positive: return TransferResult::Status::Ok;
        case Outcome::Negative: return TransferResult::Status::Negative;
        case Outcome::Timeout: return TransferResult::Status::Timeout;
        case Outcome::Malformed: return TransferResult::Status::Malformed;
        case Outcome::TransportError: return TransferResult::Status::TransportError;
    }
    return TransferResult::Status::Malformed;
}

TransferResult make_result(TransferResult::Status status, ServiceResponse rsp = {}) {
    TransferResult r;
    r.status = status;
    r.response = std::move(rsp);
    return r;
}

} // namespace

const char* status_name(TransferResult::Status status) {
    using S = TransferResult::Status;
    switch (status) {
        case S::Ok: return "Ok";
        case S::Negative: return "Negative";
        case S::Timeout: return "Timeout";
        case S::Malformed: return "Malformed";
        case S::TransportError: return "TransportError";
        case S::NotActive: return "NotActive";
        case S::AlreadyActive: return "AlreadyActive";
        case S::BlockTooLarge: return "BlockTooLarge";
        case S::SizeExceeded: return "SizeExceeded";
        case S::SequenceMismatch: return "SequenceMismatch";
        case S::Desynchronized: return "Desynchronized";
        case S::InvalidFormat: return "InvalidFormat";
    }
    return "Unknown";
}

std::optional<uint32_t> parse_max_block_length(const Bytes& data) {
    if (data.empty()) {
        return std::nullopt;
    }
    const uint8_t width = codec::split_format(data[0]).high;
    if (!codec::valid_field_width(width)) {
        return std::nullopt;
    }
    return codec::read_be(data, 1, width);
}

// ============================================================================
// TransferController Implementation
// ============================================================================

TransferController::TransferController(Client& client)
    : client_(client) {
}

bool TransferController::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.has_value();
}

std::optional<TransferSession> TransferController::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

uint32_t TransferController::max_chunk_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_ || session_->max_block_length <= kTransferDataOverhead) {
        return 0;
    }
    return session_->max_block_length - kTransferDataOverhead;
}

TransferResult TransferController::request_download(uint32_t address, uint32_t size,
                                                    uint8_t addr_len, uint8_t size_len,
                                                    uint8_t data_format) {
    return start(Direction::Download, address, size, addr_len, size_len, data_format);
}

TransferResult TransferController::request_upload(uint32_t address, uint32_t size,
                                                  uint8_t addr_len, uint8_t size_len,
                                                  uint8_t data_format) {
    return start(Direction::Upload, address, size, addr_len, size_len, data_format);
}

TransferResult TransferController::start(Direction direction, uint32_t address, uint32_t size,
                                         uint8_t addr_len, uint8_t size_len, uint8_t data_format) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Logger& log = client_.logger();

    if (session_) {
        log.warn("Transfer already active, finish it with RequestTransferExit first");
        return make_result(TransferResult::Status::AlreadyActive);
    }
    if (!codec::encode_address_and_size(address, size, addr_len, size_len)) {
        log.error("Invalid address/size format " + std::to_string(addr_len) + "/" +
                  std::to_string(size_len) + " for transfer request");
        return make_result(TransferResult::Status::InvalidFormat);
    }

    auto rsp = direction == Direction::Download
        ? client_.request_download(address, size, addr_len, size_len, data_format)
        : client_.request_upload(address, size, addr_len, size_len, data_format);
    if (!rsp.ok()) {
        return make_result(status_from(rsp), std::move(rsp));
    }

    auto max_block = parse_max_block_length(rsp.data);
    if (!max_block || *max_block <= kTransferDataOverhead) {
        log.error("Unusable maxNumberOfBlockLength in response: " + hex_dump(rsp.data));
        return make_result(TransferResult::Status::InvalidFormat, std::move(rsp));
    }

    TransferSession s;
    s.direction = direction;
    s.address = address;
    s.total_size = size;
    s.max_block_length = *max_block;
    s.next_sequence = 1;
    s.bytes_remaining = size;
    session_ = s;

    log.info(std::string(direction == Direction::Download ? "Download" : "Upload") +
             " started: " + std::to_string(size) + " bytes, max block " +
             std::to_string(*max_block));
    return make_result(TransferResult::Status::Ok, std::move(rsp));
}

TransferResult TransferController::transfer_data(const Bytes& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return make_result(TransferResult::Status::NotActive);
    }
    return send_block_locked(session_->next_sequence, chunk);
}

TransferResult TransferController::transfer_data(BlockCounter block, const Bytes& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return make_result(TransferResult::Status::NotActive);
    }
    if (block != session_->next_sequence) {
        client_.logger().warn("Block " + hex_byte(block) + " out of order, expected " +
                              hex_byte(session_->next_sequence));
        return make_result(TransferResult::Status::SequenceMismatch);
    }
    return send_block_locked(block, chunk);
}

TransferResult TransferController::send_block_locked(BlockCounter block, const Bytes& chunk) {
    TransferSession& s = *session_;
    const Logger& log = client_.logger();

    if (s.desynchronized) {
        return make_result(TransferResult::Status::Desynchronized);
    }
    if (chunk.size() + kTransferDataOverhead > s.max_block_length) {
        return make_result(TransferResult::Status::BlockTooLarge);
    }
    if (s.direction == Direction::Download && chunk.size() > s.bytes_remaining) {
        return make_result(TransferResult::Status::SizeExceeded);
    }

    auto rsp = client_.transfer_data(block, chunk);
    if (rsp.has_nrc(nrc::Code::WrongBlockSequenceCounter)) {
        s.desynchronized = true;
        log.error("ECU reported wrong block sequence counter at " + hex_byte(block) +
                  ", transfer must be restarted");
        return make_result(TransferResult::Status::Negative, std::move(rsp));
    }
    if (!rsp.ok()) {
        return make_result(status_from(rsp), std::move(rsp));
    }

    if (rsp.data.empty() || rsp.data[0] != block) {
        s.desynchronized = true;
        log.error("TransferData echo mismatch: sent " + hex_byte(block) + ", got " +
                  (rsp.data.empty() ? std::string("nothing") : hex_byte(rsp.data[0])));
        return make_result(TransferResult::Status::SequenceMismatch, std::move(rsp));
    }

    TransferResult r = make_result(TransferResult::Status::Ok);
    r.payload.assign(rsp.data.begin() + 1, rsp.data.end());

    uint32_t consumed = static_cast<uint32_t>(
        s.direction == Direction::Download ? chunk.size() : r.payload.size());
    if (consumed > s.bytes_remaining) {
        log.warn("Upload returned " + std::to_string(consumed) + " bytes, only " +
                 std::to_string(s.bytes_remaining) + " expected");
        consumed = s.bytes_remaining;
    }
    s.bytes_remaining -= consumed;
    s.next_sequence = static_cast<BlockCounter>((block + 1) & 0xFF);

    r.response = std::move(rsp);
    return r;
}

TransferResult TransferController::request_transfer_exit(const Bytes& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return make_result(TransferResult::Status::NotActive);
    }
    return exit_locked(record);
}

TransferResult TransferController::abort() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return make_result(TransferResult::Status::NotActive);
    }
    client_.logger().warn("Aborting transfer at block " + hex_byte(session_->next_sequence));
    return exit_locked({});
}

TransferResult TransferController::exit_locked(const Bytes& record) {
    if (session_->bytes_remaining > 0) {
        client_.logger().info("Transfer exit with " + std::to_string(session_->bytes_remaining) +
                              " bytes outstanding");
    }

    auto rsp = client_.request_transfer_exit(record);
    session_.reset();

    if (rsp.ok()) {
        client_.logger().info("Transfer exited");
    }
    return make_result(status_from(rsp), std::move(rsp));
}

} // namespace transfer
} // namespace ecudiag
