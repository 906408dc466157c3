#pragma once
/**
 * @file transfer.hpp
 * @brief Segmented transfer - ISO 14229-1:2013 Section 14
 *
 * RequestDownload (0x34) - Section 14.2 (p. 270):
 *   Request Format:
 *     [0x34] [dataFormatIdentifier] [addressAndLengthFormatIdentifier]
 *            [memoryAddress...] [memorySize...]
 *   Response Format:
 *     [0x74] [lengthFormatIdentifier] [maxNumberOfBlockLength...]
 *
 *   lengthFormatIdentifier bits 7-4 give the byte count of
 *   maxNumberOfBlockLength (1..4 here). maxNumberOfBlockLength covers the
 *   complete TransferData request, SID and counter included.
 *
 * RequestUpload (0x35) - Section 14.3 (p. 275):
 *   Same format as RequestDownload
 *
 * TransferData (0x36) - Section 14.4 (p. 280):
 *   Request Format:
 *     [0x36] [blockSequenceCounter] [transferRequestParameterRecord...]
 *   Response Format:
 *     [0x76] [blockSequenceCounter] [transferResponseParameterRecord...]
 *
 *   blockSequenceCounter:
 *     - Starts at 0x01 for first block
 *     - Wraps from 0xFF to 0x00 (not 0x01!)
 *
 * RequestTransferExit (0x37) - Section 14.5 (p. 285):
 *   [0x37] [transferRequestParameterRecord...]
 *
 * A wrongBlockSequenceCounter (0x73) ends the transfer. There is no resync:
 * send RequestTransferExit and start over.
 */

#include "ecudiag/uds.hpp"
#include "ecudiag/codec.hpp"
#include <cstdint>
#include <mutex>
#include <optional>

namespace ecudiag {

class Client;

namespace transfer {

enum class Direction : uint8_t {
    Download,   ///< tester -> ECU (0x34)
    Upload      ///< ECU -> tester (0x35)
};

struct TransferSession {
    Direction direction{Direction::Download};
    uint32_t address{0};
    uint32_t total_size{0};
    uint32_t max_block_length{0};     ///< from the ECU, includes SID + counter
    BlockCounter next_sequence{1};
    uint32_t bytes_remaining{0};
    bool desynchronized{false};

    uint32_t bytes_transferred() const { return total_size - bytes_remaining; }
};

struct TransferResult {
    enum class Status : uint8_t {
        Ok,
        Negative,           ///< ECU rejected, see response.nrc
        Timeout,            ///< counter unchanged, same block may be resent
        Malformed,
        TransportError,
        NotActive,          ///< no transfer in progress
        AlreadyActive,      ///< a transfer is already running
        BlockTooLarge,      ///< chunk exceeds max_chunk_size()
        SizeExceeded,       ///< chunk exceeds the bytes still expected
        SequenceMismatch,   ///< counter not the expected one, or not echoed
        Desynchronized,     ///< earlier mismatch or 0x73, exit required
        InvalidFormat       ///< bad address/length format, locally or from the ECU
    };

    Status status{Status::NotActive};
    ServiceResponse response{};   ///< last exchange, empty when nothing was sent
    Bytes payload;                ///< TransferData response record after the counter

    bool ok() const { return status == Status::Ok; }
};

const char* status_name(TransferResult::Status status);

/**
 * Drives one download or upload sequence over a Client.
 *
 * Chunking is left to the caller: each transfer_data() call is one
 * TransferData request and must fit within max_chunk_size().
 */
class TransferController {
public:
    explicit TransferController(Client& client);

    TransferResult request_download(uint32_t address, uint32_t size,
                                    uint8_t addr_len = 4, uint8_t size_len = 4,
                                    uint8_t data_format = 0x00);
    TransferResult request_upload(uint32_t address, uint32_t size,
                                  uint8_t addr_len = 4, uint8_t size_len = 4,
                                  uint8_t data_format = 0x00);

    /// Next block using the tracked counter.
    TransferResult transfer_data(const Bytes& chunk = {});

    /// Block with an explicit counter, which must equal the expected one.
    TransferResult transfer_data(BlockCounter block, const Bytes& chunk);

    /// Ends the transfer. The local session is released whatever the outcome.
    TransferResult request_transfer_exit(const Bytes& record = {});

    /// Failure path: transfer exit if a transfer is active.
    TransferResult abort();

    bool active() const;
    std::optional<TransferSession> session() const;

    /// Largest chunk per TransferData request, 0 when idle.
    uint32_t max_chunk_size() const;

private:
    TransferResult start(Direction direction, uint32_t address, uint32_t size,
                         uint8_t addr_len, uint8_t size_len, uint8_t data_format);
    TransferResult send_block_locked(BlockCounter block, const Bytes& chunk);
    TransferResult exit_locked(const Bytes& record);

    Client& client_;
    mutable std::mutex mutex_;
    std::optional<TransferSession> session_;
};

/// Parses [lengthFormatIdentifier][maxNumberOfBlockLength...]; nullopt if malformed.
std::optional<uint32_t> parse_max_block_length(const Bytes& data);

} // namespace transfer
} // namespace ecudiag
