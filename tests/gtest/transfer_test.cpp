/**
 * @file transfer_test.cpp
 * @brief Segmented download/upload controller (transfer.cpp)
 */

#include <gtest/gtest.h>
#include "ecudiag/client.hpp"
#include "ecudiag/transfer.hpp"
#include "scripted_transport.hpp"
#include <memory>

using namespace ecudiag;
using namespace ecudiag::transfer;
using ecudiag_test::ScriptedTransport;

namespace {

// ECU that accepts every transfer. maxNumberOfBlockLength is @p max_block.
ScriptedTransport::Responder accepting_ecu(uint16_t max_block) {
  return [max_block](const Bytes& req) -> std::vector<Bytes> {
    switch (req[0]) {
      case 0x34:
      case 0x35:
        return {{static_cast<uint8_t>(req[0] + 0x40), 0x20,
                 static_cast<uint8_t>(max_block >> 8), static_cast<uint8_t>(max_block)}};
      case 0x36:
        return {{0x76, req[1]}};
      case 0x37:
        return {{0x77}};
      default:
        return {};
    }
  };
}

} // namespace

class TransferTest : public ::testing::Test {
protected:
  void SetUp() override {
    ClientConfig cfg;
    cfg.log_sink = [](LogLevel, const std::string&) {};
    client_ = std::make_unique<Client>(transport_, cfg);
    controller_ = std::make_unique<TransferController>(*client_);
  }

  ScriptedTransport transport_;
  std::unique_ptr<Client> client_;
  std::unique_ptr<TransferController> controller_;
};

// ============================================================================
// Start
// ============================================================================

TEST_F(TransferTest, RequestDownloadEncodingAndBlockLength) {
  transport_.respond({0x74, 0x20, 0x01, 0x02});
  auto r = controller_->request_download(0x00001000, 0x0100, 4, 2);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(transport_.last_sent(),
            (Bytes{0x34, 0x00, 0x42, 0x00, 0x00, 0x10, 0x00, 0x01, 0x00}));

  ASSERT_TRUE(controller_->active());
  auto s = controller_->session();
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->direction, Direction::Download);
  EXPECT_EQ(s->address, 0x1000u);
  EXPECT_EQ(s->total_size, 0x100u);
  EXPECT_EQ(s->max_block_length, 258u);
  EXPECT_EQ(s->next_sequence, 1);
  EXPECT_EQ(s->bytes_remaining, 0x100u);
  EXPECT_EQ(controller_->max_chunk_size(), 256u);
}

TEST_F(TransferTest, RejectedDownloadLeavesControllerIdle) {
  transport_.respond({0x7F, 0x34, 0x70});
  auto r = controller_->request_download(0x1000, 0x100);
  EXPECT_EQ(r.status, TransferResult::Status::Negative);
  EXPECT_TRUE(r.response.has_nrc(nrc::Code::UploadDownloadNotAccepted));
  EXPECT_FALSE(controller_->active());
  EXPECT_EQ(controller_->max_chunk_size(), 0u);
}

TEST_F(TransferTest, InvalidAddressFormatIsRejectedLocally) {
  auto r = controller_->request_download(0x1000, 0x100, 5, 2);
  EXPECT_EQ(r.status, TransferResult::Status::InvalidFormat);
  EXPECT_EQ(transport_.sent_count(), 0u);

  r = controller_->request_upload(0x10000, 0x10, 2, 1);
  EXPECT_EQ(r.status, TransferResult::Status::InvalidFormat);
  EXPECT_EQ(transport_.sent_count(), 0u);
}

TEST_F(TransferTest, UnusableLengthFormatFromEcu) {
  transport_.respond({0x74, 0x50, 0x00, 0x00, 0x00, 0x00, 0x10});
  EXPECT_EQ(controller_->request_download(0x1000, 0x100).status,
            TransferResult::Status::InvalidFormat);
  EXPECT_FALSE(controller_->active());

  transport_.respond({0x74});
  EXPECT_EQ(controller_->request_download(0x1000, 0x100).status,
            TransferResult::Status::InvalidFormat);

  transport_.respond({0x74, 0x10, 0x02});
  EXPECT_EQ(controller_->request_download(0x1000, 0x100).status,
            TransferResult::Status::InvalidFormat);
}

TEST_F(TransferTest, SecondTransferWhileActiveIsRejected) {
  transport_.set_responder(accepting_ecu(0x102));
  ASSERT_TRUE(controller_->request_download(0x1000, 0x100).ok());
  auto r = controller_->request_upload(0x2000, 0x10);
  EXPECT_EQ(r.status, TransferResult::Status::AlreadyActive);
  EXPECT_EQ(transport_.sent_count(), 1u);
}

// ============================================================================
// TransferData
// ============================================================================

TEST_F(TransferTest, CompleteDownload) {
  transport_.set_responder(accepting_ecu(0x102));
  ASSERT_TRUE(controller_->request_download(0x1000, 512).ok());

  Bytes chunk(256, 0xA5);
  auto first = controller_->transfer_data(chunk);
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(transport_.last_sent()[1], 0x01);
  EXPECT_EQ(transport_.last_sent().size(), 258u);

  auto second = controller_->transfer_data(chunk);
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(transport_.last_sent()[1], 0x02);
  EXPECT_EQ(controller_->session()->bytes_remaining, 0u);
  EXPECT_EQ(controller_->session()->bytes_transferred(), 512u);

  auto exit = controller_->request_transfer_exit();
  ASSERT_TRUE(exit.ok());
  EXPECT_EQ(transport_.last_sent(), (Bytes{0x37}));
  EXPECT_FALSE(controller_->active());
}

TEST_F(TransferTest, CounterWrapsToZeroNotOne) {
  // max block 3 -> one data byte per TransferData
  transport_.set_responder(accepting_ecu(3));
  ASSERT_TRUE(controller_->request_download(0, 300, 4, 4).ok());
  ASSERT_EQ(controller_->max_chunk_size(), 1u);

  for (int i = 0; i < 300; ++i) {
    auto r = controller_->transfer_data({static_cast<uint8_t>(i)});
    ASSERT_TRUE(r.ok()) << "block " << i << ": " << status_name(r.status);
  }

  auto sent = transport_.sent();
  ASSERT_EQ(sent.size(), 301u);
  // sent[0] is RequestDownload, sent[n] carries the n-th block
  EXPECT_EQ(sent[1][1], 0x01);
  EXPECT_EQ(sent[255][1], 0xFF);
  EXPECT_EQ(sent[256][1], 0x00);
  EXPECT_EQ(sent[257][1], 0x01);
  EXPECT_EQ(sent[300][1], static_cast<uint8_t>(300 & 0xFF));
  EXPECT_EQ(controller_->session()->bytes_remaining, 0u);
}

TEST_F(TransferTest, EchoMismatchDesynchronizes) {
  transport_.respond({0x74, 0x20, 0x01, 0x02});
  transport_.respond({0x76, 0x05});
  ASSERT_TRUE(controller_->request_download(0x1000, 0x100).ok());

  auto r = controller_->transfer_data(Bytes(16, 0x00));
  EXPECT_EQ(r.status, TransferResult::Status::SequenceMismatch);
  EXPECT_TRUE(controller_->session()->desynchronized);

  auto next = controller_->transfer_data(Bytes(16, 0x00));
  EXPECT_EQ(next.status, TransferResult::Status::Desynchronized);
  EXPECT_EQ(transport_.sent_count(), 2u);
}

TEST_F(TransferTest, MissingEchoIsMismatch) {
  transport_.respond({0x74, 0x20, 0x01, 0x02});
  transport_.respond({0x76});
  ASSERT_TRUE(controller_->request_download(0x1000, 0x100).ok());
  EXPECT_EQ(controller_->transfer_data(Bytes(4, 0x00)).status,
            TransferResult::Status::SequenceMismatch);
}

TEST_F(TransferTest, WrongBlockSequenceCounterIsFatal) {
  transport_.respond({0x74, 0x20, 0x01, 0x02});
  transport_.respond({0x7F, 0x36, 0x73});
  transport_.respond({0x77});
  ASSERT_TRUE(controller_->request_download(0x1000, 0x100).ok());

  auto r = controller_->transfer_data(Bytes(16, 0x00));
  EXPECT_EQ(r.status, TransferResult::Status::Negative);
  EXPECT_TRUE(r.response.has_nrc(nrc::Code::WrongBlockSequenceCounter));

  EXPECT_EQ(controller_->transfer_data(Bytes(16, 0x00)).status,
            TransferResult::Status::Desynchronized);

  EXPECT_TRUE(controller_->request_transfer_exit().ok());
  EXPECT_FALSE(controller_->active());
}

TEST_F(TransferTest, OtherNegativeKeepsTransferUsable) {
  transport_.respond({0x74, 0x20, 0x01, 0x02});
  transport_.respond({0x7F, 0x36, 0x72});
  ASSERT_TRUE(controller_->request_download(0x1000, 0x100).ok());

  auto r = controller_->transfer_data(Bytes(16, 0x00));
  EXPECT_TRUE(r.response.has_nrc(nrc::Code::GeneralProgrammingFailure));
  EXPECT_FALSE(controller_->session()->desynchronized);
  EXPECT_EQ(controller_->session()->next_sequence, 1);
}

TEST_F(TransferTest, TimeoutLeavesCounterUnchanged) {
  transport_.respond({0x74, 0x20, 0x01, 0x02});
  transport_.respond_silence();
  transport_.respond({0x76, 0x01});
  ASSERT_TRUE(controller_->request_download(0x1000, 0x100).ok());

  auto r = controller_->transfer_data(Bytes(16, 0x00));
  EXPECT_EQ(r.status, TransferResult::Status::Timeout);
  EXPECT_EQ(controller_->session()->next_sequence, 1);
  EXPECT_EQ(controller_->session()->bytes_remaining, 0x100u);

  auto retry = controller_->transfer_data(Bytes(16, 0x00));
  ASSERT_TRUE(retry.ok());
  EXPECT_EQ(transport_.last_sent()[1], 0x01);
  EXPECT_EQ(controller_->session()->next_sequence, 2);
}

TEST_F(TransferTest, OversizedChunkRejectedLocally) {
  transport_.set_responder(accepting_ecu(0x102));
  ASSERT_TRUE(controller_->request_download(0x1000, 0x1000).ok());
  EXPECT_EQ(controller_->transfer_data(Bytes(257, 0x00)).status,
            TransferResult::Status::BlockTooLarge);
  EXPECT_EQ(transport_.sent_count(), 1u);
}

TEST_F(TransferTest, ChunkBeyondTotalSizeRejected) {
  transport_.set_responder(accepting_ecu(0x102));
  ASSERT_TRUE(controller_->request_download(0x1000, 4).ok());
  EXPECT_EQ(controller_->transfer_data(Bytes(5, 0x00)).status,
            TransferResult::Status::SizeExceeded);
  EXPECT_TRUE(controller_->transfer_data(Bytes(4, 0x00)).ok());
  EXPECT_EQ(controller_->transfer_data(Bytes(1, 0x00)).status,
            TransferResult::Status::SizeExceeded);
}

TEST_F(TransferTest, ExplicitBlockMustMatchExpected) {
  transport_.set_responder(accepting_ecu(0x102));
  ASSERT_TRUE(controller_->request_download(0x1000, 0x100).ok());

  auto r = controller_->transfer_data(0x02, Bytes(4, 0x00));
  EXPECT_EQ(r.status, TransferResult::Status::SequenceMismatch);
  EXPECT_FALSE(controller_->session()->desynchronized);
  EXPECT_EQ(transport_.sent_count(), 1u);

  EXPECT_TRUE(controller_->transfer_data(0x01, Bytes(4, 0x00)).ok());
}

TEST_F(TransferTest, OperationsWithoutTransferAreNotActive) {
  EXPECT_EQ(controller_->transfer_data(Bytes{0x01}).status, TransferResult::Status::NotActive);
  EXPECT_EQ(controller_->request_transfer_exit().status, TransferResult::Status::NotActive);
  EXPECT_EQ(controller_->abort().status, TransferResult::Status::NotActive);
  EXPECT_EQ(transport_.sent_count(), 0u);
}

// ============================================================================
// Upload
// ============================================================================

TEST_F(TransferTest, UploadAccountsResponseBytes) {
  transport_.respond({0x75, 0x10, 0x10});
  transport_.respond({0x76, 0x01, 0x0A, 0x0B, 0x0C, 0x0D});
  transport_.respond({0x76, 0x02, 0x0E, 0x0F});
  transport_.respond({0x77});

  auto start = controller_->request_upload(0x8000, 6, 2, 1);
  ASSERT_TRUE(start.ok());
  EXPECT_EQ(transport_.last_sent(), (Bytes{0x35, 0x00, 0x21, 0x80, 0x00, 0x06}));
  EXPECT_EQ(controller_->session()->direction, Direction::Upload);

  auto a = controller_->transfer_data();
  ASSERT_TRUE(a.ok());
  EXPECT_EQ(a.payload, (Bytes{0x0A, 0x0B, 0x0C, 0x0D}));
  EXPECT_EQ(transport_.last_sent(), (Bytes{0x36, 0x01}));
  EXPECT_EQ(controller_->session()->bytes_remaining, 2u);

  auto b = controller_->transfer_data();
  ASSERT_TRUE(b.ok());
  EXPECT_EQ(b.payload, (Bytes{0x0E, 0x0F}));
  EXPECT_EQ(controller_->session()->bytes_remaining, 0u);

  EXPECT_TRUE(controller_->request_transfer_exit().ok());
}

// ============================================================================
// Exit / abort
// ============================================================================

TEST_F(TransferTest, ExitReleasesSessionEvenWhenRejected) {
  transport_.respond({0x74, 0x20, 0x01, 0x02});
  transport_.respond({0x7F, 0x37, 0x24});
  ASSERT_TRUE(controller_->request_download(0x1000, 0x100).ok());

  auto r = controller_->request_transfer_exit({0xCA, 0xFE});
  EXPECT_EQ(r.status, TransferResult::Status::Negative);
  EXPECT_EQ(transport_.last_sent(), (Bytes{0x37, 0xCA, 0xFE}));
  EXPECT_FALSE(controller_->active());
}

TEST_F(TransferTest, AbortSendsTransferExit) {
  transport_.set_responder(accepting_ecu(0x102));
  ASSERT_TRUE(controller_->request_download(0x1000, 0x100).ok());
  ASSERT_TRUE(controller_->transfer_data(Bytes(16, 0x00)).ok());

  auto r = controller_->abort();
  EXPECT_TRUE(r.ok());
  EXPECT_EQ(transport_.last_sent(), (Bytes{0x37}));
  EXPECT_FALSE(controller_->active());

  // A fresh transfer can start afterwards, counter back at 1.
  ASSERT_TRUE(controller_->request_download(0x1000, 0x100).ok());
  EXPECT_EQ(controller_->session()->next_sequence, 1);
}

TEST(TransferParseTest, MaxBlockLength) {
  EXPECT_EQ(parse_max_block_length({0x20, 0x0F, 0xFA}).value_or(0), 0x0FFAu);
  EXPECT_EQ(parse_max_block_length({0x40, 0x00, 0x01, 0x00, 0x02}).value_or(0), 0x010002u);
  EXPECT_EQ(parse_max_block_length({0x10, 0x82}).value_or(0), 0x82u);
  EXPECT_FALSE(parse_max_block_length({}).has_value());
  EXPECT_FALSE(parse_max_block_length({0x00, 0x10}).has_value());
  EXPECT_FALSE(parse_max_block_length({0x20, 0x0F}).has_value());
}
