/**************************************************************************/
/*                                                                        */
/*                   zlink - terminal file transfer engine                */
/*             Copyright (C)2025-2026, zlink developers                   */
/*                                                                        */
/*    Licensed  under the  Apache License, Version  2.0 (the "License");  */
/*    you may not use this  file  except in compliance with the License.  */
/*    You may obtain a copy of the License at                             */
/*                                                                        */
/*                http://www.apache.org/licenses/LICENSE-2.0              */
/*                                                                        */
/*    Unless  required  by  applicable  law  or agreed to  in  writing,   */
/*    software  distributed  under  the  License  is  distributed on an   */
/*    "AS IS"  BASIS, WITHOUT  WARRANTIES  OR  CONDITIONS OF ANY  KIND,   */
/*    either  express  or implied.  See  the  License for  the specific   */
/*    language governing permissions and limitations under the License.   */
/**************************************************************************/
#include "gtest/gtest.h"
#include "zmodem/file_header.h"
#include "zmodem/frame.h"
#include "zmodem/frame_codec.h"
#include "zmodem/protocol_engine.h"
#include "zmodem/session_registry.h"
#include "zmodem/transfer_error.h"
#include "zmodem/transfer_file.h"
#include "zmodem_test/fakes.h"

#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace zlink::zmodem;

static std::string RandomContents(size_t size, unsigned seed = 1) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::string s;
  s.reserve(size);
  for (size_t i = 0; i < size; i++) {
    s.push_back(static_cast<char>(dist(gen)));
  }
  return s;
}

class ProtocolEngineTest : public testing::Test {
protected:
  ProtocolEngineTest() { config_.chunk_size = 1024; }

  std::unique_ptr<ProtocolEngine> Upload(const std::string& name, const std::string& contents) {
    auto file = std::make_unique<InMemoryTransferFile>(name, contents);
    upload_file_ = file.get();
    return ProtocolEngine::ForUpload(std::move(file), config_);
  }

  std::unique_ptr<ProtocolEngine> Download() {
    auto file = std::make_unique<InMemoryTransferFile>("download");
    download_file_ = file.get();
    return ProtocolEngine::ForDownload(std::move(file), config_);
  }

  /** A download that has already accepted a ZFILE for name. */
  std::unique_ptr<ProtocolEngine> DownloadReceivingData(const std::string& name, int64_t size) {
    auto e = Download();
    e->Pull(4096);
    auto f = MakeFrame(FrameType::ZFILE);
    f.payload = BuildFileHeaderPayload(name, size);
    f.end_marker = ZCRCW;
    e->Feed(EncodeFrame(f));
    e->Pull(4096);
    return e;
  }

  ZmodemConfig config_;
  InMemoryTransferFile* upload_file_{nullptr};
  InMemoryTransferFile* download_file_{nullptr};
};

TEST_F(ProtocolEngineTest, DownloadStartsWithZrinit) {
  auto e = Download();
  EXPECT_EQ(TransferDirection::download, e->direction());
  EXPECT_EQ(TransferState::ReceivingHeader, e->state());
  ASSERT_TRUE(e->has_output());
  const auto frames = DecodeAll(e->Pull(4096));
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(FrameType::ZRINIT, frames[0].type);
  EXPECT_TRUE(frames[0].flags & CANFC32);
  EXPECT_TRUE(frames[0].flags & CANFDX);
  EXPECT_FALSE(e->has_output());
}

TEST_F(ProtocolEngineTest, UploadStartsWithZfile) {
  auto e = Upload("hello.txt", "Hello World");
  EXPECT_EQ(TransferState::SendingHeader, e->state());
  EXPECT_EQ("hello.txt", e->filename());
  EXPECT_EQ(11, e->file_size().value());
  const auto frames = DecodeAll(e->Pull(4096));
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(FrameType::ZFILE, frames[0].type);
  EXPECT_EQ(ZCRCW, frames[0].end_marker);
  const auto h = ParseFileHeader(frames[0].payload);
  ASSERT_TRUE(h.has_value());
  EXPECT_EQ("hello.txt", h->filename);
  EXPECT_EQ(11, h->size.value());
}

TEST_F(ProtocolEngineTest, Loopback) {
  const auto contents = RandomContents(10 * 1024 + 17);
  auto up = Upload("random.bin", contents);
  auto down = Download();

  Pump(*up, *down);

  EXPECT_EQ(TransferState::Completed, up->state());
  EXPECT_EQ(TransferState::Completed, down->state());
  EXPECT_FALSE(up->last_error().has_value());
  EXPECT_FALSE(down->last_error().has_value());
  EXPECT_EQ("random.bin", down->filename());
  EXPECT_EQ(contents.size(), download_file_->contents().size());
  EXPECT_EQ(contents, download_file_->contents());
  EXPECT_EQ(static_cast<int64_t>(contents.size()), up->transferred());
  EXPECT_EQ(static_cast<int64_t>(contents.size()), down->transferred());
  EXPECT_GE(download_file_->flush_count(), 1);

  const auto snapshot = MakeSnapshot(1, "test", *down);
  EXPECT_EQ(100, snapshot.percent);
  EXPECT_EQ(static_cast<int64_t>(contents.size()), snapshot.total.value());
}

TEST_F(ProtocolEngineTest, Loopback_Bin16) {
  config_.use_crc32 = false;
  config_.chunk_size = 100;
  const auto contents = RandomContents(1000, 7);
  auto up = Upload("crc16.bin", contents);
  auto down = Download();

  const auto zrinit = DecodeAll(down->Pull(4096));
  ASSERT_EQ(1u, zrinit.size());
  EXPECT_EQ(FrameEncoding::bin16, zrinit[0].encoding);
  EXPECT_FALSE(zrinit[0].flags & CANFC32);
  up->Feed(EncodeFrame(zrinit[0]));

  Pump(*up, *down);
  EXPECT_EQ(TransferState::Completed, down->state());
  EXPECT_EQ(contents, download_file_->contents());
}

TEST_F(ProtocolEngineTest, TransferredNeverDecreases) {
  config_.chunk_size = 256;
  const auto contents = RandomContents(4000, 3);
  auto up = Upload("mono.bin", contents);
  auto down = Download();

  int64_t last_up = 0;
  int64_t last_down = 0;
  for (auto round = 0; round < 1000; round++) {
    const auto a = up->Pull(512);
    const auto b = down->Pull(512);
    if (a.empty() && b.empty()) {
      break;
    }
    down->Feed(a);
    up->Feed(b);
    if (round == 5) {
      // Make the sender go back to the start.
      up->Feed(EncodeHeader(FrameType::ZRPOS, 0));
    }
    EXPECT_GE(up->transferred(), last_up);
    EXPECT_GE(down->transferred(), last_down);
    last_up = up->transferred();
    last_down = down->transferred();
  }
  EXPECT_EQ(TransferState::Completed, down->state());
  EXPECT_EQ(static_cast<int64_t>(contents.size()), down->transferred());
  EXPECT_EQ(contents, download_file_->contents());
}

TEST_F(ProtocolEngineTest, ZeroByteUpload) {
  auto up = Upload("empty.txt", "");
  EXPECT_EQ(0, up->file_size().value());
  up->Pull(4096);
  up->Feed(EncodeHeader(FrameType::ZRINIT, CANFDX | CANFC32));
  EXPECT_EQ(TransferState::SendingEof, up->state());
  const auto frames = DecodeAll(up->Pull(4096));
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(FrameType::ZEOF, frames[0].type);
  EXPECT_EQ(0u, frames[0].flags);

  up->Feed(EncodeHeader(FrameType::ZRINIT, CANFDX | CANFC32));
  EXPECT_EQ(TransferState::Completed, up->state());
  const auto fin = DecodeAll(up->Pull(4096));
  ASSERT_EQ(1u, fin.size());
  EXPECT_EQ(FrameType::ZFIN, fin[0].type);
}

TEST_F(ProtocolEngineTest, ZeroByteLoopback) {
  auto up = Upload("empty.txt", "");
  auto down = Download();
  Pump(*up, *down);
  EXPECT_EQ(TransferState::Completed, up->state());
  EXPECT_EQ(TransferState::Completed, down->state());
  EXPECT_TRUE(download_file_->contents().empty());
  EXPECT_EQ(100, MakeSnapshot(1, "test", *down).percent);
}

TEST_F(ProtocolEngineTest, UploadChunks) {
  config_.chunk_size = 4;
  auto up = Upload("abc.txt", "0123456789");
  up->Pull(4096);
  up->Feed(EncodeHeader(FrameType::ZRPOS, 0));
  EXPECT_EQ(TransferState::SendingData, up->state());

  std::vector<Frame> frames;
  while (up->has_output()) {
    for (const auto& f : DecodeAll(up->Pull(4096))) {
      frames.push_back(f);
    }
  }
  ASSERT_EQ(3u, frames.size());
  EXPECT_EQ(0u, frames[0].flags);
  EXPECT_EQ("0123", frames[0].payload);
  EXPECT_EQ(ZCRCG, frames[0].end_marker);
  EXPECT_EQ(4u, frames[1].flags);
  EXPECT_EQ(8u, frames[2].flags);
  EXPECT_EQ("89", frames[2].payload);
  EXPECT_EQ(ZCRCW, frames[2].end_marker);
  EXPECT_EQ(10, up->transferred());

  // An ack for less than the whole file is not the final ack.
  up->Feed(EncodeHeader(FrameType::ZACK, 4));
  EXPECT_EQ(TransferState::SendingData, up->state());
  up->Feed(EncodeHeader(FrameType::ZACK, 10));
  EXPECT_EQ(TransferState::SendingEof, up->state());
  const auto eof = DecodeAll(up->Pull(4096));
  ASSERT_EQ(1u, eof.size());
  EXPECT_EQ(FrameType::ZEOF, eof[0].type);
  EXPECT_EQ(10u, eof[0].flags);
}

TEST_F(ProtocolEngineTest, RposRewindsUpload) {
  config_.chunk_size = 4;
  auto up = Upload("abc.txt", "0123456789");
  up->Pull(4096);
  up->Feed(EncodeHeader(FrameType::ZRINIT));
  ASSERT_EQ(TransferState::SendingData, up->state());
  up->Pull(4096);
  up->Pull(4096);
  EXPECT_EQ(8, up->transferred());

  up->Feed(EncodeHeader(FrameType::ZRPOS, 4));
  const auto frames = DecodeAll(up->Pull(4096));
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(FrameType::ZDATA, frames[0].type);
  EXPECT_EQ(4u, frames[0].flags);
  EXPECT_EQ("4567", frames[0].payload);
  EXPECT_EQ(8, up->transferred());
}

TEST_F(ProtocolEngineTest, RposPastEndOfFile) {
  config_.chunk_size = 4;
  auto up = Upload("abc.txt", "0123456789");
  up->Pull(4096);
  up->Feed(EncodeHeader(FrameType::ZRINIT));
  up->Feed(EncodeHeader(FrameType::ZRPOS, 1000));
  const auto frames = DecodeAll(up->Pull(4096));
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(FrameType::ZEOF, frames[0].type);
  EXPECT_EQ(10u, frames[0].flags);
  EXPECT_EQ(TransferState::SendingEof, up->state());
}

TEST_F(ProtocolEngineTest, RposDuringEof) {
  config_.chunk_size = 4;
  auto up = Upload("abc.txt", "0123456789");
  up->Pull(4096);
  up->Feed(EncodeHeader(FrameType::ZRINIT));
  while (up->has_output()) {
    up->Pull(4096);
  }
  up->Feed(EncodeHeader(FrameType::ZACK, 10));
  ASSERT_EQ(TransferState::SendingEof, up->state());
  up->Feed(EncodeHeader(FrameType::ZRPOS, 8));
  EXPECT_EQ(TransferState::SendingData, up->state());
  const auto frames = DecodeAll(up->Pull(4096));
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(8u, frames[0].flags);
  EXPECT_EQ("89", frames[0].payload);
}

TEST_F(ProtocolEngineTest, DownloadWritesData) {
  auto down = DownloadReceivingData("foo.txt", 8);
  EXPECT_EQ(TransferState::ReceivingData, down->state());
  EXPECT_EQ("foo.txt", down->filename());
  EXPECT_EQ(8, down->file_size().value());

  down->Feed(EncodeData(0, "abcd"));
  auto frames = DecodeAll(down->Pull(4096));
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(FrameType::ZACK, frames[0].type);
  EXPECT_EQ(4u, frames[0].flags);
  EXPECT_EQ(50, MakeSnapshot(1, "test", *down).percent);

  down->Feed(EncodeData(4, "efgh", ZCRCE) + EncodeHeader(FrameType::ZEOF, 8));
  EXPECT_EQ(TransferState::Completed, down->state());
  EXPECT_EQ("abcdefgh", download_file_->contents());
  frames = DecodeAll(down->Pull(4096));
  ASSERT_EQ(3u, frames.size());
  EXPECT_EQ(FrameType::ZACK, frames[0].type);
  EXPECT_EQ(FrameType::ZACK, frames[1].type);
  EXPECT_EQ(8u, frames[1].flags);
  EXPECT_EQ(FrameType::ZFIN, frames[2].type);
}

TEST_F(ProtocolEngineTest, OutOfOrderDataSendsOneRpos) {
  auto down = DownloadReceivingData("foo.txt", 100);
  down->Feed(EncodeData(10, "late"));
  down->Feed(EncodeData(14, "more"));
  auto frames = DecodeAll(down->Pull(4096));
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(FrameType::ZRPOS, frames[0].type);
  EXPECT_EQ(0u, frames[0].flags);
  EXPECT_TRUE(download_file_->contents().empty());

  down->Feed(EncodeData(0, "0123456789"));
  frames = DecodeAll(down->Pull(4096));
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(FrameType::ZACK, frames[0].type);
  EXPECT_EQ(10u, frames[0].flags);

  // A new episode gets its own ZRPOS.
  down->Feed(EncodeData(50, "gap"));
  frames = DecodeAll(down->Pull(4096));
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(FrameType::ZRPOS, frames[0].type);
  EXPECT_EQ(10u, frames[0].flags);
}

TEST_F(ProtocolEngineTest, EofAtWrongOffset) {
  auto down = DownloadReceivingData("foo.txt", 8);
  down->Feed(EncodeData(0, "abcd"));
  down->Pull(4096);
  down->Feed(EncodeHeader(FrameType::ZEOF, 8));
  EXPECT_EQ(TransferState::ReceivingData, down->state());
  const auto frames = DecodeAll(down->Pull(4096));
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(FrameType::ZRPOS, frames[0].type);
  EXPECT_EQ(4u, frames[0].flags);
}

TEST_F(ProtocolEngineTest, RepeatedZrqinit) {
  auto down = Download();
  down->Pull(4096);
  down->Feed(EncodeHeader(FrameType::ZRQINIT, 0, FrameEncoding::hex));
  const auto frames = DecodeAll(down->Pull(4096));
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(FrameType::ZRINIT, frames[0].type);
}

TEST_F(ProtocolEngineTest, Zsinit) {
  auto down = Download();
  down->Pull(4096);
  auto f = MakeFrame(FrameType::ZSINIT);
  f.payload = std::string(1, '\0');
  down->Feed(EncodeFrame(f));
  const auto frames = DecodeAll(down->Pull(4096));
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(FrameType::ZACK, frames[0].type);
  EXPECT_EQ(TransferState::ReceivingHeader, down->state());
}

TEST_F(ProtocolEngineTest, RepeatedZfile) {
  auto down = DownloadReceivingData("foo.txt", 8);
  down->Feed(EncodeData(0, "abc"));
  down->Pull(4096);
  auto f = MakeFrame(FrameType::ZFILE);
  f.payload = BuildFileHeaderPayload("foo.txt", 8);
  down->Feed(EncodeFrame(f));
  const auto frames = DecodeAll(down->Pull(4096));
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(FrameType::ZACK, frames[0].type);
  EXPECT_EQ(3u, frames[0].flags);
  EXPECT_EQ("abc", download_file_->contents());
}

TEST_F(ProtocolEngineTest, MalformedZfileIgnored) {
  auto down = Download();
  down->Pull(4096);
  auto f = MakeFrame(FrameType::ZFILE);
  f.payload = "no terminator";
  down->Feed(EncodeFrame(f));
  EXPECT_EQ(TransferState::ReceivingHeader, down->state());
  EXPECT_FALSE(down->has_output());
  EXPECT_FALSE(down->last_error().has_value());
}

TEST_F(ProtocolEngineTest, ResyncAfterGarbage) {
  auto down = Download();
  down->Pull(4096);

  std::mt19937 gen(42);
  std::uniform_int_distribution<int> dist(0, 255);
  std::string garbage;
  while (garbage.size() < 20) {
    const auto c = static_cast<uint8_t>(dist(gen));
    if (c != ZPAD && c != CAN) {
      garbage.push_back(static_cast<char>(c));
    }
  }
  auto corrupt = EncodeHeader(FrameType::ZRQINIT);
  corrupt[corrupt.size() - 1] ^= 0x20;

  auto f = MakeFrame(FrameType::ZFILE);
  f.payload = BuildFileHeaderPayload("after.bin", 3);
  down->Feed(garbage + corrupt + EncodeFrame(f));
  EXPECT_EQ(TransferState::ReceivingData, down->state());
  EXPECT_EQ(1, down->malformed_frames());
  EXPECT_EQ("after.bin", down->filename());

  down->Feed(EncodeData(0, "xyz") + EncodeHeader(FrameType::ZEOF, 3));
  EXPECT_EQ(TransferState::Completed, down->state());
  EXPECT_EQ("xyz", download_file_->contents());
}

TEST_F(ProtocolEngineTest, FrameSplitIntoSingleBytes) {
  auto down = DownloadReceivingData("foo.txt", 300);
  const auto data = RandomContents(300, 11);
  const auto wire = EncodeData(0, data, ZCRCW);
  for (const auto c : wire) {
    down->Feed(std::string(1, c));
  }
  EXPECT_EQ(data, download_file_->contents());
  EXPECT_EQ(300, down->transferred());
}

TEST_F(ProtocolEngineTest, PeerCancel) {
  auto down = DownloadReceivingData("foo.txt", 8);
  std::string cancel(5, static_cast<char>(CAN));
  cancel.append(3, static_cast<char>(BACKSPACE));
  const auto rest = down->Feed(cancel + "$ prompt");
  EXPECT_EQ("$ prompt", rest);
  EXPECT_EQ(TransferState::Failed, down->state());
  ASSERT_TRUE(down->last_error().has_value());
  EXPECT_EQ(TransferErrorKind::peer_abort, down->last_error()->kind);
  EXPECT_FALSE(down->has_output());
}

TEST_F(ProtocolEngineTest, PeerCancel_SplitAcrossFeeds) {
  auto up = Upload("abc.txt", "0123456789");
  const std::string can(1, static_cast<char>(CAN));
  for (auto i = 0; i < kCancelCount - 1; i++) {
    up->Feed(can);
    EXPECT_FALSE(up->finished());
  }
  up->Feed(can);
  EXPECT_EQ(TransferState::Failed, up->state());
}

TEST_F(ProtocolEngineTest, FewerCansAreNotACancel) {
  auto down = DownloadReceivingData("foo.txt", 8);
  down->Feed(std::string(kCancelCount - 1, static_cast<char>(CAN)) + "x");
  EXPECT_EQ(TransferState::ReceivingData, down->state());
  down->Feed(EncodeData(0, "abcd"));
  EXPECT_EQ("abcd", download_file_->contents());
}

TEST_F(ProtocolEngineTest, ZskipDuringUpload) {
  auto up = Upload("abc.txt", "0123456789");
  up->Pull(4096);
  up->Feed(EncodeHeader(FrameType::ZSKIP));
  EXPECT_EQ(TransferState::Failed, up->state());
  EXPECT_EQ(TransferErrorKind::peer_abort, up->last_error()->kind);
}

TEST_F(ProtocolEngineTest, Znak) {
  auto up = Upload("abc.txt", "0123456789");
  up->Feed(EncodeHeader(FrameType::ZNAK));
  EXPECT_EQ(TransferState::Failed, up->state());
  EXPECT_EQ(TransferErrorKind::peer_nak, up->last_error()->kind);
}

TEST_F(ProtocolEngineTest, Zabort) {
  auto down = DownloadReceivingData("foo.txt", 8);
  down->Feed(EncodeHeader(FrameType::ZABORT));
  EXPECT_EQ(TransferState::Failed, down->state());
  EXPECT_EQ(TransferErrorKind::peer_abort, down->last_error()->kind);
}

TEST_F(ProtocolEngineTest, Zferr) {
  auto up = Upload("abc.txt", "0123456789");
  up->Feed(EncodeHeader(FrameType::ZRINIT) + EncodeHeader(FrameType::ZFERR));
  EXPECT_EQ(TransferState::Failed, up->state());
  EXPECT_EQ(TransferErrorKind::peer_abort, up->last_error()->kind);
}

TEST_F(ProtocolEngineTest, WriteFailure) {
  auto down = DownloadReceivingData("foo.txt", 8);
  download_file_->set_fail_writes(true);
  down->Feed(EncodeData(0, "abcd"));
  EXPECT_EQ(TransferState::Failed, down->state());
  ASSERT_TRUE(down->last_error().has_value());
  EXPECT_EQ(TransferErrorKind::file_io, down->last_error()->kind);
  EXPECT_EQ(CancelSequence(), down->Pull(4096));
}

TEST_F(ProtocolEngineTest, ReadFailure) {
  class ShortFile : public TransferFile {
  public:
    ShortFile() : TransferFile("short.bin") {}
    int64_t file_size() const override { return 100; }
    bool GetChunk(char*, int64_t, int) override {
      last_error_ = "I/O error";
      return false;
    }
    bool WriteChunk(const char*, int) override { return false; }
    bool Flush() override { return true; }
    bool Close() override { return true; }
  };
  auto up = ProtocolEngine::ForUpload(std::make_unique<ShortFile>(), config_);
  up->Pull(4096);
  up->Feed(EncodeHeader(FrameType::ZRINIT));
  EXPECT_EQ(CancelSequence(), up->Pull(4096));
  EXPECT_EQ(TransferState::Failed, up->state());
  EXPECT_EQ(TransferErrorKind::file_io, up->last_error()->kind);
}

TEST_F(ProtocolEngineTest, FactoryThrows) {
  auto down = ProtocolEngine::ForDownload(
      [](const FileHeader&) -> std::unique_ptr<TransferFile> {
        throw transfer_error(TransferErrorKind::file_io, "disk full");
      },
      config_);
  down->Pull(4096);
  auto f = MakeFrame(FrameType::ZFILE);
  f.payload = BuildFileHeaderPayload("foo.txt", 8);
  down->Feed(EncodeFrame(f));
  EXPECT_EQ(TransferState::Failed, down->state());
  EXPECT_EQ(TransferErrorKind::file_io, down->last_error()->kind);
  EXPECT_NE(std::string::npos, down->last_error()->message.find("disk full"));
}

TEST_F(ProtocolEngineTest, FactoryNamesFile) {
  std::string requested;
  InMemoryTransferFile* created = nullptr;
  auto down = ProtocolEngine::ForDownload(
      [&](const FileHeader& h) -> std::unique_ptr<TransferFile> {
        requested = h.filename;
        auto file = std::make_unique<InMemoryTransferFile>(h.filename);
        created = file.get();
        return file;
      },
      config_);
  auto up = Upload("named.txt", "contents");
  Pump(*up, *down);
  EXPECT_EQ("named.txt", requested);
  ASSERT_NE(nullptr, created);
  EXPECT_EQ("contents", created->contents());
}

TEST_F(ProtocolEngineTest, LocalAbort) {
  auto up = Upload("abc.txt", "0123456789");
  up->Abort(TransferErrorKind::peer_abort, "cancelled locally");
  EXPECT_EQ(TransferState::Failed, up->state());
  EXPECT_EQ("cancelled locally", up->last_error()->message);
  EXPECT_EQ(CancelSequence(), up->Pull(4096));

  up->Abort(TransferErrorKind::transport_closed, "again");
  EXPECT_EQ("cancelled locally", up->last_error()->message);
  EXPECT_FALSE(up->has_output());
}

TEST_F(ProtocolEngineTest, FeedAfterFinished) {
  auto up = Upload("abc.txt", "0123456789");
  up->Abort(TransferErrorKind::peer_abort, "cancelled locally");
  EXPECT_EQ("login: ", up->Feed("login: "));
}

TEST_F(ProtocolEngineTest, LeftoverAfterCompletion) {
  auto down = DownloadReceivingData("foo.txt", 2);
  const auto rest = down->Feed(EncodeData(0, "ab") + EncodeHeader(FrameType::ZEOF, 2) + "OO");
  EXPECT_EQ(TransferState::Completed, down->state());
  EXPECT_EQ("OO", rest);
}

TEST_F(ProtocolEngineTest, CloseFile) {
  auto down = DownloadReceivingData("foo.txt", 2);
  EXPECT_FALSE(down->file_closed());
  EXPECT_TRUE(down->CloseFile());
  EXPECT_TRUE(down->file_closed());
  EXPECT_TRUE(download_file_->closed());
  EXPECT_TRUE(down->CloseFile());
}

TEST_F(ProtocolEngineTest, PullRespectsMaxBytes) {
  auto up = Upload("abc.txt", "0123456789");
  const auto whole = EncodeFrame([] {
    auto f = MakeFrame(FrameType::ZFILE);
    f.payload = BuildFileHeaderPayload("abc.txt", 10);
    f.end_marker = ZCRCW;
    return f;
  }());
  std::string got;
  while (up->has_output()) {
    const auto part = up->Pull(3);
    ASSERT_LE(part.size(), 3u);
    got.append(part);
  }
  EXPECT_EQ(whole, got);
}

TEST(TransferStateTest, Names) {
  EXPECT_EQ("SendingData", to_string(TransferState::SendingData));
  EXPECT_EQ("Completed", to_string(TransferState::Completed));
  EXPECT_EQ("upload", to_string(TransferDirection::upload));
  EXPECT_EQ("peer_nak", to_string(TransferErrorKind::peer_nak));
}

TEST(CancelSequenceTest, Contents) {
  const auto s = CancelSequence();
  ASSERT_EQ(18u, s.size());
  EXPECT_EQ(std::string(8, static_cast<char>(CAN)), s.substr(0, 8));
  EXPECT_EQ(std::string(10, static_cast<char>(BACKSPACE)), s.substr(8));
}
