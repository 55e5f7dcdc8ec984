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
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "core_test/file_helper.h"
#include "zmodem/protocol_engine.h"
#include "zmodem/session_registry.h"
#include "zmodem/transfer_error.h"
#include "zmodem/transfer_file.h"
#include "zmodem_test/fakes.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace zlink::zmodem;

class SessionRegistryTest : public testing::Test {
protected:
  SessionRegistryTest() : registry_(config_) {}

  ZmodemConfig config_;
  FileHelper files_;
  SessionRegistry registry_;
};

TEST_F(SessionRegistryTest, CreateUpload) {
  const auto path = files_.CreateTempFile("up.txt", "0123456789");
  const auto id = registry_.CreateUpload("ch1", path);
  EXPECT_EQ(1, id);
  EXPECT_TRUE(registry_.contains(id));
  EXPECT_EQ(1u, registry_.size());

  const auto s = registry_.Snapshot(id);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(id, s->session_id);
  EXPECT_EQ("ch1", s->channel);
  EXPECT_EQ(TransferDirection::upload, s->direction);
  EXPECT_EQ("up.txt", s->filename);
  EXPECT_EQ(10, s->total.value());
  EXPECT_EQ(0, s->transferred);
  EXPECT_EQ(0, s->percent);
  EXPECT_EQ(TransferState::SendingHeader, s->state);
}

TEST_F(SessionRegistryTest, CreateUpload_Missing) {
  EXPECT_THROW(registry_.CreateUpload("ch1", files_.Dir("missing")), transfer_error);
  EXPECT_EQ(0u, registry_.size());
}

TEST_F(SessionRegistryTest, CreateDownload_Directory) {
  const auto id = registry_.Create("ch1", TransferDirection::download, files_.TempDir());
  const auto s = registry_.Snapshot(id);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(TransferDirection::download, s->direction);
  EXPECT_EQ(TransferState::ReceivingHeader, s->state);
  EXPECT_FALSE(s->total.has_value());
  EXPECT_EQ(0, s->percent);
}

TEST_F(SessionRegistryTest, CreateDownload_File) {
  const auto id = registry_.CreateDownload("ch1", files_.Dir("target.bin"));
  const auto s = registry_.Snapshot(id);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ("target.bin", s->filename);
}

TEST_F(SessionRegistryTest, IdsAreUnique) {
  std::vector<session_id_t> ids;
  for (auto i = 0; i < 5; i++) {
    ids.push_back(registry_.Add(
        "ch", ProtocolEngine::ForDownload(std::make_unique<InMemoryTransferFile>("f"), config_)));
  }
  EXPECT_THAT(ids, testing::ElementsAre(1, 2, 3, 4, 5));
  EXPECT_EQ(ids, registry_.ids());
  EXPECT_TRUE(registry_.Remove(3));
  EXPECT_EQ(6, registry_.Add("ch", ProtocolEngine::ForDownload(
                                       std::make_unique<InMemoryTransferFile>("f"), config_)));
}

namespace {
// Records Close in a flag which outlives the file.
class TrackingFile : public TransferFile {
public:
  explicit TrackingFile(std::shared_ptr<bool> closed)
      : TransferFile("tracked"), closed_(std::move(closed)) {}
  int64_t file_size() const override { return 0; }
  bool GetChunk(char*, int64_t, int) override { return false; }
  bool WriteChunk(const char*, int) override { return true; }
  bool Flush() override { return true; }
  bool Close() override {
    *closed_ = true;
    return true;
  }

private:
  std::shared_ptr<bool> closed_;
};
} // namespace

TEST_F(SessionRegistryTest, RemoveClosesFile) {
  auto closed = std::make_shared<bool>(false);
  const auto id = registry_.Add(
      "ch1", ProtocolEngine::ForDownload(std::make_unique<TrackingFile>(closed), config_));
  ASSERT_TRUE(registry_.WithSession(id, [](ProtocolEngine& e) { EXPECT_FALSE(e.file_closed()); }));
  EXPECT_FALSE(*closed);

  EXPECT_TRUE(registry_.Remove(id));
  EXPECT_TRUE(*closed);
  EXPECT_FALSE(registry_.contains(id));
  EXPECT_FALSE(registry_.Snapshot(id).has_value());
  EXPECT_FALSE(registry_.WithSession(id, [](ProtocolEngine&) { FAIL() << "session removed"; }));
}

TEST_F(SessionRegistryTest, DestructorClosesFiles) {
  auto closed = std::make_shared<bool>(false);
  {
    SessionRegistry registry(config_);
    registry.Add("ch1",
                 ProtocolEngine::ForDownload(std::make_unique<TrackingFile>(closed), config_));
  }
  EXPECT_TRUE(*closed);
}

TEST_F(SessionRegistryTest, RemoveInFlight) {
  const auto id = registry_.Add(
      "ch1", ProtocolEngine::ForDownload(std::make_unique<InMemoryTransferFile>("f"), config_));
  auto* engine = static_cast<ProtocolEngine*>(nullptr);
  registry_.WithSession(id, [&](ProtocolEngine& e) { engine = &e; });
  ASSERT_NE(nullptr, engine);
  EXPECT_FALSE(engine->finished());
  // Removing a session which has not finished still closes everything.
  EXPECT_TRUE(registry_.Remove(id));
  EXPECT_EQ(0u, registry_.size());
}

TEST_F(SessionRegistryTest, RemoveUnknown) {
  EXPECT_FALSE(registry_.Remove(42));
  EXPECT_FALSE(registry_.Snapshot(42).has_value());
  EXPECT_FALSE(registry_.WithSession(42, [](ProtocolEngine&) {}));
}

TEST_F(SessionRegistryTest, SnapshotAll) {
  registry_.Add("a", ProtocolEngine::ForDownload(std::make_unique<InMemoryTransferFile>("1"),
                                                 config_));
  registry_.Add("b", ProtocolEngine::ForUpload(
                         std::make_unique<InMemoryTransferFile>("2", "data"), config_));
  const auto all = registry_.SnapshotAll();
  ASSERT_EQ(2u, all.size());
  EXPECT_EQ("a", all[0].channel);
  EXPECT_EQ("b", all[1].channel);
  EXPECT_EQ(TransferDirection::upload, all[1].direction);
}

TEST_F(SessionRegistryTest, ConcurrentSessionsAreIsolated) {
  constexpr int kSessions = 4;
  std::vector<std::string> contents;
  std::vector<session_id_t> uploads;
  std::vector<session_id_t> downloads;
  std::vector<InMemoryTransferFile*> received;
  for (auto i = 0; i < kSessions; i++) {
    contents.push_back(std::string(5000 + i * 100, static_cast<char>('a' + i)));
    uploads.push_back(registry_.Add(
        "up", ProtocolEngine::ForUpload(
                  std::make_unique<InMemoryTransferFile>("f" + std::to_string(i), contents[i]),
                  config_)));
    auto file = std::make_unique<InMemoryTransferFile>("r");
    received.push_back(file.get());
    downloads.push_back(
        registry_.Add("down", ProtocolEngine::ForDownload(std::move(file), config_)));
  }

  std::vector<std::thread> threads;
  for (auto i = 0; i < kSessions; i++) {
    threads.emplace_back([&, i] {
      for (auto round = 0; round < 10000; round++) {
        std::string a_to_b;
        std::string b_to_a;
        registry_.WithSession(uploads[i], [&](ProtocolEngine& e) { a_to_b = e.Pull(1024); });
        registry_.WithSession(downloads[i], [&](ProtocolEngine& e) { b_to_a = e.Pull(1024); });
        if (a_to_b.empty() && b_to_a.empty()) {
          return;
        }
        registry_.WithSession(downloads[i], [&](ProtocolEngine& e) { e.Feed(a_to_b); });
        registry_.WithSession(uploads[i], [&](ProtocolEngine& e) { e.Feed(b_to_a); });
      }
    });
  }
  // Snapshots taken while the sessions run.
  for (auto i = 0; i < 50; i++) {
    for (const auto& s : registry_.SnapshotAll()) {
      EXPECT_LE(s.percent, 100);
    }
  }
  for (auto& t : threads) {
    t.join();
  }

  for (auto i = 0; i < kSessions; i++) {
    const auto s = registry_.Snapshot(downloads[i]);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(TransferState::Completed, s->state) << i;
    EXPECT_EQ(contents[i], received[i]->contents()) << i;
  }
}
