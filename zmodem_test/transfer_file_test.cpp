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
#include "core/file.h"
#include "core_test/file_helper.h"
#include "zmodem/transfer_error.h"
#include "zmodem/transfer_file.h"
#include "zmodem/wfile_transfer_file.h"

#include <memory>
#include <stdexcept>
#include <string>

using namespace zlink::core;
using namespace zlink::zmodem;

TEST(InMemoryTransferFileTest, GetChunk) {
  InMemoryTransferFile f("a.txt", "0123456789");
  EXPECT_EQ("a.txt", f.filename());
  EXPECT_EQ(10, f.file_size());
  char buf[4];
  ASSERT_TRUE(f.GetChunk(buf, 6, 4));
  EXPECT_EQ("6789", std::string(buf, 4));
  EXPECT_FALSE(f.GetChunk(buf, 8, 4));
  EXPECT_FALSE(f.last_error().empty());
}

TEST(InMemoryTransferFileTest, WriteChunk) {
  InMemoryTransferFile f("a.txt");
  ASSERT_TRUE(f.WriteChunk("abc", 3));
  ASSERT_TRUE(f.WriteChunk("de", 2));
  EXPECT_EQ("abcde", f.contents());
  EXPECT_EQ(5, f.file_size());
  f.set_fail_writes(true);
  EXPECT_FALSE(f.WriteChunk("f", 1));
  EXPECT_FALSE(f.Flush());
  EXPECT_EQ("abcde", f.contents());
}

class WFileTransferFileTest : public testing::Test {
protected:
  FileHelper files_;
};

TEST_F(WFileTransferFileTest, OpenForSend) {
  const auto path = files_.CreateTempFile("send.bin", "Hello World");
  auto f = WFileTransferFile::OpenForSend(path);
  EXPECT_EQ("send.bin", f->filename());
  EXPECT_EQ(11, f->file_size());

  char buf[5];
  ASSERT_TRUE(f->GetChunk(buf, 0, 5));
  EXPECT_EQ("Hello", std::string(buf, 5));
  // Out of order, as after a ZRPOS.
  ASSERT_TRUE(f->GetChunk(buf, 6, 5));
  EXPECT_EQ("World", std::string(buf, 5));
  ASSERT_TRUE(f->GetChunk(buf, 1, 4));
  EXPECT_EQ("ello", std::string(buf, 4));
  EXPECT_FALSE(f->GetChunk(buf, 8, 5));
  EXPECT_TRUE(f->Close());
}

TEST_F(WFileTransferFileTest, OpenForSend_Missing) {
  try {
    WFileTransferFile::OpenForSend(files_.Dir("missing.bin"));
    FAIL() << "transfer_error expected";
  } catch (const transfer_error& e) {
    EXPECT_EQ(TransferErrorKind::file_io, e.kind());
  }
}

TEST_F(WFileTransferFileTest, OpenForSend_Directory) {
  EXPECT_THROW(WFileTransferFile::OpenForSend(files_.TempDir()), transfer_error);
}

TEST_F(WFileTransferFileTest, CreateForReceive) {
  const auto path = files_.CreateTempFile("recv.bin", "old contents that are longer");
  {
    auto f = WFileTransferFile::CreateForReceive(path);
    EXPECT_EQ(0, f->file_size());
    ASSERT_TRUE(f->WriteChunk("abc", 3));
    ASSERT_TRUE(f->WriteChunk("def", 3));
    EXPECT_EQ(6, f->file_size());
    ASSERT_TRUE(f->Flush());
    ASSERT_TRUE(f->Close());
  }
  EXPECT_EQ("abcdef", files_.ReadFile(path));
}

TEST_F(WFileTransferFileTest, CreateForReceive_BadDirectory) {
  EXPECT_THROW(WFileTransferFile::CreateForReceive(files_.Dir("nope/recv.bin")),
               transfer_error);
}

TEST_F(WFileTransferFileTest, RelativePathName) {
  auto file = std::make_unique<File>(files_.Dir("x.bin"));
  EXPECT_THROW(WFileTransferFile("dir/x.bin", std::move(file)), std::invalid_argument);
}
