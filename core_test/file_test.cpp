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
#include <string>

using namespace zlink::core;

TEST(FileTest, DoesNotExist) {
  FileHelper helper;
  const auto path = helper.Dir("doesnotexist");
  File dne(path);
  ASSERT_FALSE(dne.Exists());
  ASSERT_FALSE(File::Exists(path));
}

TEST(FileTest, Exists) {
  FileHelper helper;
  const auto path = helper.CreateTempFile("a.bin", "abc");
  File f(path);
  EXPECT_TRUE(f.Exists());
  EXPECT_TRUE(File::Exists(path));
  EXPECT_FALSE(File::is_directory(path));
  EXPECT_TRUE(File::is_directory(helper.TempDir()));
}

TEST(FileTest, Length) {
  FileHelper helper;
  const auto path = helper.CreateTempFile("a.bin", "Hello World");
  File f(path);
  ASSERT_TRUE(f.Open(File::modeBinary | File::modeReadOnly));
  EXPECT_EQ(11, f.length());
}

TEST(FileTest, Read) {
  FileHelper helper;
  const auto path = helper.CreateTempFile("a.bin", "Hello World");
  File f(path);
  ASSERT_TRUE(f.Open(File::modeBinary | File::modeReadOnly));
  char buf[6]{};
  ASSERT_EQ(5, f.Read(buf, 5));
  EXPECT_STREQ("Hello", buf);
}

TEST(FileTest, Seek) {
  FileHelper helper;
  const auto path = helper.CreateTempFile("a.bin", "Hello World");
  File f(path);
  ASSERT_TRUE(f.Open(File::modeBinary | File::modeReadOnly));
  ASSERT_EQ(6, f.Seek(6, File::Whence::begin));
  char buf[6]{};
  ASSERT_EQ(5, f.Read(buf, 5));
  EXPECT_STREQ("World", buf);
}

TEST(FileTest, Write_Truncate) {
  FileHelper helper;
  const auto path = helper.CreateTempFile("a.bin", "this is old data");
  {
    File f(path);
    ASSERT_TRUE(f.Open(File::modeBinary | File::modeCreateFile | File::modeWriteOnly |
                       File::modeTruncate));
    const std::string data("new\0data", 8);
    EXPECT_EQ(8, f.Write(data));
    EXPECT_TRUE(f.Flush());
  }
  EXPECT_EQ(std::string("new\0data", 8), helper.ReadFile(path));
}

TEST(FileTest, Append) {
  FileHelper helper;
  const auto path = helper.CreateTempFile("a.txt", "Hello");
  File f(path);
  ASSERT_TRUE(f.Open(File::modeWriteOnly | File::modeAppend));
  EXPECT_EQ(6, f.Write(" World"));
  f.Close();
  EXPECT_FALSE(f.IsOpen());
  EXPECT_EQ("Hello World", helper.ReadFile(path));
}

TEST(FileTest, Exclusive) {
  FileHelper helper;
  const auto path = helper.CreateTempFile("a.txt", "Hello");
  File f(path);
  EXPECT_FALSE(f.Open(File::modeWriteOnly | File::modeCreateFile | File::modeExclusive));
  EXPECT_FALSE(f.last_error().empty());
}

TEST(FileTest, OpenMissing) {
  FileHelper helper;
  File f(helper.Dir("missing.bin"));
  EXPECT_FALSE(f.Open(File::modeBinary | File::modeReadOnly));
  EXPECT_FALSE(f);
}

TEST(FileTest, Move) {
  FileHelper helper;
  const auto path = helper.CreateTempFile("a.bin", "abc");
  File f(path);
  ASSERT_TRUE(f.Open(File::modeReadOnly));
  File g(std::move(f));
  EXPECT_TRUE(g.IsOpen());
  EXPECT_EQ(path.string(), g.path().string());
}

TEST(FileTest, RenameAndRemove) {
  FileHelper helper;
  const auto from = helper.CreateTempFile("from.txt", "x");
  const auto to = helper.Dir("to.txt");
  ASSERT_TRUE(File::Rename(from, to));
  EXPECT_FALSE(File::Exists(from));
  EXPECT_TRUE(File::Exists(to));
  ASSERT_TRUE(File::Remove(to));
  EXPECT_FALSE(File::Exists(to));
}

TEST(FileTest, FilePath) {
  EXPECT_EQ("/tmp/x.bin", FilePath("/tmp", "x.bin").string());
  EXPECT_EQ("x.bin", FilePath("", "x.bin").string());
}
