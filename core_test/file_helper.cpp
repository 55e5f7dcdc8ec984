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
#include "core_test/file_helper.h"

#include "gtest/gtest.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "core/strings.h"

using namespace zlink::strings;

FileHelper::FileHelper() {
  const auto* const test_info = ::testing::UnitTest::GetInstance()->current_test_info();
  const auto dir = StrCat(test_info->test_case_name(), "_", test_info->name());
  tmp_ = CreateTempDir(dir);
}

std::filesystem::path FileHelper::Dir(const std::string& name) const { return tmp_ / name; }

bool FileHelper::Mkdir(const std::string& name) const {
  std::error_code ec;
  return std::filesystem::create_directories(Dir(name), ec);
}

// static
std::filesystem::path FileHelper::GetTestTempDir() {
  const auto temp_path = canonical(std::filesystem::temp_directory_path());
  auto path = temp_path / "zlink_test_out";
  if (!exists(path)) {
    create_directories(path);
  }
  return path;
}

// static
std::filesystem::path FileHelper::CreateTempDir(const std::string& base) {
  const auto temp_path = GetTestTempDir();
  auto tmpl = StrCat(temp_path.string(), "/", base, "XXXXXX");
  if (const auto* result = mkdtemp(&tmpl[0])) {
    return std::filesystem::path{result};
  }
  throw std::runtime_error(StrCat("Unable to create temp dir: ", tmpl, "; errno: ", errno));
}

std::filesystem::path FileHelper::CreateTempFilePath(const std::string& name) const {
  return tmp_ / name;
}

std::tuple<FILE*, std::filesystem::path> FileHelper::OpenTempFile(const std::string& name) const {
  const auto path = CreateTempFilePath(name);
  auto* fp = fopen(path.string().c_str(), "wb");
  if (!fp) {
    throw std::runtime_error(StrCat("Unable to create file: ", path.string()));
  }
  return std::make_tuple(fp, path);
}

std::filesystem::path FileHelper::CreateTempFile(const std::string& name,
                                                 const std::string& contents) {
  auto [file, path] = OpenTempFile(name);
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return path;
}

// N.B.: We don't use File since we are testing File with this helper.
std::string FileHelper::ReadFile(const std::filesystem::path& name) const {
  const auto name_string = name.string();
  auto* fp = fopen(name_string.c_str(), "rb");
  if (!fp) {
    const auto msg = StrCat("Unable to open file: ", name_string, "; errno: ", errno);
    throw std::runtime_error(msg);
  }
  std::string contents;
  fseek(fp, 0, SEEK_END);
  contents.resize(static_cast<size_t>(ftell(fp)));
  rewind(fp);
  const auto num_read = fread(&contents[0], 1, contents.size(), fp);
  contents.resize(num_read);
  fclose(fp);
  return contents;
}
