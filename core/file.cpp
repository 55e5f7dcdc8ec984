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
#include "core/file.h"

#include "core/log.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <ostream>
#include <string>
#include <system_error>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

#if !defined(O_BINARY)
#define O_BINARY 0
#endif

using namespace std::filesystem;

namespace zlink::core {

/////////////////////////////////////////////////////////////////////////////
// Constants

const int File::modeDefault = O_RDWR | O_BINARY;
const int File::modeAppend = O_APPEND;
const int File::modeBinary = O_BINARY;
const int File::modeCreateFile = O_CREAT;
const int File::modeReadOnly = O_RDONLY;
const int File::modeReadWrite = O_RDWR;
const int File::modeWriteOnly = O_WRONLY;
const int File::modeTruncate = O_TRUNC;
const int File::modeExclusive = O_EXCL;
const int File::modeUnknown = -1;

const int File::invalid_handle = -1;
const char File::pathSeparatorChar = '/';

path FilePath(const path& directory_name, const path& file_name) {
  if (directory_name.empty()) {
    return file_name;
  }
  return directory_name / file_name;
}

/////////////////////////////////////////////////////////////////////////////
// Constructors/Destructors

File::File(std::filesystem::path full_path_name)
    : full_path_name_(std::move(full_path_name)) {}

File::File(File&& other) noexcept : handle_(other.handle_) {
  other.handle_ = invalid_handle;
  full_path_name_.swap(other.full_path_name_);
  error_text_.swap(other.error_text_);
}

File& File::operator=(File&& other) noexcept {
  if (this != &other) {
    Close();
    handle_ = other.handle_;
    full_path_name_.swap(other.full_path_name_);
    error_text_.swap(other.error_text_);
    other.handle_ = invalid_handle;
  }
  return *this;
}

File::~File() {
  if (IsOpen()) {
    Close();
  }
}

bool File::Open(int file_mode) {
  DCHECK(!IsOpen()) << "File " << full_path_name_ << " is already open.";
  CHECK_NE(file_mode, File::modeUnknown);

  handle_ = open(full_path_name_.string().c_str(), file_mode, 0644);
  VLOG(3) << "File::Open '" << full_path_name_ << "', access=" << file_mode
          << ", handle=" << handle_;
  if (handle_ == invalid_handle) {
    error_text_ = strerror(errno);
  }
  return IsFileHandleValid(handle_);
}

bool File::IsOpen() const noexcept { return IsFileHandleValid(handle_); }

void File::Close() noexcept {
  if (IsFileHandleValid(handle_)) {
    VLOG(4) << "CLOSE " << full_path_name_ << ", handle=" << handle_;
    close(handle_);
    handle_ = invalid_handle;
  }
}

/////////////////////////////////////////////////////////////////////////////
// Member functions

File::size_type File::Read(void* buffer, size_type size) {
  const auto ret = read(handle_, buffer, static_cast<size_t>(size));
  if (ret == -1) {
    error_text_ = strerror(errno);
    LOG(ERROR) << "Read error: " << error_text_ << "; filename: " << full_path_name_
               << " size: " << size;
  }
  return ret;
}

File::size_type File::Write(const void* buffer, size_type size) {
  const auto* p = static_cast<const char*>(buffer);
  size_type written = 0;
  while (written < size) {
    const auto r = write(handle_, p + written, static_cast<size_t>(size - written));
    if (r == -1) {
      if (errno == EINTR) {
        continue;
      }
      error_text_ = strerror(errno);
      LOG(ERROR) << "Write error: " << error_text_ << "; filename: " << full_path_name_
                 << " size: " << size;
      return -1;
    }
    written += r;
  }
  return written;
}

bool File::Flush() {
  if (!IsOpen()) {
    return false;
  }
  if (fsync(handle_) != 0) {
    error_text_ = strerror(errno);
    return false;
  }
  return true;
}

File::size_type File::Seek(size_type offset, Whence whence) {
  CHECK(IsFileHandleValid(handle_));
  return static_cast<size_type>(lseek(handle_, static_cast<off_t>(offset),
                                      static_cast<int>(whence)));
}


bool File::Exists() const noexcept {
  std::error_code ec;
  return exists(full_path_name_, ec);
}

File::size_type File::length() const noexcept {
  std::error_code ec;
  const auto sz = static_cast<size_type>(file_size(full_path_name_, ec));
  if (ec.value() != 0) {
    return 0;
  }
  return sz;
}

/////////////////////////////////////////////////////////////////////////////
// Static functions

// static
bool File::Rename(const std::filesystem::path& from, const std::filesystem::path& to) {
  if (from == to) {
    // Nothing to do.
    return true;
  }
  std::error_code ec{};
  std::filesystem::rename(from, to, ec);
  return ec.value() == 0;
}

// static
bool File::Remove(const std::filesystem::path& p) {
  if (!Exists(p)) {
    // Don't try to delete a file that doesn't exist.
    return true;
  }
  std::error_code ec;
  const auto result = std::filesystem::remove(p, ec);
  if (!result) {
    LOG(ERROR) << "File::Remove failed: " << p.string() << "; msg: " << ec.message();
  }
  return result;
}

// static
bool File::Exists(const std::filesystem::path& p) {
  if (p.empty()) {
    // An empty filename can not exist.
    return false;
  }
  std::error_code ec;
  return exists(p, ec);
}

// static
bool File::is_directory(const std::filesystem::path& p) noexcept {
  std::error_code ec;
  return std::filesystem::is_directory(p, ec);
}

// static
bool File::IsFileHandleValid(int handle) noexcept { return handle != invalid_handle; }

std::ostream& operator<<(std::ostream& os, const File& f) {
  os << f.full_pathname();
  return os;
}

} // namespace zlink::core
