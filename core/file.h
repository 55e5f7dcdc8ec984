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
#ifndef INCLUDED_ZLINK_CORE_FILE_H
#define INCLUDED_ZLINK_CORE_FILE_H

#include <cstdio>
#include <filesystem>
#include <string>
#include <sys/types.h>

namespace zlink::core {

/**
 * Creates a full std::filesystem::path of directory_name + file_name ensuring that any
 * path separators are added as needed.
 */
std::filesystem::path FilePath(const std::filesystem::path& directory_name,
                               const std::filesystem::path& file_name);

/**
 * File: A thin RAII wrapper around a POSIX file descriptor.
 *
 * Example:
 *   File f("/tmp/received.bin");
 *   if (!f.Open(File::modeBinary | File::modeCreateFile | File::modeReadWrite)) {
 *     LOG(ERROR) << "Unable to open: " << f << "; " << f.last_error();
 *   }
 *   // No need to close f since when f goes out of scope it'll close automatically.
 */
class File final {
public:
  // Constants
  static const int modeDefault;
  static const int modeUnknown;
  static const int modeAppend;
  static const int modeBinary;
  static const int modeCreateFile;
  static const int modeReadOnly;
  static const int modeReadWrite;
  static const int modeWriteOnly;
  static const int modeTruncate;
  static const int modeExclusive;

  enum class Whence : int { begin = SEEK_SET, current = SEEK_CUR, end = SEEK_END };

  static const int invalid_handle;
  static const char pathSeparatorChar;

  using size_type = ssize_t;

  /** Constructs a file from a path. */
  explicit File(std::filesystem::path full_path_name);
  File(File&& other) noexcept;
  File& operator=(File&& other) noexcept;
  File(const File&) = delete;
  File& operator=(const File&) = delete;
  /** Destructs File. Closes any open file handles. */
  ~File();

  bool Open(int file_mode = modeDefault);
  void Close() noexcept;
  [[nodiscard]] bool IsOpen() const noexcept;

  /** Reads up to size bytes. Returns -1 on error, and fills last_error(). */
  size_type Read(void* buffer, size_type size);
  /** Writes all of count bytes, retrying short writes. Returns -1 on error. */
  size_type Write(const void* buffer, size_type count);
  size_type Write(const std::string& s) { return Write(s.data(), static_cast<size_type>(s.size())); }

  /** Flushes the kernel buffers for this file to disk. */
  bool Flush();

  [[nodiscard]] size_type length() const noexcept;
  size_type Seek(size_type offset, Whence whence);

  [[nodiscard]] bool Exists() const noexcept;

  /** Returns the file path as a std::string path */
  [[nodiscard]] std::string full_pathname() const noexcept { return full_path_name_.string(); }
  /** Returns the file path as a std::filesystem path */
  [[nodiscard]] const std::filesystem::path& path() const noexcept { return full_path_name_; }

  [[nodiscard]] std::string last_error() const noexcept { return error_text_; }

  /** Returns true if the file is open */
  explicit operator bool() const noexcept { return IsOpen(); }
  friend std::ostream& operator<<(std::ostream& os, const File& f);

  // static functions
  static bool Remove(const std::filesystem::path& path);
  static bool Rename(const std::filesystem::path& from, const std::filesystem::path& to);
  [[nodiscard]] static bool Exists(const std::filesystem::path& p);
  [[nodiscard]] static bool is_directory(const std::filesystem::path& p) noexcept;


private:
  [[nodiscard]] static bool IsFileHandleValid(int handle) noexcept;

  int handle_{-1};
  std::filesystem::path full_path_name_;
  std::string error_text_;
};

} // namespace zlink::core

#endif // INCLUDED_ZLINK_CORE_FILE_H
