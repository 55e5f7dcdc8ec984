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
#include "zmodem/transfer_file.h"

#include "core/log.h"
#include "core/stl.h"
#include <cstring>
#include <string>
#include <utility>

namespace zlink::zmodem {

TransferFile::TransferFile(std::string filename) : filename_(std::move(filename)) {}

TransferFile::~TransferFile() = default;

InMemoryTransferFile::InMemoryTransferFile(const std::string& filename,
                                           const std::string& contents)
    : TransferFile(filename), contents_(contents) {}

InMemoryTransferFile::InMemoryTransferFile(const std::string& filename)
    : InMemoryTransferFile(filename, "") {}

InMemoryTransferFile::~InMemoryTransferFile() = default;

int64_t InMemoryTransferFile::file_size() const { return stl::ssize(contents_); }

bool InMemoryTransferFile::GetChunk(char* chunk, int64_t start, int size) {
  if (start < 0 || size < 0 || start + size > file_size()) {
    LOG(ERROR) << "ERROR InMemoryTransferFile::GetChunk (start + size) > file_size():"
               << "values[ start: " << start << "; size: " << size
               << "; file_size(): " << file_size() << " ]";
    last_error_ = "read past end of file";
    return false;
  }
  memcpy(chunk, &contents_[static_cast<size_t>(start)], static_cast<size_t>(size));
  return true;
}

bool InMemoryTransferFile::WriteChunk(const char* chunk, int size) {
  if (fail_writes_ || closed_) {
    last_error_ = closed_ ? "file is closed" : "No space left on device";
    return false;
  }
  contents_.append(chunk, static_cast<size_t>(size));
  return true;
}

bool InMemoryTransferFile::Flush() {
  flush_count_++;
  return !fail_writes_;
}

bool InMemoryTransferFile::Close() {
  closed_ = true;
  return true;
}

} // namespace zlink::zmodem
