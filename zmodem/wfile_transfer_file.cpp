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
#include "zmodem/wfile_transfer_file.h"

#include "core/log.h"
#include "core/strings.h"
#include "zmodem/transfer_error.h"
#include <string>
#include <utility>

using namespace zlink::core;
using namespace zlink::strings;

namespace zlink::zmodem {

WFileTransferFile::WFileTransferFile(const std::string& filename, std::unique_ptr<File>&& file)
    : TransferFile(filename), file_(std::move(file)) {
  VLOG(1) << "WFileTransferFile: " << filename;
  if (filename.find(File::pathSeparatorChar) != std::string::npos) {
    // Don't allow filenames with slashes in it.
    throw std::invalid_argument("filename can not be relative pathed");
  }
  if (file_->IsOpen()) {
    size_ = file_->length();
  }
}

WFileTransferFile::~WFileTransferFile() = default;

// static
std::unique_ptr<WFileTransferFile> WFileTransferFile::OpenForSend(
    const std::filesystem::path& path) {
  if (!File::Exists(path) || File::is_directory(path)) {
    throw transfer_error(TransferErrorKind::file_io,
                         StrCat("Not a readable file: ", path.string()));
  }
  auto file = std::make_unique<File>(path);
  if (!file->Open(File::modeBinary | File::modeReadOnly)) {
    throw transfer_error(TransferErrorKind::file_io,
                         StrCat("Unable to open: ", path.string(), "; ", file->last_error()));
  }
  return std::make_unique<WFileTransferFile>(path.filename().string(), std::move(file));
}

// static
std::unique_ptr<WFileTransferFile> WFileTransferFile::CreateForReceive(
    const std::filesystem::path& path) {
  auto file = std::make_unique<File>(path);
  if (!file->Open(File::modeBinary | File::modeWriteOnly | File::modeCreateFile |
                  File::modeTruncate)) {
    throw transfer_error(TransferErrorKind::file_io,
                         StrCat("Unable to create: ", path.string(), "; ", file->last_error()));
  }
  return std::make_unique<WFileTransferFile>(path.filename().string(), std::move(file));
}

int64_t WFileTransferFile::file_size() const { return size_; }

bool WFileTransferFile::GetChunk(char* chunk, int64_t start, int size) {
  if (!file_->IsOpen()) {
    last_error_ = "file is closed";
    return false;
  }
  if (start + size > file_size()) {
    LOG(ERROR) << "ERROR WFileTransferFile::GetChunk (start + size) > file_size():"
               << "values[ start: " << start << "; size: " << size
               << "; file_size(): " << file_size() << " ]";
    last_error_ = "read past end of file";
    return false;
  }
  // Only seek when a ZRPOS moved us away from the current position.
  if (start != position_) {
    if (file_->Seek(start, File::Whence::begin) != start) {
      last_error_ = StrCat("Unable to seek to ", start);
      return false;
    }
    position_ = start;
  }
  const auto num_read = file_->Read(chunk, size);
  if (num_read != size) {
    last_error_ = num_read < 0 ? file_->last_error() : "short read";
    position_ = -1;
    return false;
  }
  position_ += num_read;
  return true;
}

bool WFileTransferFile::WriteChunk(const char* chunk, int size) {
  VLOG(3) << "WFileTransferFile::WriteChunk: " << size;
  if (!file_->IsOpen()) {
    last_error_ = "file is closed";
    return false;
  }
  if (file_->Write(chunk, size) != size) {
    last_error_ = file_->last_error();
    return false;
  }
  size_ += size;
  return true;
}

bool WFileTransferFile::Flush() {
  if (!file_->Flush()) {
    last_error_ = file_->last_error();
    return false;
  }
  return true;
}

bool WFileTransferFile::Close() {
  VLOG(1) << "WFileTransferFile::Close " << file_->path().string();
  file_->Close();
  return true;
}

} // namespace zlink::zmodem
