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
#ifndef INCLUDED_ZLINK_ZMODEM_WFILE_TRANSFER_FILE_H
#define INCLUDED_ZLINK_ZMODEM_WFILE_TRANSFER_FILE_H

#include "core/file.h"
#include "zmodem/transfer_file.h"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace zlink::zmodem {

/** A TransferFile backed by a core::File on disk. */
class WFileTransferFile final : public TransferFile {
public:
  WFileTransferFile(const std::string& filename, std::unique_ptr<core::File>&& file);
  ~WFileTransferFile() override;

  /** Opens path for reading. Throws transfer_error if it is not a readable file. */
  static std::unique_ptr<WFileTransferFile> OpenForSend(const std::filesystem::path& path);
  /** Creates path, truncating any existing file. Throws transfer_error on failure. */
  static std::unique_ptr<WFileTransferFile> CreateForReceive(const std::filesystem::path& path);

  [[nodiscard]] int64_t file_size() const override;
  bool GetChunk(char* chunk, int64_t start, int size) override;
  bool WriteChunk(const char* chunk, int size) override;
  bool Flush() override;
  bool Close() override;


private:
  std::unique_ptr<core::File> file_;
  int64_t size_{0};
  int64_t position_{0};
};

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_WFILE_TRANSFER_FILE_H
