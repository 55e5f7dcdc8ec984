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
#ifndef INCLUDED_ZLINK_ZMODEM_TRANSFER_FILE_H
#define INCLUDED_ZLINK_ZMODEM_TRANSFER_FILE_H

#include <cstdint>
#include <string>

namespace zlink::zmodem {

/**
 * The local end of a transfer: the source of an upload or the sink of a
 * download.
 */
class TransferFile {
public:
  explicit TransferFile(std::string filename);
  TransferFile(const TransferFile&) = delete;
  TransferFile& operator=(const TransferFile&) = delete;
  virtual ~TransferFile();

  /** The bare filename announced to, or by, the peer. */
  [[nodiscard]] std::string filename() const { return filename_; }
  /** Size of the file in bytes. For a file being received, the bytes written so far. */
  [[nodiscard]] virtual int64_t file_size() const = 0;
  /** Reads exactly size bytes at offset start. */
  virtual bool GetChunk(char* chunk, int64_t start, int size) = 0;
  /** Appends size bytes. */
  virtual bool WriteChunk(const char* chunk, int size) = 0;
  virtual bool Flush() = 0;
  virtual bool Close() = 0;
  [[nodiscard]] virtual std::string last_error() const { return last_error_; }

protected:
  const std::string filename_;
  std::string last_error_;
};

class InMemoryTransferFile final : public TransferFile {
public:
  InMemoryTransferFile(const std::string& filename, const std::string& contents);
  explicit InMemoryTransferFile(const std::string& filename);
  ~InMemoryTransferFile() override;

  // for testing.
  [[nodiscard]] const std::string& contents() const { return contents_; }
  [[nodiscard]] bool closed() const noexcept { return closed_; }
  [[nodiscard]] int flush_count() const noexcept { return flush_count_; }
  /** Makes every following write fail, to simulate a full disk. */
  void set_fail_writes(bool f) noexcept { fail_writes_ = f; }

  [[nodiscard]] int64_t file_size() const override;
  bool GetChunk(char* chunk, int64_t start, int size) override;
  bool WriteChunk(const char* chunk, int size) override;
  bool Flush() override;
  bool Close() override;

private:
  std::string contents_;
  bool closed_{false};
  bool fail_writes_{false};
  int flush_count_{0};
};

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_TRANSFER_FILE_H
