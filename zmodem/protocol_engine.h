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
#ifndef INCLUDED_ZLINK_ZMODEM_PROTOCOL_ENGINE_H
#define INCLUDED_ZLINK_ZMODEM_PROTOCOL_ENGINE_H

#include "zmodem/frame.h"
#include "zmodem/frame_codec.h"
#include "zmodem/receive_file.h"
#include "zmodem/transfer_error.h"
#include "zmodem/transfer_file.h"
#include "zmodem/zmodem_config.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace zlink::zmodem {

enum class TransferDirection { upload, download };

enum class TransferState {
  Idle,
  SendingHeader,
  SendingData,
  SendingEof,
  ReceivingHeader,
  ReceivingData,
  Completed,
  Failed
};

std::string to_string(TransferDirection d);
std::string to_string(TransferState s);
std::ostream& operator<<(std::ostream& os, TransferDirection d);
std::ostream& operator<<(std::ostream& os, TransferState s);

/** Eight CAN followed by ten backspaces: tells the peer to give up. */
std::string CancelSequence();

/** Consecutive CAN bytes from the peer that abort a session. */
constexpr int kCancelCount = 5;

/**
 * The state machine for one transfer. Bytes from the peer go in through
 * Feed, bytes for the peer come out of Pull.
 *
 * A ProtocolEngine is not thread safe; SessionRegistry serializes access.
 * Runtime failures never throw: they move the engine to Failed and are
 * available from last_error().
 */
class ProtocolEngine final {
public:
  /** Sends file. Queues the ZFILE header and enters SendingHeader. */
  static std::unique_ptr<ProtocolEngine> ForUpload(std::unique_ptr<TransferFile>&& file,
                                                   const ZmodemConfig& config);
  /** Receives into file, which is already open. Queues ZRINIT. */
  static std::unique_ptr<ProtocolEngine> ForDownload(std::unique_ptr<TransferFile>&& file,
                                                     const ZmodemConfig& config);
  /** Receives into the file factory creates from the peer's ZFILE header. Queues ZRINIT. */
  static std::unique_ptr<ProtocolEngine> ForDownload(receive_file_factory_t factory,
                                                     const ZmodemConfig& config);
  ~ProtocolEngine();

  ProtocolEngine(const ProtocolEngine&) = delete;
  ProtocolEngine& operator=(const ProtocolEngine&) = delete;

  /**
   * Processes bytes from the peer. Returns the bytes which are not part of
   * this session: everything left over once it has finished.
   */
  std::string Feed(std::string_view data);

  /**
   * Returns up to max_bytes for the peer: queued frames first, then the
   * next data subpacket while sending.
   */
  std::string Pull(size_t max_bytes);

  /** True when Pull would return something. */
  [[nodiscard]] bool has_output() const noexcept;

  /**
   * Ends the session locally: replaces any queued output with the cancel
   * sequence and fails with kind and message. Does nothing once finished.
   */
  void Abort(TransferErrorKind kind, const std::string& message);

  /** Closes the local file. Safe to call more than once and in any state. */
  bool CloseFile();

  [[nodiscard]] TransferDirection direction() const noexcept { return direction_; }
  [[nodiscard]] TransferState state() const noexcept { return state_; }
  [[nodiscard]] bool finished() const noexcept {
    return state_ == TransferState::Completed || state_ == TransferState::Failed;
  }
  /** Remote filename for downloads, the local filename for uploads. */
  [[nodiscard]] const std::string& filename() const noexcept { return filename_; }
  /** Bytes acknowledged or written so far. Never decreases. */
  [[nodiscard]] int64_t transferred() const noexcept { return transferred_; }
  /** Size of the file, when known. */
  [[nodiscard]] std::optional<int64_t> file_size() const noexcept { return file_size_; }
  [[nodiscard]] const std::optional<TransferErrorInfo>& last_error() const noexcept {
    return last_error_;
  }
  [[nodiscard]] bool file_closed() const noexcept { return file_closed_; }
  [[nodiscard]] int malformed_frames() const noexcept { return reader_.malformed_count(); }

private:
  ProtocolEngine(TransferDirection direction, const ZmodemConfig& config);

  void HandleFrame(const Frame& f);
  void HandleUploadFrame(const Frame& f);
  void HandleDownloadFrame(const Frame& f);
  /** Handles the frame types that end a session in either direction. */
  bool HandlePeerFailure(const Frame& f);
  void HandleFileHeader(const Frame& f);
  void HandleData(const Frame& f);
  void HandleEof(const Frame& f);
  void ConfirmFileHeader(const Frame& f);
  void Rewind(uint32_t offset);
  void QueueNextChunk();
  void Queue(Frame f);
  void Unexpected(const Frame& f);
  void SetState(TransferState s);
  void Complete();
  void Fail(TransferErrorKind kind, const std::string& message);
  bool FlushFile();

  const TransferDirection direction_;
  TransferState state_{TransferState::Idle};
  const int chunk_size_;
  const FrameEncoding encoding_;
  FrameReader reader_;
  std::string out_;

  std::unique_ptr<TransferFile> file_;
  receive_file_factory_t receive_file_factory_;
  bool file_closed_{false};
  std::string filename_;
  std::optional<int64_t> file_size_;

  // Offset of the next byte to send, or expected from the peer.
  int64_t position_{0};
  int64_t transferred_{0};
  // The last subpacket (ZCRCW) of the file is out; waiting for its ZACK.
  bool awaiting_final_ack_{false};
  // A ZRPOS has been sent for the current out of order episode.
  bool rpos_sent_{false};
  int can_count_{0};
  std::optional<TransferErrorInfo> last_error_;
};

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_PROTOCOL_ENGINE_H
