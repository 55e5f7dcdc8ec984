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
#ifndef INCLUDED_ZLINK_ZMODEM_FRAME_CODEC_H
#define INCLUDED_ZLINK_ZMODEM_FRAME_CODEC_H

#include "zmodem/frame.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace zlink::zmodem {

struct CodecOptions {
  /** Reject binary frames (and hex frames carrying a CRC) whose checksum does not match. */
  bool validate_crc{true};
  /** A payload growing past this many bytes without an end marker is malformed. */
  size_t max_subpacket_bytes{8192};
};

enum class DecodeStatus { ok, incomplete, malformed };

struct DecodeResult {
  DecodeStatus status{DecodeStatus::incomplete};
  std::optional<Frame> frame;
  /**
   * Bytes of the input used up by this call. Zero when the input holds
   * no complete frame yet. Always at least one for a malformed frame, so
   * a caller that erases `consumed` bytes always makes progress.
   */
  size_t consumed{0};
  std::string error;
};

/** True if c must be sent as ZDLE (c ^ 0x40). */
[[nodiscard]] bool needs_escape(uint8_t c) noexcept;

/** Appends c to out, escaped if needed. */
void AppendEscaped(std::string& out, uint8_t c);

/**
 * Encodes f as it appears on the wire: two pads, ZDLE, the format byte
 * chosen by f.encoding, then header, payload subpacket and checksum.
 */
[[nodiscard]] std::string EncodeFrame(const Frame& f);

/**
 * Returns the offset of the first pad of the next plausible frame start
 * (one or two ZPADs, ZDLE and a known format byte) at or after from, or
 * std::string_view::npos if there is none.
 */
[[nodiscard]] size_t FindFrameStart(std::string_view buffer, size_t from = 0) noexcept;

/**
 * Decodes the first frame found in buffer. Bytes before the frame start are
 * stray terminal output and are counted in `consumed` when a frame is returned.
 */
[[nodiscard]] DecodeResult DecodeFrame(std::string_view buffer,
                                       const CodecOptions& options = CodecOptions{});

/**
 * Accumulates bytes from an unreliable stream and yields whole frames,
 * skipping malformed ones and bounding the garbage it keeps around.
 */
class FrameReader final {
public:
  FrameReader(CodecOptions options, size_t max_garbage_bytes, size_t garbage_tail_bytes);
  FrameReader() : FrameReader(CodecOptions{}, 1024, 512) {}

  void Append(std::string_view data);
  /** Returns the next complete frame, or std::nullopt when more input is needed. */
  std::optional<Frame> Next();
  void Clear() noexcept { buffer_.clear(); }
  /** Returns the bytes not yet used by a frame and empties the buffer. */
  std::string Take();

  [[nodiscard]] size_t buffered() const noexcept { return buffer_.size(); }
  [[nodiscard]] int malformed_count() const noexcept { return malformed_count_; }
  [[nodiscard]] size_t discarded_bytes() const noexcept { return discarded_bytes_; }
  [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }

private:
  void Discard(size_t count);

  const CodecOptions options_;
  const size_t max_garbage_bytes_;
  const size_t garbage_tail_bytes_;
  std::string buffer_;
  int malformed_count_{0};
  size_t discarded_bytes_{0};
  std::string last_error_;
};

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_FRAME_CODEC_H
