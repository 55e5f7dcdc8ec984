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
#ifndef INCLUDED_ZLINK_ZMODEM_FRAME_H
#define INCLUDED_ZLINK_ZMODEM_FRAME_H

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

namespace zlink::zmodem {

// Framing bytes.
constexpr uint8_t ZPAD = '*';
constexpr uint8_t ZDLE = 0x18;
constexpr uint8_t ZDLEE = ZDLE ^ 0x40;
constexpr uint8_t CAN = ZDLE;
constexpr uint8_t XON = 0x11;
constexpr uint8_t BACKSPACE = 0x08;

// Format bytes following ZPAD ZPAD ZDLE.
constexpr uint8_t ZBIN = 'A';
constexpr uint8_t ZHEX = 'B';
constexpr uint8_t ZBIN32 = 'C';

// Subpacket end markers, following a ZDLE.
constexpr uint8_t ZCRCE = 'h';
constexpr uint8_t ZCRCG = 'i';
constexpr uint8_t ZCRCQ = 'j';
constexpr uint8_t ZCRCW = 'k';
constexpr uint8_t ZRUB0 = 'l';
constexpr uint8_t ZRUB1 = 'm';

// Capability flags sent with ZRINIT.
constexpr uint32_t CANFDX = 0x80;
constexpr uint32_t CANOVIO = 0x40;
constexpr uint32_t CANBRK = 0x20;
constexpr uint32_t CANFC32 = 0x10;

enum class FrameType : uint8_t {
  ZRQINIT = 0,
  ZRINIT = 1,
  ZSINIT = 2,
  ZACK = 3,
  ZFILE = 4,
  ZSKIP = 5,
  ZNAK = 6,
  ZABORT = 7,
  ZFIN = 8,
  ZRPOS = 9,
  ZDATA = 10,
  ZEOF = 11,
  ZFERR = 12,
  ZCRC = 13,
  ZCHALLENGE = 14,
  ZCOMPL = 15,
  ZCAN = 16,
  ZFREECNT = 17,
  ZCOMMAND = 18,
  ZSTDERR = 19,
};

constexpr uint8_t kMaxFrameType = static_cast<uint8_t>(FrameType::ZSTDERR);

/** The on-wire form a frame was read from, or should be written as. */
enum class FrameEncoding { hex, bin16, bin32 };

/**
 * One decoded protocol unit. The payload is already unescaped.
 */
struct Frame {
  FrameType type{FrameType::ZRQINIT};
  /** Capability bits for ZRINIT, a byte offset for ZRPOS/ZACK/ZDATA/ZEOF. */
  uint32_t flags{0};
  std::array<uint8_t, 4> aux{};
  std::string payload;
  FrameEncoding encoding{FrameEncoding::bin32};
  /** ZCRCE/ZCRCG/ZCRCQ/ZCRCW for frames that carry a payload. */
  uint8_t end_marker{ZCRCE};
  /** Checksum as read from the wire. Not part of frame equality. */
  uint32_t checksum{0};
};

bool operator==(const Frame& lhs, const Frame& rhs);
inline bool operator!=(const Frame& lhs, const Frame& rhs) { return !(lhs == rhs); }
std::ostream& operator<<(std::ostream& os, const Frame& f);

/** Returns the protocol name of t, i.e. "ZRINIT". */
std::string frame_type_name(FrameType t);
/** True for the frame types followed by a data subpacket. */
bool frame_has_payload(FrameType t) noexcept;

/** Builds a header-only frame, the common case for control frames. */
Frame MakeFrame(FrameType type, uint32_t flags = 0);

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_FRAME_H
