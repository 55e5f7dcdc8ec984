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
#include "zmodem/frame.h"

#include "core/strings.h"
#include "fmt/format.h"
#include <string>

using namespace zlink::strings;

namespace zlink::zmodem {

bool operator==(const Frame& lhs, const Frame& rhs) {
  if (lhs.type != rhs.type || lhs.flags != rhs.flags || lhs.aux != rhs.aux ||
      lhs.encoding != rhs.encoding || lhs.payload != rhs.payload) {
    return false;
  }
  if (frame_has_payload(lhs.type) && lhs.encoding != FrameEncoding::hex) {
    return lhs.end_marker == rhs.end_marker;
  }
  return true;
}

std::ostream& operator<<(std::ostream& os, const Frame& f) {
  static const char* encodings[] = {"hex", "bin16", "bin32"};
  os << fmt::format("{}[flags: {:#x}; aux: {:02x} {:02x} {:02x} {:02x}; {}", frame_type_name(f.type),
                    f.flags, f.aux[0], f.aux[1], f.aux[2], f.aux[3],
                    encodings[static_cast<int>(f.encoding)]);
  if (frame_has_payload(f.type)) {
    os << fmt::format("; payload: {} bytes; end: {:c}", f.payload.size(),
                      static_cast<char>(f.end_marker));
  }
  os << "]";
  return os;
}

std::string frame_type_name(FrameType t) {
  static const char* names[] = {
      "ZRQINIT", "ZRINIT", "ZSINIT",     "ZACK",   "ZFILE", "ZSKIP",    "ZNAK",
      "ZABORT",  "ZFIN",   "ZRPOS",      "ZDATA",  "ZEOF",  "ZFERR",    "ZCRC",
      "ZCHALLENGE", "ZCOMPL", "ZCAN",    "ZFREECNT", "ZCOMMAND", "ZSTDERR",
  };
  const auto i = static_cast<uint8_t>(t);
  if (i > kMaxFrameType) {
    return StrCat("UNKNOWN(", static_cast<int>(i), ")");
  }
  return names[i];
}

bool frame_has_payload(FrameType t) noexcept {
  switch (t) {
  case FrameType::ZSINIT:
  case FrameType::ZFILE:
  case FrameType::ZDATA:
  case FrameType::ZCOMMAND:
    return true;
  default:
    return false;
  }
}

Frame MakeFrame(FrameType type, uint32_t flags) {
  Frame f{};
  f.type = type;
  f.flags = flags;
  return f;
}

} // namespace zlink::zmodem
