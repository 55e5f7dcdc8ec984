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
#ifndef INCLUDED_ZLINK_ZMODEM_HANDSHAKE_H
#define INCLUDED_ZLINK_ZMODEM_HANDSHAKE_H

#include "zmodem/protocol_engine.h"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zlink::zmodem {

/** A byte sequence announcing a transfer, and the direction it asks for. */
struct HandshakePattern {
  std::string bytes;
  TransferDirection direction;
  std::string name;
};

/**
 * The known handshake markers. A remote "sz" starts with a ZRQINIT hex
 * header (B00), so we download. A remote "rz" answers with ZRINIT (B01),
 * so we upload. Some peers and terminals drop a pad or the ZDLE.
 */
const std::vector<HandshakePattern>& HandshakePatterns();

struct HandshakeMatch {
  size_t offset{0};
  size_t length{0};
  TransferDirection direction{TransferDirection::download};
};

/**
 * Returns the earliest handshake marker in data. When several patterns
 * match at the same offset the longest one wins.
 */
std::optional<HandshakeMatch> FindHandshake(std::string_view data);

struct Detection {
  TransferDirection direction{TransferDirection::download};
  /** Bytes of the chunk after the marker. */
  std::string after;
};

struct ScanResult {
  /**
   * Terminal output that is safe to show now. When a marker was found,
   * these are the bytes before it.
   */
  std::string display;
  std::optional<Detection> detection;
};

/**
 * Returns the length of the longest suffix of data that could be the start
 * of a handshake marker. A run of pads alone does not count: it is far more
 * often ordinary text, such as an echoed password.
 */
size_t PartialHandshakeLength(std::string_view data);

/**
 * Watches a passthrough byte stream for a handshake marker, which may be
 * split across any number of chunks. The start of a marker at the end of
 * a chunk is held back until the next chunk shows whether it is one.
 */
class HandshakeDetector final {
public:
  explicit HandshakeDetector(size_t window_bytes);
  HandshakeDetector() : HandshakeDetector(256) {}

  /**
   * Scans chunk together with the recent history. On a match the history
   * is cleared.
   */
  ScanResult Scan(std::string_view chunk);
  void Reset() noexcept {
    window_.clear();
    held_.clear();
  }
  [[nodiscard]] size_t buffered() const noexcept { return window_.size(); }
  /** Bytes held back as a possible partial marker. */
  [[nodiscard]] const std::string& held() const noexcept { return held_; }

private:
  const size_t window_bytes_;
  std::string window_;
  // Always a suffix of window_.
  std::string held_;
};

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_HANDSHAKE_H
