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
#include "zmodem/handshake.h"

#include "core/log.h"
#include "core/strings.h"
#include <algorithm>
#include <string>

using namespace zlink::strings;

namespace zlink::zmodem {

static std::vector<HandshakePattern> CreatePatterns() {
  const std::string zdle(1, static_cast<char>(ZDLE));
  return {
      {StrCat("**", zdle, "B00"), TransferDirection::download, "ZRQINIT"},
      {StrCat("*", zdle, "B00"), TransferDirection::download, "ZRQINIT (one pad)"},
      {"**B00", TransferDirection::download, "ZRQINIT (no ZDLE)"},
      {StrCat("**", zdle, "B01"), TransferDirection::upload, "ZRINIT"},
      {StrCat("*", zdle, "B01"), TransferDirection::upload, "ZRINIT (one pad)"},
      {"**B01", TransferDirection::upload, "ZRINIT (no ZDLE)"},
  };
}

const std::vector<HandshakePattern>& HandshakePatterns() {
  static const auto patterns = CreatePatterns();
  return patterns;
}

std::optional<HandshakeMatch> FindHandshake(std::string_view data) {
  std::optional<HandshakeMatch> best;
  for (const auto& p : HandshakePatterns()) {
    const auto pos = data.find(p.bytes);
    if (pos == std::string_view::npos) {
      continue;
    }
    if (!best || pos < best->offset || (pos == best->offset && p.bytes.size() > best->length)) {
      best = HandshakeMatch{pos, p.bytes.size(), p.direction};
    }
  }
  return best;
}

size_t PartialHandshakeLength(std::string_view data) {
  size_t longest = 0;
  for (const auto& p : HandshakePatterns()) {
    const auto max_len = std::min(data.size(), p.bytes.size() - 1);
    for (auto len = max_len; len > longest; len--) {
      const auto suffix = data.substr(data.size() - len);
      if (suffix.find_first_not_of(static_cast<char>(ZPAD)) == std::string_view::npos) {
        break;
      }
      if (p.bytes.compare(0, len, suffix) == 0) {
        longest = len;
        break;
      }
    }
  }
  return longest;
}

HandshakeDetector::HandshakeDetector(size_t window_bytes) : window_bytes_(window_bytes) {}

ScanResult HandshakeDetector::Scan(std::string_view chunk) {
  const auto history = window_.size();
  // Offset in window_ of the first byte not shown yet.
  const auto unshown = history - held_.size();
  window_.append(chunk.data(), chunk.size());
  held_.clear();

  ScanResult r{};
  const auto m = FindHandshake(window_);
  if (!m) {
    const auto pending = std::string_view(window_).substr(unshown);
    // The pads of a partial marker may already be shown.
    const auto hold = std::min(PartialHandshakeLength(window_), pending.size());
    r.display = std::string(pending.substr(0, pending.size() - hold));
    held_ = std::string(pending.substr(pending.size() - hold));
    if (window_.size() > window_bytes_) {
      window_.erase(0, window_.size() - std::max(window_bytes_, held_.size()));
    }
    return r;
  }

  // Any marker lying wholly in the history was found by an earlier scan,
  // so this one ends inside chunk. Pads before it may already be shown.
  const auto end = m->offset + m->length;
  if (m->offset > unshown) {
    r.display = window_.substr(unshown, m->offset - unshown);
  }
  Detection d{};
  d.direction = m->direction;
  d.after = end > history ? window_.substr(end) : std::string(chunk);
  VLOG(1) << "Handshake detected for " << d.direction << " after "
          << printable_bytes(r.display, 32);
  r.detection = d;
  Reset();
  return r;
}

} // namespace zlink::zmodem
