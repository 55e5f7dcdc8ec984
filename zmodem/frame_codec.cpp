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
#include "zmodem/frame_codec.h"

#include "core/crc32.h"
#include "core/log.h"
#include "core/strings.h"
#include "fmt/format.h"
#include <algorithm>
#include <string>

using namespace zlink::core;
using namespace zlink::strings;

namespace zlink::zmodem {

static constexpr char hexChars[] = "0123456789abcdef";
// A hex header is type(2) + flags(8), optionally followed by a CRC-16(4).
static constexpr size_t kHexHeaderDigits = 10;
static constexpr size_t kHexHeaderWithCrcDigits = 14;

static void putHex(std::string& out, uint8_t c) {
  out.push_back(hexChars[(c >> 4) & 0xf]);
  out.push_back(hexChars[c & 0xf]);
}

static int hex_value(uint8_t c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

static bool is_format_byte(uint8_t c) noexcept { return c == ZBIN || c == ZHEX || c == ZBIN32; }

static bool is_end_marker(uint8_t c) noexcept {
  return c == ZCRCE || c == ZCRCG || c == ZCRCQ || c == ZCRCW;
}

static uint8_t at(std::string_view b, size_t i) noexcept { return static_cast<uint8_t>(b[i]); }

bool needs_escape(uint8_t c) noexcept {
  return c == ZDLE || (c >= 0x10 && c <= 0x1a) || c == 0x7f || c == 0x8d || c == 0x8a ||
         c == '@';
}

void AppendEscaped(std::string& out, uint8_t c) {
  if (needs_escape(c)) {
    out.push_back(static_cast<char>(ZDLE));
    out.push_back(static_cast<char>(c ^ 0x40));
  } else {
    out.push_back(static_cast<char>(c));
  }
}

static void AppendFlags(std::string& out, uint32_t flags, bool escape) {
  for (auto shift = 24; shift >= 0; shift -= 8) {
    const auto b = static_cast<uint8_t>((flags >> shift) & 0xff);
    if (escape) {
      AppendEscaped(out, b);
    } else {
      out.push_back(static_cast<char>(b));
    }
  }
}

static std::string EncodeHexFrame(const Frame& f) {
  std::string out;
  out.push_back(static_cast<char>(ZPAD));
  out.push_back(static_cast<char>(ZPAD));
  out.push_back(static_cast<char>(ZDLE));
  out.push_back(static_cast<char>(ZHEX));

  std::string raw;
  raw.push_back(static_cast<char>(f.type));
  AppendFlags(raw, f.flags, false);
  for (const auto c : raw) {
    putHex(out, static_cast<uint8_t>(c));
  }
  const auto crc = crc16(raw.data(), raw.size());
  putHex(out, static_cast<uint8_t>(crc >> 8));
  putHex(out, static_cast<uint8_t>(crc & 0xff));
  out.push_back('\r');
  out.push_back('\n');
  if (f.type != FrameType::ZACK && f.type != FrameType::ZFIN) {
    out.push_back(static_cast<char>(XON));
  }
  return out;
}

std::string EncodeFrame(const Frame& f) {
  if (f.encoding == FrameEncoding::hex) {
    return EncodeHexFrame(f);
  }
  const auto crc32_format = f.encoding == FrameEncoding::bin32;
  std::string out;
  out.reserve(f.payload.size() * 2 + 32);
  out.push_back(static_cast<char>(ZPAD));
  out.push_back(static_cast<char>(ZPAD));
  out.push_back(static_cast<char>(ZDLE));
  out.push_back(static_cast<char>(crc32_format ? ZBIN32 : ZBIN));
  AppendEscaped(out, static_cast<uint8_t>(f.type));
  AppendFlags(out, f.flags, true);
  for (const auto a : f.aux) {
    AppendEscaped(out, a);
  }
  if (frame_has_payload(f.type)) {
    for (const auto c : f.payload) {
      AppendEscaped(out, static_cast<uint8_t>(c));
    }
    out.push_back(static_cast<char>(ZDLE));
    out.push_back(static_cast<char>(is_end_marker(f.end_marker) ? f.end_marker : ZCRCE));
  }

  // The checksum covers everything after the two pads.
  if (crc32_format) {
    const auto crc = crc32(out.data() + 2, out.size() - 2);
    AppendFlags(out, crc, true);
  } else {
    const auto crc = crc16(out.data() + 2, out.size() - 2);
    AppendEscaped(out, static_cast<uint8_t>(crc >> 8));
    AppendEscaped(out, static_cast<uint8_t>(crc & 0xff));
  }
  return out;
}

size_t FindFrameStart(std::string_view buffer, size_t from) noexcept {
  const auto n = buffer.size();
  for (auto p = from; p < n; p++) {
    if (at(buffer, p) != ZPAD) {
      continue;
    }
    if (p + 2 < n && at(buffer, p + 1) == ZDLE && is_format_byte(at(buffer, p + 2))) {
      return p;
    }
    if (p + 3 < n && at(buffer, p + 1) == ZPAD && at(buffer, p + 2) == ZDLE &&
        is_format_byte(at(buffer, p + 3))) {
      return p;
    }
  }
  return std::string_view::npos;
}

namespace {

enum class Step { ok, more, bad };

/**
 * Reads ZDLE-escaped bytes from the wire one at a time.
 */
class EscapedReader {
public:
  EscapedReader(std::string_view buffer, size_t pos) : buffer_(buffer), pos_(pos) {}

  /**
   * Reads one data byte into out. If marker is not null, a ZDLE followed by
   * a subpacket end marker stores that marker there and returns ok with
   * *marker != 0.
   */
  Step Read(uint8_t& out, uint8_t* marker) {
    if (pos_ >= buffer_.size()) {
      return Step::more;
    }
    const auto c = at(buffer_, pos_);
    if (c != ZDLE) {
      pos_++;
      out = c;
      return Step::ok;
    }
    if (pos_ + 1 >= buffer_.size()) {
      return Step::more;
    }
    const auto e = at(buffer_, pos_ + 1);
    pos_ += 2;
    if (is_end_marker(e)) {
      if (marker == nullptr) {
        error_ = fmt::format("unexpected end marker {:c} in header", static_cast<char>(e));
        return Step::bad;
      }
      *marker = e;
      return Step::ok;
    }
    if (e == ZRUB0) {
      out = 0x7f;
    } else if (e == ZRUB1) {
      out = 0xff;
    } else if (e == ZDLE) {
      // A CAN following CAN is the start of a cancel sequence, not data.
      error_ = "cancel sequence inside frame";
      return Step::bad;
    } else {
      out = static_cast<uint8_t>(e ^ 0x40);
    }
    return Step::ok;
  }

  [[nodiscard]] size_t pos() const noexcept { return pos_; }
  [[nodiscard]] const std::string& error() const noexcept { return error_; }

private:
  std::string_view buffer_;
  size_t pos_;
  std::string error_;
};

DecodeResult Malformed(size_t start, std::string error) {
  DecodeResult r{};
  r.status = DecodeStatus::malformed;
  r.consumed = start + 1;
  r.error = std::move(error);
  return r;
}

DecodeResult Incomplete() { return DecodeResult{}; }

DecodeResult Complete(Frame frame, size_t end) {
  DecodeResult r{};
  r.status = DecodeStatus::ok;
  r.frame = std::move(frame);
  r.consumed = end;
  return r;
}

DecodeResult DecodeHex(std::string_view b, size_t start, size_t pos, const CodecOptions& options) {
  const auto n = b.size();
  if (pos >= n) {
    return Incomplete();
  }
  if (hex_value(at(b, pos)) < 0) {
    // Some peers send a single sentinel byte before the hex digits.
    pos++;
  }
  size_t digits = 0;
  auto i = pos;
  while (i < n && digits < kHexHeaderWithCrcDigits && hex_value(at(b, i)) >= 0) {
    i++;
    digits++;
  }
  if (digits < kHexHeaderWithCrcDigits) {
    if (i >= n) {
      return Incomplete();
    }
    if (digits < kHexHeaderDigits) {
      return Malformed(start, fmt::format("hex header has only {} digits", digits));
    }
  }

  auto hex_byte = [&](size_t offset) {
    return static_cast<uint8_t>(hex_value(at(b, pos + offset)) << 4 |
                                hex_value(at(b, pos + offset + 1)));
  };
  std::string raw;
  for (size_t d = 0; d < kHexHeaderDigits; d += 2) {
    raw.push_back(static_cast<char>(hex_byte(d)));
  }
  const auto type = static_cast<uint8_t>(raw[0]);
  if (type > kMaxFrameType) {
    return Malformed(start, fmt::format("unknown frame type {}", type));
  }

  Frame f{};
  f.type = static_cast<FrameType>(type);
  f.encoding = FrameEncoding::hex;
  for (auto k = 1; k <= 4; k++) {
    f.flags = (f.flags << 8) | static_cast<uint8_t>(raw[static_cast<size_t>(k)]);
  }
  if (digits == kHexHeaderWithCrcDigits) {
    f.checksum = static_cast<uint32_t>(hex_byte(10)) << 8 | hex_byte(12);
    const auto expected = crc16(raw.data(), raw.size());
    if (options.validate_crc && expected != f.checksum) {
      return Malformed(start, fmt::format("hex header CRC mismatch: got {:04x}; expected {:04x}",
                                          f.checksum, expected));
    }
  }

  // Swallow the optional CR, LF (or LF | 0x80) and XON trailer.
  if (i < n && at(b, i) == '\r') {
    i++;
  }
  if (i < n && (at(b, i) == '\n' || at(b, i) == 0x8a)) {
    i++;
  }
  if (i < n && at(b, i) == XON) {
    i++;
  }
  return Complete(std::move(f), i);
}

DecodeResult DecodeBinary(std::string_view b, size_t start, size_t zdle_pos, bool crc32_format,
                          const CodecOptions& options) {
  EscapedReader reader(b, zdle_pos + 2);
  uint8_t header[9];
  for (auto& h : header) {
    const auto step = reader.Read(h, nullptr);
    if (step == Step::more) {
      return Incomplete();
    }
    if (step == Step::bad) {
      return Malformed(start, reader.error());
    }
  }
  if (header[0] > kMaxFrameType) {
    return Malformed(start, fmt::format("unknown frame type {}", header[0]));
  }

  Frame f{};
  f.type = static_cast<FrameType>(header[0]);
  f.encoding = crc32_format ? FrameEncoding::bin32 : FrameEncoding::bin16;
  f.flags = static_cast<uint32_t>(header[1]) << 24 | static_cast<uint32_t>(header[2]) << 16 |
            static_cast<uint32_t>(header[3]) << 8 | header[4];
  for (auto k = 0; k < 4; k++) {
    f.aux[static_cast<size_t>(k)] = header[5 + k];
  }

  if (frame_has_payload(f.type)) {
    for (;;) {
      uint8_t c = 0;
      uint8_t marker = 0;
      const auto step = reader.Read(c, &marker);
      if (step == Step::bad) {
        return Malformed(start, reader.error());
      }
      if (step == Step::more) {
        return Incomplete();
      }
      if (marker != 0) {
        f.end_marker = marker;
        break;
      }
      f.payload.push_back(static_cast<char>(c));
      if (f.payload.size() > options.max_subpacket_bytes) {
        return Malformed(start, "subpacket exceeds maximum size without an end marker");
      }
    }
  }

  const auto covered_end = reader.pos();
  const auto crc_len = crc32_format ? 4 : 2;
  uint32_t received = 0;
  for (auto k = 0; k < crc_len; k++) {
    uint8_t c = 0;
    const auto step = reader.Read(c, nullptr);
    if (step == Step::more) {
      return Incomplete();
    }
    if (step == Step::bad) {
      return Malformed(start, reader.error());
    }
    received = (received << 8) | c;
  }
  f.checksum = received;

  if (options.validate_crc) {
    const auto covered = b.substr(zdle_pos, covered_end - zdle_pos);
    const uint32_t expected = crc32_format ? crc32(covered.data(), covered.size())
                                           : crc16(covered.data(), covered.size());
    if (expected != received) {
      return Malformed(start, fmt::format("{} CRC mismatch: got {:08x}; expected {:08x}",
                                          frame_type_name(f.type), received, expected));
    }
  }
  return Complete(std::move(f), reader.pos());
}

} // namespace

DecodeResult DecodeFrame(std::string_view buffer, const CodecOptions& options) {
  const auto start = FindFrameStart(buffer, 0);
  if (start == std::string_view::npos) {
    return Incomplete();
  }
  const auto zdle_pos = at(buffer, start + 1) == ZPAD ? start + 2 : start + 1;
  const auto format = at(buffer, zdle_pos + 1);
  // A malformed frame gives up its pads, ZDLE and format byte, so the
  // second pad is not taken for another frame start.
  const auto skip = zdle_pos + 1;
  if (format == ZHEX) {
    return DecodeHex(buffer, skip, zdle_pos + 2, options);
  }
  return DecodeBinary(buffer, skip, zdle_pos, format == ZBIN32, options);
}

FrameReader::FrameReader(CodecOptions options, size_t max_garbage_bytes,
                         size_t garbage_tail_bytes)
    : options_(options), max_garbage_bytes_(max_garbage_bytes),
      garbage_tail_bytes_(std::min(garbage_tail_bytes, max_garbage_bytes)) {}

void FrameReader::Append(std::string_view data) { buffer_.append(data.data(), data.size()); }

std::string FrameReader::Take() {
  std::string out;
  out.swap(buffer_);
  return out;
}

void FrameReader::Discard(size_t count) {
  buffer_.erase(0, count);
  discarded_bytes_ += count;
}

std::optional<Frame> FrameReader::Next() {
  for (;;) {
    const auto start = FindFrameStart(buffer_, 0);
    if (start == std::string::npos) {
      if (buffer_.size() > max_garbage_bytes_) {
        VLOG(2) << "FrameReader: no frame start in " << buffer_.size()
                << " bytes; keeping the last " << garbage_tail_bytes_;
        Discard(buffer_.size() - garbage_tail_bytes_);
      }
      return std::nullopt;
    }
    if (start > 0) {
      VLOG(3) << "FrameReader: skipping " << start
              << " bytes: " << printable_bytes(std::string_view(buffer_).substr(0, start));
      Discard(start);
    }
    auto r = DecodeFrame(buffer_, options_);
    switch (r.status) {
    case DecodeStatus::ok:
      buffer_.erase(0, r.consumed);
      return std::move(r.frame);
    case DecodeStatus::incomplete:
      return std::nullopt;
    case DecodeStatus::malformed:
      malformed_count_++;
      last_error_ = r.error;
      VLOG(1) << "FrameReader: malformed frame: " << r.error;
      Discard(r.consumed);
      break;
    }
  }
}

} // namespace zlink::zmodem
