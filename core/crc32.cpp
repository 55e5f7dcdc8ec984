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
#include "core/crc32.h"

#include <array>
#include <cstdint>

namespace zlink::core {

namespace {

std::array<uint16_t, 256> make_crc16_table() noexcept {
  std::array<uint16_t, 256> table{};
  for (uint32_t i = 0; i < 256; i++) {
    auto crc = static_cast<uint16_t>(i << 8);
    for (auto bit = 0; bit < 8; bit++) {
      crc = (crc & 0x8000) ? static_cast<uint16_t>((crc << 1) ^ 0x1021)
                           : static_cast<uint16_t>(crc << 1);
    }
    table[i] = crc;
  }
  return table;
}

std::array<uint32_t, 256> make_crc32_table() noexcept {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; i++) {
    auto crc = i;
    for (auto bit = 0; bit < 8; bit++) {
      crc = (crc & 1) ? (crc >> 1) ^ 0xedb88320 : crc >> 1;
    }
    table[i] = crc;
  }
  return table;
}

const std::array<uint16_t, 256> crc16_table = make_crc16_table();
const std::array<uint32_t, 256> crc32_table = make_crc32_table();

} // namespace

uint16_t crc16(const void* data, size_t len, uint16_t crc) noexcept {
  const auto* p = static_cast<const uint8_t*>(data);
  for (size_t i = 0; i < len; i++) {
    crc = static_cast<uint16_t>((crc << 8) ^ crc16_table[((crc >> 8) ^ p[i]) & 0xff]);
  }
  return crc;
}

uint32_t crc32_update(uint32_t crc, const void* data, size_t len) noexcept {
  const auto* p = static_cast<const uint8_t*>(data);
  for (size_t i = 0; i < len; i++) {
    crc = crc32_table[(crc ^ p[i]) & 0xff] ^ (crc >> 8);
  }
  return crc;
}

uint32_t crc32(const void* data, size_t len) noexcept {
  return crc32_final(crc32_update(crc32_init, data, len));
}

} // namespace zlink::core
