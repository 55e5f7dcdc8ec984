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
#ifndef INCLUDED_ZLINK_CORE_CRC32_H
#define INCLUDED_ZLINK_CORE_CRC32_H

#include <cstddef>
#include <cstdint>

namespace zlink::core {

/**
 * CRC-16/XMODEM (poly 0x1021, init 0, no reflection). Pass the previous
 * result as crc to continue a running checksum.
 */
[[nodiscard]] uint16_t crc16(const void* data, size_t len, uint16_t crc = 0) noexcept;

/**
 * Running CRC-32 (IEEE 802.3, reflected poly 0xEDB88320). The value passed in
 * and returned is the pre-inversion register, so callers start from
 * crc32_init and finish with crc32_final.
 */
constexpr uint32_t crc32_init = 0xffffffff;
[[nodiscard]] uint32_t crc32_update(uint32_t crc, const void* data, size_t len) noexcept;
[[nodiscard]] constexpr uint32_t crc32_final(uint32_t crc) noexcept { return ~crc; }

/** One-shot CRC-32 of a buffer. */
[[nodiscard]] uint32_t crc32(const void* data, size_t len) noexcept;

} // namespace zlink::core

#endif // INCLUDED_ZLINK_CORE_CRC32_H
