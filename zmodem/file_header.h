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
#ifndef INCLUDED_ZLINK_ZMODEM_FILE_HEADER_H
#define INCLUDED_ZLINK_ZMODEM_FILE_HEADER_H

#include <cstdint>
#include <optional>
#include <string>

namespace zlink::zmodem {

/**
 * The ZFILE subpacket: "name\0size mtime mode serial\0". Everything after
 * the name is optional; size is decimal and mtime is octal.
 */
struct FileHeader {
  std::string filename;
  std::optional<int64_t> size;
  /** Seconds since the epoch, 0 when the sender did not say. */
  int64_t modification_time{0};
};

/** Parses a ZFILE payload. Returns std::nullopt when there is no NUL after the name. */
std::optional<FileHeader> ParseFileHeader(const std::string& payload);

/** Builds the ZFILE payload announcing filename with the given size. */
std::string BuildFileHeaderPayload(const std::string& filename, int64_t size,
                                   int64_t modification_time = 0);

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_FILE_HEADER_H
