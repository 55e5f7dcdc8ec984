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
#ifndef INCLUDED_ZLINK_ZMODEM_ZMODEM_CONFIG_H
#define INCLUDED_ZLINK_ZMODEM_ZMODEM_CONFIG_H

#include "zmodem/frame_codec.h"
#include <cstdint>
#include <filesystem>
#include <string>

namespace zlink::zmodem {

/** Current version of the "zmodem" block in zlink.json. */
constexpr int kZmodemConfigVersion = 1;

struct ZmodemConfig {
  /** Payload bytes per outbound ZDATA subpacket. */
  int chunk_size{1024};
  /** Bytes of passthrough history searched for a handshake marker. */
  int sniff_window_bytes{256};
  /** Garbage kept when a frame accumulator overflows. */
  int garbage_tail_bytes{512};
  int max_garbage_bytes{1024};
  int max_subpacket_bytes{8192};
  bool validate_crc{true};
  /** Send ZBIN32 frames instead of ZBIN. */
  bool use_crc32{true};
  int stall_timeout_seconds{30};
  int progress_interval_millis{100};
  /** Most bytes handed to the transport per write. */
  int output_chunk_bytes{8192};
  /** Where received files go when no path is chosen. Empty means the current directory. */
  std::string download_directory;

  [[nodiscard]] CodecOptions codec_options() const;

  bool Load(const std::filesystem::path& path);
  bool Save(const std::filesystem::path& path);
};

/** Clamps out of range values in c to usable ones, logging each change. */
void ValidateConfig(ZmodemConfig& c);

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_ZMODEM_CONFIG_H
