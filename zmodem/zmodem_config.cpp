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
#include "zmodem/zmodem_config.h"

#include "core/cereal_utils.h"
#include "core/file.h"
#include "core/jsonfile.h"
#include "core/log.h"

#include <cereal/access.hpp>
#include <cereal/cereal.hpp>

using namespace zlink::core;

namespace zlink::zmodem {

template <class Archive> void serialize(Archive& ar, ZmodemConfig& c) {
  SERIALIZE(c, chunk_size);
  SERIALIZE(c, sniff_window_bytes);
  SERIALIZE(c, garbage_tail_bytes);
  SERIALIZE(c, max_garbage_bytes);
  SERIALIZE(c, max_subpacket_bytes);
  SERIALIZE(c, validate_crc);
  SERIALIZE(c, use_crc32);
  SERIALIZE(c, stall_timeout_seconds);
  SERIALIZE(c, progress_interval_millis);
  SERIALIZE(c, output_chunk_bytes);
  SERIALIZE(c, download_directory);
}

CodecOptions ZmodemConfig::codec_options() const {
  CodecOptions o{};
  o.validate_crc = validate_crc;
  o.max_subpacket_bytes = static_cast<size_t>(max_subpacket_bytes);
  return o;
}

bool ZmodemConfig::Load(const std::filesystem::path& path) {
  JsonFile<ZmodemConfig> file(path, "zmodem", *this, kZmodemConfigVersion);
  try {
    if (!file.Load()) {
      return false;
    }
  } catch (const json_version_error& e) {
    LOG(ERROR) << e.what();
    return false;
  }
  ValidateConfig(*this);
  return true;
}

bool ZmodemConfig::Save(const std::filesystem::path& path) {
  JsonFile<ZmodemConfig> file(path, "zmodem", *this, kZmodemConfigVersion);
  return file.Save();
}

static void clamp(int& value, int lo, int hi, const char* name) {
  if (value < lo || value > hi) {
    const auto fixed = value < lo ? lo : hi;
    LOG(WARNING) << "zmodem config: " << name << "=" << value << " is out of range; using "
                 << fixed;
    value = fixed;
  }
}

void ValidateConfig(ZmodemConfig& c) {
  clamp(c.chunk_size, 1, 8192, "chunk_size");
  clamp(c.sniff_window_bytes, 16, 65536, "sniff_window_bytes");
  clamp(c.max_garbage_bytes, 64, 1 << 20, "max_garbage_bytes");
  clamp(c.garbage_tail_bytes, 16, c.max_garbage_bytes, "garbage_tail_bytes");
  clamp(c.max_subpacket_bytes, c.chunk_size, 1 << 20, "max_subpacket_bytes");
  clamp(c.stall_timeout_seconds, 1, 86400, "stall_timeout_seconds");
  clamp(c.progress_interval_millis, 10, 60000, "progress_interval_millis");
  clamp(c.output_chunk_bytes, 64, 1 << 20, "output_chunk_bytes");
}

} // namespace zlink::zmodem
