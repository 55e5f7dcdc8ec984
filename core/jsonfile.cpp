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
#include "core/jsonfile.h"

#include "core/file.h"
#include "core/strings.h"
#include <string>

using namespace zlink::strings;

namespace zlink::core {

std::optional<std::string> read_json_file(const std::filesystem::path& p) {
  File file(p);
  if (!file.Open(File::modeReadOnly | File::modeBinary)) {
    return std::nullopt;
  }
  std::string text;
  char buf[4096];
  for (;;) {
    const auto n = file.Read(buf, sizeof(buf));
    if (n < 0) {
      return std::nullopt;
    }
    if (n == 0) {
      break;
    }
    text.append(buf, static_cast<size_t>(n));
  }
  if (text.empty()) {
    return std::nullopt;
  }
  return {text};
}

bool write_json_file(const std::filesystem::path& p, const std::string& text) {
  auto tmp{p};
  tmp += ".tmp";
  {
    File file(tmp);
    if (!file.Open(File::modeWriteOnly | File::modeCreateFile | File::modeTruncate |
                   File::modeBinary)) {
      LOG(ERROR) << "Unable to create: " << tmp.string() << "; " << file.last_error();
      return false;
    }
    if (file.Write(text) != static_cast<File::size_type>(text.size())) {
      return false;
    }
  }
  return File::Rename(tmp, p);
}

} // namespace zlink::core
