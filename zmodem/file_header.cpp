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
#include "zmodem/file_header.h"

#include "core/strings.h"
#include "fmt/format.h"
#include <cctype>
#include <string>
#include <vector>

using namespace zlink::strings;

namespace zlink::zmodem {

static bool all_digits(const std::string& s, int base) {
  if (s.empty()) {
    return false;
  }
  for (const auto c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c)) || (base == 8 && c > '7')) {
      return false;
    }
  }
  return true;
}

std::optional<FileHeader> ParseFileHeader(const std::string& payload) {
  const auto nul = payload.find('\0');
  if (nul == std::string::npos) {
    return std::nullopt;
  }
  FileHeader h{};
  h.filename = payload.substr(0, nul);

  // The info block ends at the next NUL, if any.
  auto info = payload.substr(nul + 1);
  if (const auto end = info.find('\0'); end != std::string::npos) {
    info.resize(end);
  }
  const auto fields = SplitString(info, " ");
  if (!fields.empty() && all_digits(fields[0], 10)) {
    h.size = to_number<int64_t>(fields[0]);
  }
  if (fields.size() > 1 && all_digits(fields[1], 8)) {
    h.modification_time = to_number<int64_t>(fields[1], 8);
  }
  return h;
}

std::string BuildFileHeaderPayload(const std::string& filename, int64_t size,
                                   int64_t modification_time) {
  std::string payload(filename);
  payload.push_back('\0');
  payload.append(fmt::format("{} {:o} 0 0", size, modification_time));
  payload.push_back('\0');
  return payload;
}

} // namespace zlink::zmodem
