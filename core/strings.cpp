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
#include "core/strings.h"

#include "fmt/format.h"
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace zlink::strings {

static char tolower_char(int c) { return static_cast<char>(::tolower(c)); }

bool iequals(const std::string& s1, const std::string& s2) {
  if (s1.size() != s2.size()) {
    return false;
  }
  return std::equal(s1.begin(), s1.end(), s2.begin(),
                    [](char a, char b) { return tolower_char(a) == tolower_char(b); });
}

std::vector<std::string> SplitString(const std::string& original_string,
                                     const std::string& delims) {
  return SplitString(original_string, delims, true);
}

std::vector<std::string> SplitString(const std::string& original_string,
                                     const std::string& delims, bool skip_empty) {
  std::vector<std::string> out;
  std::string::size_type start = 0;
  for (auto found = original_string.find_first_of(delims); found != std::string::npos;
       found = original_string.find_first_of(delims, start)) {
    if (found > start) {
      out.push_back(original_string.substr(start, found - start));
    } else if (!skip_empty) {
      // Add empty tokens.
      out.emplace_back();
    }
    start = found + 1;
  }
  if (start < original_string.size()) {
    out.push_back(original_string.substr(start));
  }
  return out;
}

bool starts_with(const std::string& input, const std::string& match) {
  return input.size() >= match.size() && input.compare(0, match.size(), match) == 0;
}

std::string JoinStrings(const std::vector<std::string>& lines, const std::string& separator) {
  std::string out;
  for (size_t i = 0; i < lines.size(); i++) {
    if (i > 0) {
      out.append(separator);
    }
    out.append(lines[i]);
  }
  return out;
}

std::string printable_bytes(std::string_view bytes, size_t max_len) {
  std::string out;
  const auto len = std::min(bytes.size(), max_len);
  for (size_t i = 0; i < len; i++) {
    const auto c = static_cast<unsigned char>(bytes[i]);
    if (c >= 0x20 && c < 0x7f) {
      out.push_back(static_cast<char>(c));
    } else {
      out.append(fmt::format("[{:02X}]", c));
    }
  }
  if (bytes.size() > max_len) {
    out.append("...");
  }
  return out;
}

bool contains(const std::string& haystack, const std::string_view& needle) noexcept {
  return haystack.find(needle) != std::string::npos;
}

} // namespace zlink::strings
