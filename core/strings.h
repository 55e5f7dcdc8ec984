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
#ifndef INCLUDED_ZLINK_CORE_STRINGS_H
#define INCLUDED_ZLINK_CORE_STRINGS_H

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace zlink::strings {

template <typename A> std::string StrCat(const A& a) noexcept {
  try {
    std::ostringstream ss;
    ss << a;
    return ss.str();
  } catch (const std::exception&) {
    return {};
  }
}

template <typename A, typename... Args>
std::string StrCat(const A& a, const Args&... args) noexcept {
  try {
    std::ostringstream ss;
    ss << a << StrCat(args...);
    return ss.str();
  } catch (const std::exception&) {
    return {};
  }
}

// Comparisons
[[nodiscard]] bool iequals(const std::string& s1, const std::string& s2);

std::vector<std::string> SplitString(const std::string& original_string,
                                     const std::string& delims);
[[nodiscard]] std::vector<std::string> SplitString(const std::string& original_string,
                                                   const std::string& delims, bool skip_empty);

[[nodiscard]] bool starts_with(const std::string& input, const std::string& match);

/**
 * Joins the strings in lines, using separator in between each line.
 */
[[nodiscard]] std::string JoinStrings(const std::vector<std::string>& lines,
                                      const std::string& separator);

/**
 * Returns a printable rendition of raw bytes for logging, with
 * non-printable characters shown as [XX] hex.
 */
[[nodiscard]] std::string printable_bytes(std::string_view bytes, size_t max_len = 64);

template <typename T, typename std::enable_if<std::is_unsigned<T>::value, T>::type* = nullptr>
T to_number(const std::string& s, int b = 10) {
  char* end;
  errno = 0;
  auto result = strtoull(s.c_str(), &end, b);
  if (errno == ERANGE) {
    return 0;
  }
  if (result > std::numeric_limits<T>::max()) {
    return std::numeric_limits<T>::max();
  }
  return static_cast<T>(result);
}

template <typename T, typename std::enable_if<std::is_signed<T>::value, T>::type* = nullptr>
T to_number(const std::string& s, int b = 10) {
  char* end;
  errno = 0;
  auto result = strtoll(s.c_str(), &end, b);
  if (errno == ERANGE) {
    return 0;
  }
  if (result > std::numeric_limits<T>::max()) {
    return std::numeric_limits<T>::max();
  }
  if (result < std::numeric_limits<T>::min()) {
    return std::numeric_limits<T>::min();
  }
  return static_cast<T>(result);
}

/**
 * Return true if haystack contains needle as a substring.
 */
bool contains(const std::string& haystack, const std::string_view& needle) noexcept;

} // namespace zlink::strings

#endif // INCLUDED_ZLINK_CORE_STRINGS_H
