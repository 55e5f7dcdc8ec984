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
#ifndef INCLUDED_ZLINK_CORE_CEREAL_UTILS_H
#define INCLUDED_ZLINK_CORE_CEREAL_UTILS_H

// ReSharper disable CppUnusedIncludeDirective
#include <cereal/access.hpp>
#include <cereal/cereal.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/stl.h"

namespace cereal {

// Serializes n.field under the name "field". A field missing from the
// input keeps its default value instead of failing the whole load.
#define SERIALIZE(n, field)                                                                        \
  do {                                                                                             \
    try {                                                                                          \
      ar(cereal::make_nvp(#field, (n).field));                                                     \
    } catch (const cereal::Exception&) {                                                           \
      ar.setNextName(nullptr);                                                                     \
    }                                                                                              \
  } while (false)

#define SERIALIZE_NVP(name, field)                                                                 \
  do {                                                                                             \
    try {                                                                                          \
      ar(cereal::make_nvp(name, field));                                                           \
    } catch (const cereal::Exception&) {                                                           \
      ar.setNextName(nullptr);                                                                     \
    }                                                                                              \
  } while (false)

template <typename T>
std::string to_enum_string(const T& t, const std::vector<std::string>& names) {
  try {
    return names.at(static_cast<size_t>(t));
  } catch (const std::out_of_range&) {
    return names.at(0);
  }
}

template <typename T>
T from_enum_string(const std::string& v, const std::vector<std::string>& names) {
  for (auto i = 0; i < zlink::stl::ssize(names); i++) {
    if (v == names[static_cast<size_t>(i)]) {
      return static_cast<T>(i);
    }
  }
  return static_cast<T>(0);
}

} // namespace cereal

#endif // INCLUDED_ZLINK_CORE_CEREAL_UTILS_H
