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
#ifndef INCLUDED_ZLINK_CORE_CLOCK_H
#define INCLUDED_ZLINK_CORE_CLOCK_H

#include <chrono>

namespace zlink::core {

class Clock {
public:
  using time_point = std::chrono::steady_clock::time_point;
  using duration = std::chrono::steady_clock::duration;

  Clock() = default;
  virtual ~Clock() = default;
  [[nodiscard]] virtual time_point Now() const noexcept = 0;
};

class SystemClock final : public Clock {
public:
  SystemClock() = default;
  ~SystemClock() override = default;
  [[nodiscard]] time_point Now() const noexcept override;
};

} // namespace zlink::core

#endif // INCLUDED_ZLINK_CORE_CLOCK_H
