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
#ifndef INCLUDED_ZLINK_CORE_FAKE_CLOCK_H
#define INCLUDED_ZLINK_CORE_FAKE_CLOCK_H

#include "core/clock.h"
#include <chrono>
#include <mutex>

namespace zlink::core {

/** A Clock that only moves when told to. Safe to tick from a test thread. */
class FakeClock final : public Clock {
public:
  FakeClock() = default;
  explicit FakeClock(time_point start) : now_(start) {}

  [[nodiscard]] time_point Now() const noexcept override;
  void tick(std::chrono::milliseconds inc);

private:
  mutable std::mutex mu_;
  time_point now_{};
};

} // namespace zlink::core

#endif // INCLUDED_ZLINK_CORE_FAKE_CLOCK_H
