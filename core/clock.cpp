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
#include "core/clock.h"

namespace zlink::core {

Clock::time_point SystemClock::Now() const noexcept { return std::chrono::steady_clock::now(); }

} // namespace zlink::core
