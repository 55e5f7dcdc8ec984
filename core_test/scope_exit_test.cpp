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
#include "gtest/gtest.h"
#include "core/scope_exit.h"
#include <functional>
#include <stdexcept>
#include <utility>

using namespace zlink::core;

TEST(ScopeExitTest, Basic) {
  auto committed = false;
  auto f = [&] { committed = true; };
  {
    ScopeExit e(f);
    ASSERT_FALSE(committed);
  }
  ASSERT_TRUE(committed);
}

TEST(ScopeExitTest, Move) {
  auto count = 0;
  {
    ScopeExit<std::function<void()>> e([&] { ++count; });
    auto moved = std::move(e);
  }
  EXPECT_EQ(1, count);
}

TEST(ScopeExitTest, Exception) {
  auto called = false;
  try {
    ScopeExit<std::function<void()>> e([&] { called = true; });
    throw std::runtime_error("boom");
  } catch (const std::runtime_error&) {
    // expected
  }
  EXPECT_TRUE(called);
}
