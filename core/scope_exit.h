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
#ifndef INCLUDED_ZLINK_CORE_SCOPE_EXIT_H
#define INCLUDED_ZLINK_CORE_SCOPE_EXIT_H

#include <functional>
#include <utility>

namespace zlink::core {

/**
 * A general-purpose scope guard to call the exit function <void()> when a scope
 * is exited, either by normal exit or an exception being thrown.
 *
 * Example use:
 *  ScopeExit at_exit(Logger::ExitLogger);
 */
template <class F = std::function<void()>> class ScopeExit final {
public:
  ScopeExit(const ScopeExit&) = delete;
  ScopeExit& operator=(const ScopeExit&) = delete;
  ScopeExit(ScopeExit&& other) noexcept : fn_(std::move(other.fn_)), invoke_(other.invoke_) {
    other.invoke_ = false;
  }
  ScopeExit& operator=(ScopeExit&&) = delete;

  explicit ScopeExit(F fn) : fn_(std::move(fn)), invoke_(true) {}

  ~ScopeExit() {
    if (invoke_) {
      fn_();
    }
  }

private:
  F fn_;
  bool invoke_{false};
};

} // namespace zlink::core

#endif // INCLUDED_ZLINK_CORE_SCOPE_EXIT_H
