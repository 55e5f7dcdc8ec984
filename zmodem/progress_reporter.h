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
#ifndef INCLUDED_ZLINK_ZMODEM_PROGRESS_REPORTER_H
#define INCLUDED_ZLINK_ZMODEM_PROGRESS_REPORTER_H

#include "core/clock.h"
#include "zmodem/session_registry.h"
#include "zmodem/sinks.h"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>

namespace zlink::zmodem {

/**
 * Publishes a snapshot of every session to a ProgressSink, and notices
 * sessions that stopped making progress. Call Tick from a timer; it
 * publishes at most once per interval.
 */
class ProgressReporter final {
public:
  ProgressReporter(SessionRegistry& registry, ProgressSink& sink, const core::Clock& clock,
                   std::chrono::seconds stall_timeout, std::chrono::milliseconds interval);
  ProgressReporter(SessionRegistry& registry, ProgressSink& sink, const core::Clock& clock);
  ~ProgressReporter() = default;

  /** Publishes if the interval has passed. Returns the number of snapshots published. */
  int Tick();
  /** Publishes now. Returns the number of snapshots published. */
  int Publish();

private:
  int PublishLocked(core::Clock::time_point now);

  struct Progress {
    int64_t transferred{0};
    core::Clock::time_point last_change;
    bool stall_reported{false};
  };

  SessionRegistry& registry_;
  ProgressSink& sink_;
  const core::Clock& clock_;
  const std::chrono::seconds stall_timeout_;
  const std::chrono::milliseconds interval_;
  std::mutex mu_;
  // GUARDED_BY(mu_)
  std::map<session_id_t, Progress> progress_;
  // GUARDED_BY(mu_)
  std::optional<core::Clock::time_point> last_publish_;
};

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_PROGRESS_REPORTER_H
