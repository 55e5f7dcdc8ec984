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
#include "zmodem/progress_reporter.h"

#include "core/log.h"
#include <set>

using namespace std::chrono;
using namespace zlink::core;

namespace zlink::zmodem {

ProgressReporter::ProgressReporter(SessionRegistry& registry, ProgressSink& sink,
                                   const Clock& clock, std::chrono::seconds stall_timeout,
                                   std::chrono::milliseconds interval)
    : registry_(registry), sink_(sink), clock_(clock), stall_timeout_(stall_timeout),
      interval_(interval) {}

ProgressReporter::ProgressReporter(SessionRegistry& registry, ProgressSink& sink,
                                   const Clock& clock)
    : ProgressReporter(registry, sink, clock,
                       seconds(registry.config().stall_timeout_seconds),
                       milliseconds(registry.config().progress_interval_millis)) {}

int ProgressReporter::Tick() {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = clock_.Now();
  if (last_publish_ && now - last_publish_.value() < interval_) {
    return 0;
  }
  return PublishLocked(now);
}

int ProgressReporter::Publish() {
  std::lock_guard<std::mutex> lock(mu_);
  return PublishLocked(clock_.Now());
}

int ProgressReporter::PublishLocked(Clock::time_point now) {
  last_publish_ = now;
  const auto snapshots = registry_.SnapshotAll();
  std::set<session_id_t> seen;
  for (const auto& s : snapshots) {
    seen.insert(s.session_id);
    sink_.OnProgress(s);

    auto it = progress_.find(s.session_id);
    if (it == std::end(progress_)) {
      progress_.emplace(s.session_id, Progress{s.transferred, now, false});
      continue;
    }
    auto& p = it->second;
    if (p.transferred != s.transferred) {
      p.transferred = s.transferred;
      p.last_change = now;
      p.stall_reported = false;
      continue;
    }
    if (s.state == TransferState::Completed || s.state == TransferState::Failed) {
      continue;
    }
    const auto idle = duration_cast<seconds>(now - p.last_change);
    if (!p.stall_reported && idle >= stall_timeout_) {
      p.stall_reported = true;
      LOG(WARNING) << "Session " << s.session_id << " (" << s.filename << ") stalled for "
                   << idle.count() << " seconds";
      sink_.OnStalled(s.session_id, static_cast<int>(idle.count()));
    }
  }
  for (auto it = std::begin(progress_); it != std::end(progress_);) {
    if (seen.find(it->first) == std::end(seen)) {
      it = progress_.erase(it);
    } else {
      ++it;
    }
  }
  return static_cast<int>(snapshots.size());
}

} // namespace zlink::zmodem
