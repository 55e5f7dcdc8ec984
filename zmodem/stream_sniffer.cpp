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
#include "zmodem/stream_sniffer.h"

#include "core/log.h"
#include "core/strings.h"
#include <optional>
#include <string>
#include <utility>

using namespace zlink::core;
using namespace zlink::strings;

namespace zlink::zmodem {

// Most output chunks written by one drain task before letting input run.
static constexpr int kMaxChunksPerDrain = 16;

StreamSniffer::StreamSniffer(std::string channel, SessionRegistry& registry,
                             TransportAdapter& transport, TerminalDisplay& display,
                             TransferDelegate& delegate, LifecycleSink* lifecycle,
                             Executor& executor)
    : channel_(std::move(channel)), registry_(registry), transport_(transport),
      display_(display), delegate_(delegate), lifecycle_(lifecycle), executor_(executor),
      output_chunk_bytes_(static_cast<size_t>(registry.config().output_chunk_bytes)),
      detector_(static_cast<size_t>(registry.config().sniff_window_bytes)) {}

StreamSniffer::~StreamSniffer() {
  executor_.Flush();
  if (const auto id = active_session_.exchange(0); id != 0) {
    registry_.Remove(id);
  }
}

void StreamSniffer::OnData(std::string_view data) {
  if (data.empty()) {
    return;
  }
  executor_.Post([this, d = std::string(data)]() { Process(d); });
}

void StreamSniffer::OnTransportClosed() {
  executor_.Post([this]() {
    const auto id = active_session_.load();
    if (id == 0) {
      return;
    }
    registry_.WithSession(id, [](ProtocolEngine& e) {
      e.Abort(TransferErrorKind::transport_closed, "transport closed");
      // Nobody is listening for the cancel sequence.
      e.Pull(std::string::npos);
    });
    Finish();
  });
}

void StreamSniffer::Abort() {
  executor_.Post([this]() {
    const auto id = active_session_.load();
    if (id == 0) {
      return;
    }
    LOG(INFO) << "Cancelling session " << id << " on " << channel_;
    registry_.WithSession(
        id, [](ProtocolEngine& e) { e.Abort(TransferErrorKind::peer_abort, "cancelled locally"); });
    Drain();
  });
}

void StreamSniffer::Process(const std::string& data) {
  if (active_session_ == 0) {
    Passthrough(data);
    return;
  }
  FeedSession(data);
}

void StreamSniffer::Passthrough(const std::string& data) {
  auto r = detector_.Scan(data);
  if (!r.display.empty()) {
    display_.Display(r.display);
  }
  if (r.detection) {
    StartSession(r.detection->direction, r.detection->after);
  }
}

void StreamSniffer::StartSession(TransferDirection direction, const std::string& after) {
  const auto path = direction == TransferDirection::upload ? delegate_.UploadSource(channel_)
                                                           : delegate_.DownloadTarget(channel_);
  if (!path) {
    Decline(direction, "no file chosen");
    if (!after.empty()) {
      display_.Display(after);
    }
    return;
  }

  session_id_t id = 0;
  try {
    id = registry_.Create(channel_, direction, path.value());
  } catch (const transfer_error& e) {
    Decline(direction, e.what());
    if (lifecycle_) {
      TransferSnapshot s{};
      s.channel = channel_;
      s.direction = direction;
      s.filename = path->filename().string();
      s.state = TransferState::Failed;
      lifecycle_->OnTransferError(s, TransferErrorInfo{e.kind(), e.what()});
    }
    return;
  }
  active_session_ = id;
  if (auto s = registry_.Snapshot(id)) {
    last_snapshot_ = s.value();
    if (lifecycle_) {
      lifecycle_->OnTransferStarted(s.value());
    }
  }
  // Even with nothing to feed, the engine has its first frame queued.
  FeedSession(after);
}

void StreamSniffer::Decline(TransferDirection direction, const std::string& why) {
  LOG(INFO) << "Declining " << direction << " on " << channel_ << ": " << why;
  if (!transport_.Write(CancelSequence())) {
    LOG(WARNING) << "Unable to send the cancel sequence on " << channel_;
  }
  detector_.Reset();
}

void StreamSniffer::FeedSession(const std::string& data) {
  const auto id = active_session_.load();
  if (!data.empty()) {
    std::string leftover;
    if (!registry_.WithSession(id, [&](ProtocolEngine& e) { leftover = e.Feed(data); })) {
      SessionRemoved(data);
      return;
    }
    pending_passthrough_.append(leftover);
  }
  Drain();
}

void StreamSniffer::PostDrain() {
  if (drain_posted_) {
    return;
  }
  drain_posted_ = true;
  executor_.Post([this]() {
    drain_posted_ = false;
    Drain();
  });
}

void StreamSniffer::Drain() {
  const auto id = active_session_.load();
  if (id == 0) {
    return;
  }
  for (auto i = 0; i < kMaxChunksPerDrain; i++) {
    std::string out;
    auto more = false;
    auto finished = false;
    if (!registry_.WithSession(id, [&](ProtocolEngine& e) {
          out = e.Pull(output_chunk_bytes_);
          more = e.has_output();
          finished = e.finished();
          last_snapshot_ = MakeSnapshot(id, channel_, e);
        })) {
      SessionRemoved({});
      return;
    }
    if (!out.empty() && !transport_.Write(out)) {
      registry_.WithSession(id, [](ProtocolEngine& e) {
        e.Abort(TransferErrorKind::transport_closed, "unable to write to the transport");
      });
      Finish();
      return;
    }
    if (!more) {
      if (finished) {
        Finish();
      }
      return;
    }
  }
  // Let queued input, such as a ZRPOS, run before sending more.
  PostDrain();
}

void StreamSniffer::Finish() {
  const auto id = active_session_.exchange(0);
  if (id == 0) {
    return;
  }
  TransferSnapshot snapshot{};
  std::optional<TransferErrorInfo> error;
  if (!registry_.WithSession(id, [&](ProtocolEngine& e) {
        snapshot = MakeSnapshot(id, channel_, e);
        error = e.last_error();
      })) {
    snapshot = last_snapshot_;
    snapshot.state = TransferState::Failed;
    error = TransferErrorInfo{TransferErrorKind::peer_abort, "session removed"};
  }
  registry_.Remove(id);
  detector_.Reset();
  if (lifecycle_) {
    if (error) {
      lifecycle_->OnTransferError(snapshot, error.value());
    } else {
      lifecycle_->OnTransferCompleted(snapshot);
    }
  }
  if (!pending_passthrough_.empty()) {
    std::string pending;
    pending.swap(pending_passthrough_);
    Passthrough(pending);
  }
}

void StreamSniffer::SessionRemoved(const std::string& data) {
  const auto id = active_session_.exchange(0);
  if (id == 0) {
    return;
  }
  LOG(WARNING) << "Session " << id << " on " << channel_ << " was removed while active";
  detector_.Reset();
  if (lifecycle_) {
    auto snapshot = last_snapshot_;
    snapshot.state = TransferState::Failed;
    lifecycle_->OnTransferError(
        snapshot, TransferErrorInfo{TransferErrorKind::peer_abort, "session removed"});
  }
  std::string pending;
  pending.swap(pending_passthrough_);
  pending.append(data);
  if (!pending.empty()) {
    Passthrough(pending);
  }
}

} // namespace zlink::zmodem
