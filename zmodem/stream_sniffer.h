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
#ifndef INCLUDED_ZLINK_ZMODEM_STREAM_SNIFFER_H
#define INCLUDED_ZLINK_ZMODEM_STREAM_SNIFFER_H

#include "core/executor.h"
#include "zmodem/handshake.h"
#include "zmodem/session_registry.h"
#include "zmodem/sinks.h"
#include "zmodem/transport.h"
#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace zlink::zmodem {

/**
 * Sits between one transport channel and the terminal. Passes bytes to
 * the display until a handshake marker shows up, then routes the channel
 * to a ProtocolEngine until that session finishes.
 *
 * All work happens on executor, so file I/O never runs on the thread
 * delivering transport data.
 */
class StreamSniffer final {
public:
  StreamSniffer(std::string channel, SessionRegistry& registry, TransportAdapter& transport,
                TerminalDisplay& display, TransferDelegate& delegate, LifecycleSink* lifecycle,
                core::Executor& executor);
  /** Waits for posted work, then removes any active session. */
  ~StreamSniffer();

  StreamSniffer(const StreamSniffer&) = delete;
  StreamSniffer& operator=(const StreamSniffer&) = delete;

  /** Bytes from the remote peer. */
  void OnData(std::string_view data);
  /** The transport went away; fails the active session. */
  void OnTransportClosed();
  /** Cancels the active session, telling the peer. */
  void Abort();

  [[nodiscard]] bool in_protocol_mode() const noexcept { return active_session_ != 0; }
  /** The active session, or 0 in passthrough mode. */
  [[nodiscard]] session_id_t active_session() const noexcept { return active_session_; }
  [[nodiscard]] const std::string& channel() const noexcept { return channel_; }

private:
  void Process(const std::string& data);
  void Passthrough(const std::string& data);
  void StartSession(TransferDirection direction, const std::string& after);
  void FeedSession(const std::string& data);
  void Drain();
  void PostDrain();
  void Finish();
  /** The active session was removed from the registry by someone else. */
  void SessionRemoved(const std::string& data);
  void Decline(TransferDirection direction, const std::string& why);

  const std::string channel_;
  SessionRegistry& registry_;
  TransportAdapter& transport_;
  TerminalDisplay& display_;
  TransferDelegate& delegate_;
  LifecycleSink* lifecycle_;
  core::Executor& executor_;
  const size_t output_chunk_bytes_;

  // Everything below is only touched from tasks on executor_.
  HandshakeDetector detector_;
  // Last view of the active session, reported if it disappears.
  TransferSnapshot last_snapshot_;
  // Bytes that arrived after the session finished; shown once it is removed.
  std::string pending_passthrough_;
  bool drain_posted_{false};
  std::atomic<session_id_t> active_session_{0};
};

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_STREAM_SNIFFER_H
