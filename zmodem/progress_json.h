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
#ifndef INCLUDED_ZLINK_ZMODEM_PROGRESS_JSON_H
#define INCLUDED_ZLINK_ZMODEM_PROGRESS_JSON_H

#include "zmodem/protocol_engine.h"
#include "zmodem/session_registry.h"
#include "zmodem/sinks.h"
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

namespace zlink::zmodem {

/** One line of the JSON event stream read by a UI bridge. */
struct TransferEvent {
  /** One of: started, progress, stalled, completed, error. */
  std::string event;
  session_id_t session_id{0};
  std::string channel;
  TransferDirection direction{TransferDirection::download};
  std::string filename;
  int64_t transferred{0};
  /** -1 when the size is unknown. */
  int64_t total{-1};
  int percent{0};
  TransferState state{TransferState::Idle};
  int idle_seconds{0};
  std::string error_kind;
  std::string error;
};

TransferEvent ToTransferEvent(const std::string& event, const TransferSnapshot& s);

/** Serializes e as one line of JSON, without the trailing newline. */
std::string ToJsonLine(const TransferEvent& e);

/** Writes progress and lifecycle events to out as JSON lines. */
class JsonEventSink final : public ProgressSink, public LifecycleSink {
public:
  explicit JsonEventSink(std::ostream& out);
  ~JsonEventSink() override = default;

  void OnProgress(const TransferSnapshot& snapshot) override;
  void OnStalled(session_id_t session_id, int idle_seconds) override;
  void OnTransferStarted(const TransferSnapshot& snapshot) override;
  void OnTransferCompleted(const TransferSnapshot& snapshot) override;
  void OnTransferError(const TransferSnapshot& snapshot, const TransferErrorInfo& error) override;

private:
  void Write(const TransferEvent& e);

  std::mutex mu_;
  std::ostream& out_;
};

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_PROGRESS_JSON_H
