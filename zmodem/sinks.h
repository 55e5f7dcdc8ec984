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
#ifndef INCLUDED_ZLINK_ZMODEM_SINKS_H
#define INCLUDED_ZLINK_ZMODEM_SINKS_H

#include "zmodem/protocol_engine.h"
#include "zmodem/session_registry.h"
#include "zmodem/transfer_error.h"
#include <filesystem>
#include <optional>
#include <string>

namespace zlink::zmodem {

class ProgressSink {
public:
  virtual ~ProgressSink() = default;
  virtual void OnProgress(const TransferSnapshot& snapshot) = 0;
  /** The session made no progress for idle_seconds. Reported once per stall. */
  virtual void OnStalled(session_id_t session_id, int idle_seconds) = 0;
};

class LifecycleSink {
public:
  virtual ~LifecycleSink() = default;
  virtual void OnTransferStarted(const TransferSnapshot&) {}
  virtual void OnTransferCompleted(const TransferSnapshot& snapshot) = 0;
  /** Called once for a session that failed. */
  virtual void OnTransferError(const TransferSnapshot& snapshot,
                               const TransferErrorInfo& error) = 0;
};

/**
 * Sets up a transfer once a handshake is detected, usually by asking the
 * user. Returning std::nullopt declines the transfer.
 */
class TransferDelegate {
public:
  virtual ~TransferDelegate() = default;
  /** The file to send to the peer. */
  virtual std::optional<std::filesystem::path> UploadSource(const std::string& channel) = 0;
  /** A directory to receive into, or the file to create. */
  virtual std::optional<std::filesystem::path> DownloadTarget(const std::string& channel) = 0;
};

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_SINKS_H
