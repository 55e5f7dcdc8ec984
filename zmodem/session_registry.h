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
#ifndef INCLUDED_ZLINK_ZMODEM_SESSION_REGISTRY_H
#define INCLUDED_ZLINK_ZMODEM_SESSION_REGISTRY_H

#include "zmodem/protocol_engine.h"
#include "zmodem/zmodem_config.h"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace zlink::zmodem {

typedef int session_id_t;

/** A point in time view of one session, for progress display. */
struct TransferSnapshot {
  session_id_t session_id{0};
  std::string channel;
  TransferDirection direction{TransferDirection::download};
  std::string filename;
  int64_t transferred{0};
  /** Size of the file, when known. */
  std::optional<int64_t> total;
  /** 0-100; 0 while the size is unknown. */
  int percent{0};
  TransferState state{TransferState::Idle};
};

/** Builds the snapshot of engine. */
TransferSnapshot MakeSnapshot(session_id_t id, const std::string& channel,
                              const ProtocolEngine& engine);

/**
 * Owns the active sessions. Every session has its own lock, so feeding
 * bytes to a session and reading its progress never interleave, while
 * sessions on different channels proceed independently.
 */
class SessionRegistry final {
public:
  explicit SessionRegistry(const ZmodemConfig& config);
  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;
  ~SessionRegistry();

  /**
   * Creates a session for channel. For an upload, path is the file to send.
   * For a download, path is either a directory, in which case the name
   * comes from the peer, or the file to create. Throws transfer_error when
   * the file can not be opened or created.
   */
  session_id_t Create(const std::string& channel, TransferDirection direction,
                      const std::filesystem::path& path);
  session_id_t CreateUpload(const std::string& channel, const std::filesystem::path& path);
  session_id_t CreateDownload(const std::string& channel, const std::filesystem::path& path);
  /** Adds an engine created elsewhere. */
  session_id_t Add(const std::string& channel, std::unique_ptr<ProtocolEngine>&& engine);

  /**
   * Runs fn with the engine of id while holding the session's lock.
   * Returns false, without calling fn, when there is no such session.
   */
  bool WithSession(session_id_t id, const std::function<void(ProtocolEngine&)>& fn);

  [[nodiscard]] std::optional<TransferSnapshot> Snapshot(session_id_t id);
  [[nodiscard]] std::vector<TransferSnapshot> SnapshotAll();

  /**
   * Removes the session and closes its file before returning, whatever the
   * state of the engine. Returns false if there is no such session.
   */
  bool Remove(session_id_t id);

  [[nodiscard]] bool contains(session_id_t id) const;
  [[nodiscard]] std::vector<session_id_t> ids() const;
  [[nodiscard]] size_t size() const;
  [[nodiscard]] const ZmodemConfig& config() const noexcept { return config_; }

private:
  struct Slot {
    std::mutex mu;
    std::string channel;
    // GUARDED_BY(mu)
    std::unique_ptr<ProtocolEngine> engine;
  };

  std::shared_ptr<Slot> find(session_id_t id) const;

  const ZmodemConfig config_;
  mutable std::mutex mu_;
  // GUARDED_BY(mu_)
  std::map<session_id_t, std::shared_ptr<Slot>> sessions_;
  // GUARDED_BY(mu_)
  session_id_t next_id_{1};
};

} // namespace zlink::zmodem

#endif // INCLUDED_ZLINK_ZMODEM_SESSION_REGISTRY_H
