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
#include "zmodem/session_registry.h"

#include "core/file.h"
#include "core/log.h"
#include "zmodem/receive_file.h"
#include "zmodem/wfile_transfer_file.h"
#include <algorithm>
#include <utility>

using namespace zlink::core;

namespace zlink::zmodem {

TransferSnapshot MakeSnapshot(session_id_t id, const std::string& channel,
                              const ProtocolEngine& engine) {
  TransferSnapshot s{};
  s.session_id = id;
  s.channel = channel;
  s.direction = engine.direction();
  s.filename = engine.filename();
  s.transferred = engine.transferred();
  s.total = engine.file_size();
  s.state = engine.state();
  if (s.total && s.total.value() > 0) {
    s.percent = static_cast<int>(std::min<int64_t>(100, s.transferred * 100 / s.total.value()));
  } else if (s.total && s.state == TransferState::Completed) {
    // An empty file.
    s.percent = 100;
  }
  return s;
}

SessionRegistry::SessionRegistry(const ZmodemConfig& config) : config_(config) {}

SessionRegistry::~SessionRegistry() {
  for (const auto id : ids()) {
    Remove(id);
  }
}

session_id_t SessionRegistry::Create(const std::string& channel, TransferDirection direction,
                                     const std::filesystem::path& path) {
  if (direction == TransferDirection::upload) {
    return CreateUpload(channel, path);
  }
  return CreateDownload(channel, path);
}

session_id_t SessionRegistry::CreateUpload(const std::string& channel,
                                           const std::filesystem::path& path) {
  LOG(INFO) << "Starting upload of " << path.string() << " on " << channel;
  return Add(channel, ProtocolEngine::ForUpload(WFileTransferFile::OpenForSend(path), config_));
}

session_id_t SessionRegistry::CreateDownload(const std::string& channel,
                                             const std::filesystem::path& path) {
  if (File::is_directory(path)) {
    LOG(INFO) << "Starting download into " << path.string() << " on " << channel;
    return Add(channel, ProtocolEngine::ForDownload(DirectoryReceiveFileFactory(path), config_));
  }
  LOG(INFO) << "Starting download to " << path.string() << " on " << channel;
  return Add(channel,
             ProtocolEngine::ForDownload(WFileTransferFile::CreateForReceive(path), config_));
}

session_id_t SessionRegistry::Add(const std::string& channel,
                                  std::unique_ptr<ProtocolEngine>&& engine) {
  auto slot = std::make_shared<Slot>();
  slot->channel = channel;
  slot->engine = std::move(engine);
  std::lock_guard<std::mutex> lock(mu_);
  const auto id = next_id_++;
  sessions_.emplace(id, std::move(slot));
  VLOG(1) << "SessionRegistry: added session " << id << " on " << channel;
  return id;
}

std::shared_ptr<SessionRegistry::Slot> SessionRegistry::find(session_id_t id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = sessions_.find(id);
  if (it == std::end(sessions_)) {
    return nullptr;
  }
  return it->second;
}

bool SessionRegistry::WithSession(session_id_t id,
                                  const std::function<void(ProtocolEngine&)>& fn) {
  auto slot = find(id);
  if (!slot) {
    return false;
  }
  std::lock_guard<std::mutex> lock(slot->mu);
  if (!slot->engine) {
    // Removed while we were waiting for the lock.
    return false;
  }
  fn(*slot->engine);
  return true;
}

std::optional<TransferSnapshot> SessionRegistry::Snapshot(session_id_t id) {
  auto slot = find(id);
  if (!slot) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(slot->mu);
  if (!slot->engine) {
    return std::nullopt;
  }
  return MakeSnapshot(id, slot->channel, *slot->engine);
}

std::vector<TransferSnapshot> SessionRegistry::SnapshotAll() {
  std::vector<TransferSnapshot> result;
  for (const auto id : ids()) {
    if (auto s = Snapshot(id)) {
      result.emplace_back(std::move(s.value()));
    }
  }
  return result;
}

bool SessionRegistry::Remove(session_id_t id) {
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = sessions_.find(id);
    if (it == std::end(sessions_)) {
      return false;
    }
    slot = std::move(it->second);
    sessions_.erase(it);
  }
  std::lock_guard<std::mutex> lock(slot->mu);
  if (slot->engine) {
    if (!slot->engine->CloseFile()) {
      LOG(WARNING) << "Error closing the file of session " << id;
    }
    slot->engine.reset();
  }
  VLOG(1) << "SessionRegistry: removed session " << id;
  return true;
}

bool SessionRegistry::contains(session_id_t id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return sessions_.find(id) != std::end(sessions_);
}

std::vector<session_id_t> SessionRegistry::ids() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<session_id_t> result;
  for (const auto& [id, _] : sessions_) {
    result.push_back(id);
  }
  return result;
}

size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sessions_.size();
}

} // namespace zlink::zmodem
