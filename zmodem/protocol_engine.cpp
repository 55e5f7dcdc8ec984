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
#include "zmodem/protocol_engine.h"

#include "core/log.h"
#include "core/strings.h"
#include "zmodem/file_header.h"
#include "fmt/format.h"
#include <algorithm>
#include <string>
#include <utility>

using namespace zlink::core;
using namespace zlink::strings;

namespace zlink::zmodem {

std::string to_string(TransferDirection d) {
  switch (d) {
  case TransferDirection::upload:
    return "upload";
  case TransferDirection::download:
    return "download";
  }
  return "unknown";
}

std::string to_string(TransferState s) {
  switch (s) {
  case TransferState::Idle:
    return "Idle";
  case TransferState::SendingHeader:
    return "SendingHeader";
  case TransferState::SendingData:
    return "SendingData";
  case TransferState::SendingEof:
    return "SendingEof";
  case TransferState::ReceivingHeader:
    return "ReceivingHeader";
  case TransferState::ReceivingData:
    return "ReceivingData";
  case TransferState::Completed:
    return "Completed";
  case TransferState::Failed:
    return "Failed";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, TransferDirection d) {
  os << to_string(d);
  return os;
}

std::ostream& operator<<(std::ostream& os, TransferState s) {
  os << to_string(s);
  return os;
}

std::string CancelSequence() {
  std::string s(8, static_cast<char>(CAN));
  s.append(10, static_cast<char>(BACKSPACE));
  return s;
}

static uint32_t receiver_capabilities(bool use_crc32) {
  return CANFDX | CANOVIO | CANBRK | (use_crc32 ? CANFC32 : 0);
}

ProtocolEngine::ProtocolEngine(TransferDirection direction, const ZmodemConfig& config)
    : direction_(direction), chunk_size_(config.chunk_size),
      encoding_(config.use_crc32 ? FrameEncoding::bin32 : FrameEncoding::bin16),
      reader_(config.codec_options(), static_cast<size_t>(config.max_garbage_bytes),
              static_cast<size_t>(config.garbage_tail_bytes)) {}

ProtocolEngine::~ProtocolEngine() { CloseFile(); }

// static
std::unique_ptr<ProtocolEngine> ProtocolEngine::ForUpload(std::unique_ptr<TransferFile>&& file,
                                                          const ZmodemConfig& config) {
  CHECK(file) << "ForUpload needs a file";
  std::unique_ptr<ProtocolEngine> e(new ProtocolEngine(TransferDirection::upload, config));
  e->filename_ = file->filename();
  e->file_size_ = file->file_size();
  e->file_ = std::move(file);

  auto header = MakeFrame(FrameType::ZFILE);
  header.payload = BuildFileHeaderPayload(e->filename_, e->file_size_.value_or(0));
  header.end_marker = ZCRCW;
  e->Queue(std::move(header));
  e->SetState(TransferState::SendingHeader);
  return e;
}

// static
std::unique_ptr<ProtocolEngine> ProtocolEngine::ForDownload(std::unique_ptr<TransferFile>&& file,
                                                            const ZmodemConfig& config) {
  CHECK(file) << "ForDownload needs a file";
  std::unique_ptr<ProtocolEngine> e(new ProtocolEngine(TransferDirection::download, config));
  e->filename_ = file->filename();
  e->file_ = std::move(file);
  e->Queue(MakeFrame(FrameType::ZRINIT, receiver_capabilities(config.use_crc32)));
  e->SetState(TransferState::ReceivingHeader);
  return e;
}

// static
std::unique_ptr<ProtocolEngine> ProtocolEngine::ForDownload(receive_file_factory_t factory,
                                                            const ZmodemConfig& config) {
  CHECK(factory) << "ForDownload needs a receive file factory";
  std::unique_ptr<ProtocolEngine> e(new ProtocolEngine(TransferDirection::download, config));
  e->receive_file_factory_ = std::move(factory);
  e->Queue(MakeFrame(FrameType::ZRINIT, receiver_capabilities(config.use_crc32)));
  e->SetState(TransferState::ReceivingHeader);
  return e;
}

std::string ProtocolEngine::Feed(std::string_view data) {
  if (finished()) {
    return std::string(data);
  }
  for (size_t i = 0; i < data.size(); i++) {
    if (static_cast<uint8_t>(data[i]) != CAN) {
      can_count_ = 0;
      continue;
    }
    if (++can_count_ >= kCancelCount) {
      reader_.Clear();
      Fail(TransferErrorKind::peer_abort, "remote cancelled the transfer");
      auto rest = data.substr(i + 1);
      // The rest of the cancel sequence belongs to the session too.
      while (!rest.empty() &&
             (static_cast<uint8_t>(rest.front()) == CAN || rest.front() == BACKSPACE)) {
        rest.remove_prefix(1);
      }
      return std::string(rest);
    }
  }

  reader_.Append(data);
  while (!finished()) {
    auto f = reader_.Next();
    if (!f) {
      break;
    }
    HandleFrame(f.value());
  }
  if (finished()) {
    return reader_.Take();
  }
  return {};
}

std::string ProtocolEngine::Pull(size_t max_bytes) {
  if (out_.empty() && state_ == TransferState::SendingData && !awaiting_final_ack_) {
    QueueNextChunk();
  }
  if (out_.size() <= max_bytes) {
    std::string result;
    result.swap(out_);
    return result;
  }
  auto result = out_.substr(0, max_bytes);
  out_.erase(0, max_bytes);
  return result;
}

bool ProtocolEngine::has_output() const noexcept {
  return !out_.empty() || (state_ == TransferState::SendingData && !awaiting_final_ack_);
}

void ProtocolEngine::Abort(TransferErrorKind kind, const std::string& message) {
  if (finished()) {
    return;
  }
  Fail(kind, message);
  out_ = CancelSequence();
}

bool ProtocolEngine::CloseFile() {
  if (!file_ || file_closed_) {
    return true;
  }
  file_closed_ = true;
  return file_->Close();
}

void ProtocolEngine::HandleFrame(const Frame& f) {
  VLOG(2) << "RECV: " << f;
  if (HandlePeerFailure(f)) {
    return;
  }
  if (direction_ == TransferDirection::upload) {
    HandleUploadFrame(f);
  } else {
    HandleDownloadFrame(f);
  }
}

bool ProtocolEngine::HandlePeerFailure(const Frame& f) {
  switch (f.type) {
  case FrameType::ZNAK:
    Fail(TransferErrorKind::peer_nak, "remote sent ZNAK");
    return true;
  case FrameType::ZABORT:
  case FrameType::ZCAN:
    Fail(TransferErrorKind::peer_abort,
         StrCat("remote aborted the transfer (", frame_type_name(f.type), ")"));
    return true;
  case FrameType::ZFERR:
    Fail(TransferErrorKind::peer_abort, "remote reported a file error");
    return true;
  case FrameType::ZSKIP:
    if (direction_ == TransferDirection::upload) {
      Fail(TransferErrorKind::peer_abort, "remote skipped file");
      return true;
    }
    return false;
  default:
    return false;
  }
}

void ProtocolEngine::HandleUploadFrame(const Frame& f) {
  switch (state_) {
  case TransferState::SendingHeader:
    switch (f.type) {
    case FrameType::ZRINIT:
    case FrameType::ZACK:
    case FrameType::ZRPOS:
      ConfirmFileHeader(f);
      return;
    default:
      break;
    }
    break;
  case TransferState::SendingData:
    switch (f.type) {
    case FrameType::ZRPOS:
      Rewind(f.flags);
      return;
    case FrameType::ZACK:
      if (awaiting_final_ack_ && f.flags >= file_size_.value_or(0)) {
        awaiting_final_ack_ = false;
        Queue(MakeFrame(FrameType::ZEOF, static_cast<uint32_t>(position_)));
        SetState(TransferState::SendingEof);
      }
      // Acks for earlier subpackets need nothing.
      return;
    case FrameType::ZRINIT:
      VLOG(1) << "Ignoring ZRINIT while sending data";
      return;
    default:
      break;
    }
    break;
  case TransferState::SendingEof:
    switch (f.type) {
    case FrameType::ZACK:
    case FrameType::ZRINIT:
    case FrameType::ZFIN:
      Queue(MakeFrame(FrameType::ZFIN));
      Complete();
      return;
    case FrameType::ZRPOS:
      Rewind(f.flags);
      SetState(TransferState::SendingData);
      return;
    default:
      break;
    }
    break;
  default:
    break;
  }
  Unexpected(f);
}

void ProtocolEngine::ConfirmFileHeader(const Frame& f) {
  VLOG(1) << "File header for " << filename_ << " confirmed by " << frame_type_name(f.type);
  if (f.type == FrameType::ZRPOS) {
    Rewind(f.flags);
  }
  if (file_size_.value_or(0) == 0) {
    Queue(MakeFrame(FrameType::ZEOF, 0));
    SetState(TransferState::SendingEof);
    return;
  }
  SetState(TransferState::SendingData);
}

void ProtocolEngine::Rewind(uint32_t offset) {
  const auto size = file_size_.value_or(0);
  const auto pos = std::min<int64_t>(offset, size);
  if (pos != position_) {
    VLOG(1) << "Repositioning " << filename_ << " from " << position_ << " to " << pos;
  }
  position_ = pos;
  awaiting_final_ack_ = false;
  // Frames already queued were sent from the old position.
  out_.clear();
}

void ProtocolEngine::QueueNextChunk() {
  const auto size = file_size_.value_or(0);
  const auto len = static_cast<int>(std::min<int64_t>(chunk_size_, size - position_));
  if (len <= 0) {
    // Nothing left, i.e. after a ZRPOS to the end of the file.
    Queue(MakeFrame(FrameType::ZEOF, static_cast<uint32_t>(position_)));
    SetState(TransferState::SendingEof);
    return;
  }
  auto f = MakeFrame(FrameType::ZDATA, static_cast<uint32_t>(position_));
  f.payload.resize(static_cast<size_t>(len));
  if (!file_->GetChunk(&f.payload[0], position_, len)) {
    Fail(TransferErrorKind::file_io,
         fmt::format("Error reading {} at {}: {}", filename_, position_, file_->last_error()));
    return;
  }
  position_ += len;
  const auto last = position_ >= size;
  f.end_marker = last ? ZCRCW : ZCRCG;
  Queue(std::move(f));
  transferred_ = std::max(transferred_, position_);
  if (last) {
    awaiting_final_ack_ = true;
  }
}

void ProtocolEngine::HandleDownloadFrame(const Frame& f) {
  switch (f.type) {
  case FrameType::ZRQINIT:
    if (state_ == TransferState::ReceivingHeader) {
      VLOG(1) << "Peer repeated ZRQINIT; sending ZRINIT again";
      Queue(MakeFrame(FrameType::ZRINIT, receiver_capabilities(encoding_ == FrameEncoding::bin32)));
      return;
    }
    break;
  case FrameType::ZSINIT:
    Queue(MakeFrame(FrameType::ZACK, 0));
    return;
  case FrameType::ZFILE:
    if (state_ == TransferState::ReceivingHeader) {
      HandleFileHeader(f);
      return;
    }
    if (state_ == TransferState::ReceivingData) {
      // Our ZACK was lost.
      Queue(MakeFrame(FrameType::ZACK, static_cast<uint32_t>(position_)));
      return;
    }
    break;
  case FrameType::ZDATA:
    if (state_ == TransferState::ReceivingData) {
      HandleData(f);
      return;
    }
    break;
  case FrameType::ZEOF:
    if (state_ == TransferState::ReceivingData) {
      HandleEof(f);
      return;
    }
    break;
  case FrameType::ZFIN:
    Queue(MakeFrame(FrameType::ZFIN));
    if (FlushFile()) {
      Complete();
    }
    return;
  default:
    break;
  }
  Unexpected(f);
}

void ProtocolEngine::HandleFileHeader(const Frame& f) {
  auto header = ParseFileHeader(f.payload);
  if (!header) {
    LOG(WARNING) << "Malformed ZFILE header: " << printable_bytes(f.payload);
    return;
  }
  if (!file_) {
    try {
      file_ = receive_file_factory_(header.value());
    } catch (const transfer_error& e) {
      Fail(e.kind(), e.what());
      return;
    }
    if (!file_) {
      Fail(TransferErrorKind::file_io, StrCat("No file to receive ", header->filename));
      return;
    }
  }
  filename_ = header->filename;
  file_size_ = header->size;
  position_ = 0;
  VLOG(1) << "Receiving " << filename_ << " size: "
          << (file_size_ ? std::to_string(file_size_.value()) : "unknown");
  SetState(TransferState::ReceivingData);
  Queue(MakeFrame(FrameType::ZACK, 0));
}

void ProtocolEngine::HandleData(const Frame& f) {
  if (f.flags != position_) {
    VLOG(1) << "ZDATA at " << f.flags << " while expecting " << position_;
    if (!rpos_sent_) {
      rpos_sent_ = true;
      Queue(MakeFrame(FrameType::ZRPOS, static_cast<uint32_t>(position_)));
    }
    return;
  }
  rpos_sent_ = false;
  if (!f.payload.empty()) {
    if (!file_->WriteChunk(f.payload.data(), static_cast<int>(f.payload.size()))) {
      Fail(TransferErrorKind::file_io,
           fmt::format("Error writing {}: {}", filename_, file_->last_error()));
      return;
    }
    position_ += static_cast<int64_t>(f.payload.size());
    transferred_ = std::max(transferred_, position_);
  }
  Queue(MakeFrame(FrameType::ZACK, static_cast<uint32_t>(position_)));
}

void ProtocolEngine::HandleEof(const Frame& f) {
  if (f.flags != position_) {
    VLOG(1) << "ZEOF at " << f.flags << " while at " << position_;
    if (!rpos_sent_) {
      rpos_sent_ = true;
      Queue(MakeFrame(FrameType::ZRPOS, static_cast<uint32_t>(position_)));
    }
    return;
  }
  if (!FlushFile()) {
    return;
  }
  Complete();
  Queue(MakeFrame(FrameType::ZACK, static_cast<uint32_t>(position_)));
  Queue(MakeFrame(FrameType::ZFIN));
}

bool ProtocolEngine::FlushFile() {
  if (!file_ || file_closed_) {
    return true;
  }
  if (!file_->Flush()) {
    Fail(TransferErrorKind::file_io,
         fmt::format("Error flushing {}: {}", filename_, file_->last_error()));
    return false;
  }
  return true;
}

void ProtocolEngine::Queue(Frame f) {
  f.encoding = encoding_;
  VLOG(2) << "SEND: " << f;
  out_.append(EncodeFrame(f));
}

void ProtocolEngine::Unexpected(const Frame& f) {
  VLOG(1) << "Ignoring unexpected " << frame_type_name(f.type) << " in state " << state_;
}

void ProtocolEngine::SetState(TransferState s) {
  if (s == state_) {
    return;
  }
  VLOG(1) << "ProtocolEngine(" << direction_ << "): " << state_ << " -> " << s;
  state_ = s;
}

void ProtocolEngine::Complete() {
  SetState(TransferState::Completed);
  LOG(INFO) << "Transfer of " << filename_ << " complete; " << transferred_ << " bytes";
}

void ProtocolEngine::Fail(TransferErrorKind kind, const std::string& message) {
  LOG(ERROR) << "Transfer of " << (filename_.empty() ? "<unknown>" : filename_)
             << " failed: " << kind << ": " << message;
  last_error_ = TransferErrorInfo{kind, message};
  awaiting_final_ack_ = false;
  if (kind == TransferErrorKind::file_io) {
    // Tell the peer to stop sending.
    out_ = CancelSequence();
  } else {
    out_.clear();
  }
  SetState(TransferState::Failed);
}

} // namespace zlink::zmodem
