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
#include "zmodem_test/fakes.h"

#include "zmodem/frame_codec.h"

using namespace zlink::zmodem;

bool FakeTransport::Write(std::string_view data) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!open_) {
    return false;
  }
  pending_.append(data.data(), data.size());
  written_.append(data.data(), data.size());
  write_count_++;
  return true;
}

bool FakeTransport::is_open() const {
  std::lock_guard<std::mutex> lock(mu_);
  return open_;
}

std::string FakeTransport::Take() {
  std::lock_guard<std::mutex> lock(mu_);
  std::string out;
  out.swap(pending_);
  return out;
}

std::string FakeTransport::written() const {
  std::lock_guard<std::mutex> lock(mu_);
  return written_;
}

int FakeTransport::write_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return write_count_;
}

void FakeTransport::close() {
  std::lock_guard<std::mutex> lock(mu_);
  open_ = false;
}

void FakeDisplay::Display(std::string_view data) {
  std::lock_guard<std::mutex> lock(mu_);
  shown_.append(data.data(), data.size());
}

std::string FakeDisplay::shown() const {
  std::lock_guard<std::mutex> lock(mu_);
  return shown_;
}

std::optional<std::filesystem::path> FakeDelegate::UploadSource(const std::string&) {
  upload_requests++;
  return upload;
}

std::optional<std::filesystem::path> FakeDelegate::DownloadTarget(const std::string&) {
  download_requests++;
  return download;
}

void FakeLifecycleSink::OnTransferStarted(const TransferSnapshot& snapshot) {
  started.push_back(snapshot);
}

void FakeLifecycleSink::OnTransferCompleted(const TransferSnapshot& snapshot) {
  completed.push_back(snapshot);
}

void FakeLifecycleSink::OnTransferError(const TransferSnapshot& snapshot,
                                        const TransferErrorInfo& error) {
  errors.emplace_back(snapshot, error);
}

void FakeProgressSink::OnProgress(const TransferSnapshot& snapshot) {
  progress.push_back(snapshot);
}

void FakeProgressSink::OnStalled(session_id_t session_id, int idle_seconds) {
  stalls.emplace_back(session_id, idle_seconds);
}

std::string EncodeHeader(FrameType type, uint32_t flags, FrameEncoding encoding) {
  auto f = MakeFrame(type, flags);
  f.encoding = encoding;
  return EncodeFrame(f);
}

std::string EncodeData(uint32_t offset, const std::string& data, uint8_t end_marker) {
  auto f = MakeFrame(FrameType::ZDATA, offset);
  f.payload = data;
  f.end_marker = end_marker;
  return EncodeFrame(f);
}

std::vector<Frame> DecodeAll(const std::string& data) {
  FrameReader reader;
  reader.Append(data);
  std::vector<Frame> frames;
  while (auto f = reader.Next()) {
    frames.push_back(f.value());
  }
  return frames;
}

int Pump(ProtocolEngine& a, ProtocolEngine& b, int max_rounds) {
  for (auto round = 0; round < max_rounds; round++) {
    const auto a_to_b = a.Pull(4096);
    const auto b_to_a = b.Pull(4096);
    if (a_to_b.empty() && b_to_a.empty()) {
      return round;
    }
    b.Feed(a_to_b);
    a.Feed(b_to_a);
  }
  return max_rounds;
}
