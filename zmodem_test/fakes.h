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
#ifndef INCLUDED_ZLINK_ZMODEM_TEST_FAKES_H
#define INCLUDED_ZLINK_ZMODEM_TEST_FAKES_H

#include "zmodem/frame.h"
#include "zmodem/protocol_engine.h"
#include "zmodem/session_registry.h"
#include "zmodem/sinks.h"
#include "zmodem/transfer_error.h"
#include "zmodem/transport.h"
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class FakeTransport : public zlink::zmodem::TransportAdapter {
public:
  FakeTransport() = default;
  ~FakeTransport() override = default;

  bool Write(std::string_view data) override;
  [[nodiscard]] bool is_open() const override;

  /** Returns everything written since the last call. */
  std::string Take();
  [[nodiscard]] std::string written() const;
  [[nodiscard]] int write_count() const;
  void close();

private:
  mutable std::mutex mu_;
  // GUARDED_BY(mu_)
  std::string pending_;
  // GUARDED_BY(mu_)
  std::string written_;
  // GUARDED_BY(mu_)
  int write_count_{0};
  // GUARDED_BY(mu_)
  bool open_{true};
};

class FakeDisplay : public zlink::zmodem::TerminalDisplay {
public:
  void Display(std::string_view data) override;
  [[nodiscard]] std::string shown() const;

private:
  mutable std::mutex mu_;
  std::string shown_;
};

class FakeDelegate : public zlink::zmodem::TransferDelegate {
public:
  std::optional<std::filesystem::path> UploadSource(const std::string& channel) override;
  std::optional<std::filesystem::path> DownloadTarget(const std::string& channel) override;

  std::optional<std::filesystem::path> upload;
  std::optional<std::filesystem::path> download;
  int upload_requests{0};
  int download_requests{0};
};

class FakeLifecycleSink : public zlink::zmodem::LifecycleSink {
public:
  void OnTransferStarted(const zlink::zmodem::TransferSnapshot& snapshot) override;
  void OnTransferCompleted(const zlink::zmodem::TransferSnapshot& snapshot) override;
  void OnTransferError(const zlink::zmodem::TransferSnapshot& snapshot,
                       const zlink::zmodem::TransferErrorInfo& error) override;

  std::vector<zlink::zmodem::TransferSnapshot> started;
  std::vector<zlink::zmodem::TransferSnapshot> completed;
  std::vector<std::pair<zlink::zmodem::TransferSnapshot, zlink::zmodem::TransferErrorInfo>>
      errors;
};

class FakeProgressSink : public zlink::zmodem::ProgressSink {
public:
  void OnProgress(const zlink::zmodem::TransferSnapshot& snapshot) override;
  void OnStalled(zlink::zmodem::session_id_t session_id, int idle_seconds) override;

  std::vector<zlink::zmodem::TransferSnapshot> progress;
  std::vector<std::pair<zlink::zmodem::session_id_t, int>> stalls;
};

/** Encodes a header only frame the way our engines send them. */
std::string EncodeHeader(zlink::zmodem::FrameType type, uint32_t flags = 0,
                         zlink::zmodem::FrameEncoding encoding = zlink::zmodem::FrameEncoding::bin32);

/** Encodes a ZDATA subpacket at offset. */
std::string EncodeData(uint32_t offset, const std::string& data,
                       uint8_t end_marker = zlink::zmodem::ZCRCG);

/** Decodes every complete frame in data. */
std::vector<zlink::zmodem::Frame> DecodeAll(const std::string& data);

/**
 * Moves bytes between two engines until neither has anything more to say.
 * Returns the number of rounds used.
 */
int Pump(zlink::zmodem::ProtocolEngine& a, zlink::zmodem::ProtocolEngine& b,
         int max_rounds = 10000);

#endif // INCLUDED_ZLINK_ZMODEM_TEST_FAKES_H
