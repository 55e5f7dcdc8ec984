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
#include "core/clock.h"
#include "core/command_line.h"
#include "core/executor.h"
#include "core/file.h"
#include "core/log.h"
#include "core/scope_exit.h"
#include "core/strings.h"
#include "fmt/format.h"
#include "zmodem/progress_json.h"
#include "zmodem/progress_reporter.h"
#include "zmodem/session_registry.h"
#include "zmodem/sinks.h"
#include "zmodem/stream_sniffer.h"
#include "zmodem/transport.h"
#include "zmodem/zmodem_config.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <poll.h>
#include <unistd.h>

using namespace zlink::core;
using namespace zlink::strings;
using namespace zlink::zmodem;

// How long one poll of stdin waits, and so how often progress is checked.
static constexpr int kPollMillis = 100;
static constexpr size_t kReadBufferSize = 16384;

static bool write_fully(int fd, std::string_view data) {
  while (!data.empty()) {
    const auto n = ::write(fd, data.data(), data.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data.remove_prefix(static_cast<size_t>(n));
  }
  return true;
}

// The remote end is whatever is connected to stdout, i.e. an ssh client.
class StdoutTransport final : public TransportAdapter {
public:
  StdoutTransport() = default;
  bool Write(std::string_view data) override {
    if (!open_) {
      return false;
    }
    if (!write_fully(STDOUT_FILENO, data)) {
      LOG(ERROR) << "Error writing to stdout: " << strerror(errno);
      open_ = false;
    }
    return open_;
  }
  [[nodiscard]] bool is_open() const override { return open_; }

private:
  bool open_{true};
};

class StderrDisplay final : public TerminalDisplay {
public:
  void Display(std::string_view data) override { write_fully(STDERR_FILENO, data); }
};

class CommandLineDelegate final : public TransferDelegate {
public:
  CommandLineDelegate(std::string upload, std::string download_dir)
      : upload_(std::move(upload)), download_dir_(std::move(download_dir)) {}

  std::optional<std::filesystem::path> UploadSource(const std::string& channel) override {
    if (upload_.empty()) {
      LOG(WARNING) << "Remote is waiting for a file on " << channel
                   << " but no --upload was given.";
      return std::nullopt;
    }
    // Only send the file once.
    std::filesystem::path p{upload_};
    upload_.clear();
    return p;
  }

  std::optional<std::filesystem::path> DownloadTarget(const std::string&) override {
    return std::filesystem::path(download_dir_.empty() ? "." : download_dir_);
  }

private:
  std::string upload_;
  const std::string download_dir_;
};

class LoggingSink final : public ProgressSink, public LifecycleSink {
public:
  explicit LoggingSink(JsonEventSink* json) : json_(json) {}

  void OnProgress(const TransferSnapshot& s) override {
    VLOG(1) << s.filename << ": " << s.transferred << " bytes (" << s.percent << "%)";
    if (json_) {
      json_->OnProgress(s);
    }
  }
  void OnStalled(session_id_t session_id, int idle_seconds) override {
    if (json_) {
      json_->OnStalled(session_id, idle_seconds);
    }
  }
  void OnTransferStarted(const TransferSnapshot& s) override {
    LOG(INFO) << "Started " << s.direction << " of " << s.filename;
    if (json_) {
      json_->OnTransferStarted(s);
    }
  }
  void OnTransferCompleted(const TransferSnapshot& s) override {
    LOG(INFO) << "Completed " << s.direction << " of " << s.filename << "; " << s.transferred
              << " bytes";
    if (json_) {
      json_->OnTransferCompleted(s);
    }
  }
  void OnTransferError(const TransferSnapshot& s, const TransferErrorInfo& e) override {
    LOG(ERROR) << "Failed " << s.direction << " of " << s.filename << ": " << e.kind << ": "
               << e.message;
    if (json_) {
      json_->OnTransferError(s, e);
    }
  }

private:
  JsonEventSink* json_;
};

static void RegisterZlinkCommands(CommandLine& cmdline) {
  cmdline.add_argument({"config", "Path to the JSON configuration file", "zlink.json"});
  cmdline.add_argument({"download_dir", "Directory for received files", ""});
  cmdline.add_argument({"upload", "File to send when the remote runs rz", ""});
  cmdline.add_argument({"chunk_size", "Bytes per data subpacket", "1024"});
  cmdline.add_argument(
      BooleanCommandLineArgument("validate_crc", "Reject frames with a bad checksum", true));
  cmdline.add_argument({"progress_json", "Append progress events as JSON lines to this file", ""});
}

static void ShowHelp(const CommandLine& cmdline) {
  std::cout << cmdline.GetHelp() << std::endl
            << "Connect stdin and stdout to the remote shell; the terminal output goes to stderr."
            << std::endl;
}

static ZmodemConfig LoadConfig(CommandLine& cmdline) {
  ZmodemConfig config{};
  const auto path = cmdline.sarg("config");
  if (config.Load(path)) {
    VLOG(1) << "Loaded configuration from " << path;
    cmdline.SetNewDefault("download_dir", config.download_directory);
    cmdline.SetNewDefault("chunk_size", std::to_string(config.chunk_size));
    cmdline.SetNewDefault("validate_crc", config.validate_crc ? "true" : "false");
  }
  config.download_directory = cmdline.sarg("download_dir");
  config.chunk_size = cmdline.iarg("chunk_size");
  config.validate_crc = cmdline.barg("validate_crc");
  ValidateConfig(config);
  return config;
}

static int Main(CommandLine& cmdline) {
  const auto config = LoadConfig(cmdline);

  std::unique_ptr<std::ofstream> json_out;
  std::unique_ptr<JsonEventSink> json_sink;
  if (const auto p = cmdline.sarg("progress_json"); !p.empty()) {
    json_out = std::make_unique<std::ofstream>(p, std::ios::app);
    if (!*json_out) {
      LOG(ERROR) << "Unable to open progress file: " << p;
      return 1;
    }
    json_sink = std::make_unique<JsonEventSink>(*json_out);
  }
  LoggingSink sink(json_sink.get());

  SessionRegistry registry(config);
  StdoutTransport transport;
  StderrDisplay display;
  CommandLineDelegate delegate(cmdline.sarg("upload"), config.download_directory);
  SystemClock clock;
  ProgressReporter reporter(registry, sink, clock);
  ThreadExecutor executor("zlink");
  StreamSniffer sniffer("stdio", registry, transport, display, delegate, &sink, executor);

  std::string buf(kReadBufferSize, '\0');
  for (;;) {
    pollfd pfd{};
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    const auto rc = ::poll(&pfd, 1, kPollMillis);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOG(ERROR) << "poll failed: " << strerror(errno);
      break;
    }
    if (rc > 0) {
      const auto n = ::read(STDIN_FILENO, &buf[0], buf.size());
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (n <= 0) {
        VLOG(1) << "stdin closed";
        break;
      }
      sniffer.OnData(std::string_view(buf.data(), static_cast<size_t>(n)));
    }
    reporter.Tick();
  }
  sniffer.OnTransportClosed();
  executor.Flush();
  reporter.Publish();
  return 0;
}

int main(int argc, char** argv) {
  LoggerConfig config{};
  // stderr is the terminal; keep log lines out of it.
  config.register_console_destinations = false;
  Logger::Init(argc, argv, config);
  ScopeExit at_exit(Logger::ExitLogger);
#ifdef __unix__
  signal(SIGPIPE, SIG_IGN);
#endif // __unix__

  CommandLine cmdline(argc, argv);
  cmdline.AddStandardArgs();
  RegisterZlinkCommands(cmdline);
  if (!cmdline.Parse() || cmdline.help_requested()) {
    ShowHelp(cmdline);
    return 1;
  }
  try {
    return Main(cmdline);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Caught uncaught exception: " << e.what();
    return 2;
  }
}
