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
#include "core/log.h"

#include "core/command_line.h"
#include "core/file.h"
#include "core/stl.h"
#include "core/strings.h"
#include "fmt/chrono.h"
#include "fmt/format.h"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

using namespace zlink::strings;

namespace zlink::core {

static std::shared_ptr<Appender> console_appender;
static std::shared_ptr<Appender> logfile_appender;
LoggerConfig Logger::config_;
std::recursive_mutex Logger::mu_;

class ConsoleAppender : public Appender {
public:
  bool append(const std::string& message) override {
    std::cerr << message << std::endl;
    return true;
  }
};

class LogFileAppender : public Appender {
public:
  explicit LogFileAppender(std::filesystem::path fn) : filename_(std::move(fn)) {}

  bool append(const std::string& message) override {
    if (message.empty()) {
      return true;
    }
    File out(filename_);
    if (!out.Open(File::modeWriteOnly | File::modeAppend | File::modeCreateFile)) {
      // We don't want to crash if we can't log.
      return false;
    }
    return out.Write(StrCat(message, "\n")) > 0;
  }

private:
  const std::filesystem::path filename_;
};

static std::string FormatLogLevel(LoggerLevel l, int v) {
  if (l == LoggerLevel::verbose) {
    return StrCat("VER-", v);
  }
  static const std::unordered_map<LoggerLevel, std::string, stl::enum_hash> map = {
      {LoggerLevel::ignored, ""},       {LoggerLevel::start, "START"},
      {LoggerLevel::debug, "DEBUG"},    {LoggerLevel::verbose, "VER- "},
      {LoggerLevel::error, "ERROR"},    {LoggerLevel::info, "INFO "},
      {LoggerLevel::warning, "WARN "},  {LoggerLevel::fatal, "FATAL"},
  };
  return map.at(l);
}

std::string Logger::FormatLogMessage(LoggerLevel level, int verbosity,
                                     const std::string& msg) const {
  const auto ts = config_.timestamp_fn_ ? config_.timestamp_fn_() : std::string{};
  return StrCat(ts, FormatLogLevel(level, verbosity), " ", msg);
}

Logger::Logger(LoggerLevel level, int verbosity) noexcept
    : level_(level), verbosity_(verbosity) {}

Logger::~Logger() noexcept {
  if (level_ == LoggerLevel::verbose && !vlog_is_on(verbosity_)) {
    return;
  }
  try {
    const auto msg = FormatLogMessage(level_, verbosity_, ss_.str());
    std::lock_guard<std::recursive_mutex> lock(mu_);
    const auto& appenders = config_.log_to[level_];
    if (appenders.empty() && console_appender && level_ >= LoggerLevel::warning) {
      console_appender->append(msg);
    }
    for (const auto& a : appenders) {
      a->append(msg);
    }
  } catch (const std::exception& e) {
    std::cerr << "Logger failure: " << e.what() << std::endl;
  }
  if (level_ == LoggerLevel::fatal) {
    abort();
  }
}

// static
void Logger::set_cmdline_verbosity(int cmdline_verbosity) {
  config_.cmdline_verbosity = cmdline_verbosity;
}

// static
bool Logger::vlog_is_on(int level) { return level <= config_.cmdline_verbosity; }

// static
void Logger::StartupLog(int argc, char* argv[]) {
  LOG(STARTUP) << config_.exit_filename << " starting";
  if (argc > 1) {
    std::string cmdline;
    for (auto i = 1; i < argc; i++) {
      cmdline += argv[i];
      cmdline += " ";
    }
    LOG(STARTUP) << "command line: " << cmdline;
  }
}

// static
void Logger::ExitLogger() { LOG(STARTUP) << config_.exit_filename << " exiting"; }

// static
void Logger::Init(int argc, char** argv) {
  LoggerConfig config;
  Init(argc, argv, config);
}

// static
void Logger::Init(int argc, char** argv, LoggerConfig& c) {
  config_ = c;
  CommandLine cmdline(argc, argv);
  cmdline.AddStandardArgs();
  cmdline.add_argument({"logdir", 0, "Directory where log files are written.", "", "ZLINK_LOG_DIR"});
  cmdline.set_unknown_args_allowed(true);
  if (cmdline.Parse()) {
    // Set --v from commandline
    config_.cmdline_verbosity = std::max(c.cmdline_verbosity, cmdline.iarg("v"));
    if (config_.log_directory.empty()) {
      config_.log_directory = cmdline.sarg("logdir");
    }
  }

  std::string filename = argc > 0 ? argv[0] : "zlink";
  const auto last_slash = filename.rfind(File::pathSeparatorChar);
  if (last_slash != std::string::npos) {
    filename = filename.substr(last_slash + 1);
  }
  config_.log_filename = FilePath(config_.log_directory, StrCat(filename, ".log")).string();
  config_.exit_filename = filename;

  // Setup the default appenders.
  console_appender = std::make_shared<ConsoleAppender>();
  logfile_appender = std::make_shared<LogFileAppender>(config_.log_filename);

  if (config_.register_console_destinations) {
    config_.add_appender(LoggerLevel::error, console_appender);
    config_.add_appender(LoggerLevel::fatal, console_appender);
    config_.add_appender(LoggerLevel::warning, console_appender);
    config_.add_appender(LoggerLevel::info, console_appender);
    config_.add_appender(LoggerLevel::verbose, console_appender);
  }
  if (config_.register_file_destinations) {
    config_.add_appender(LoggerLevel::error, logfile_appender);
    config_.add_appender(LoggerLevel::fatal, logfile_appender);
    config_.add_appender(LoggerLevel::warning, logfile_appender);
    config_.add_appender(LoggerLevel::info, logfile_appender);
    config_.add_appender(LoggerLevel::verbose, logfile_appender);
    config_.add_appender(LoggerLevel::start, logfile_appender);
  }
  if (config_.log_startup) {
    StartupLog(argc, argv);
  }
}

static std::string DefaultTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto millis = static_cast<int>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
      1000);
  const auto t = std::chrono::system_clock::to_time_t(now);
  return fmt::format("{:%F %T},{:03d} ", fmt::localtime(t), millis);
}

LoggerConfig::LoggerConfig() : timestamp_fn_(DefaultTimestamp) {}

LoggerConfig::LoggerConfig(timestamp_fn t) : timestamp_fn_(std::move(t)) {}

void LoggerConfig::add_appender(LoggerLevel level, std::shared_ptr<Appender> appender) {
  log_to[level].emplace(std::move(appender));
}

void LoggerConfig::reset() {
  timestamp_fn_ = DefaultTimestamp;
  log_to.clear();
}

} // namespace zlink::core
