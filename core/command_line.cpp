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
#include "core/command_line.h"

#include "core/log.h"
#include "core/stl.h"
#include "core/strings.h"
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using std::endl;
using std::left;
using std::setw;
using namespace zlink::strings;
using namespace zlink::stl;

namespace zlink::core {

unknown_argument_error::unknown_argument_error(const std::string& message)
    : std::runtime_error(StrCat("unknown_argument_error: ", message)) {}

int CommandLineValue::as_int() const noexcept { return to_number<int>(value_); }

CommandLineArgument::CommandLineArgument(std::string name, char key, std::string help_text,
                                         std::string default_value,
                                         std::string environment_variable)
    : name_(std::move(name)), key_(key), help_text_(std::move(help_text)),
      default_value_(std::move(default_value)),
      environment_variable_(std::move(environment_variable)) {}

std::string CommandLineArgument::default_value() const {
  if (environment_variable_.empty()) {
    return default_value_;
  }
  const auto* env = std::getenv(environment_variable_.c_str());
  return (env == nullptr || *env == '\0') ? default_value_ : std::string(env);
}

static std::string CreateProgramName(const std::string& arg) {
  const std::filesystem::path p{arg};
  return p.filename().string();
}

CommandLine::CommandLine(const std::vector<std::string>& args)
    : raw_args_(args), program_name_(args.empty() ? "" : CreateProgramName(args.front())) {}

static std::vector<std::string> make_args(int argc, char** argv) {
  std::vector<std::string> v;
  for (auto i = 0; i < argc; i++) {
    v.emplace_back(argv[i]);
  }
  return v;
}

CommandLine::CommandLine(int argc, char** argv) : CommandLine(make_args(argc, argv)) {}

bool CommandLine::add_argument(const CommandLineArgument& arg) {
  // Add arg to the list of allowable arguments, and also set
  // the default value.
  args_allowed_.emplace(arg.name_, arg);
  args_.erase(arg.name_);
  args_.emplace(arg.name_, CommandLineValue(arg.default_value(), true));
  return true;
}

bool CommandLine::AddStandardArgs() {
  add_argument(BooleanCommandLineArgument("help", '?', "Displays Help", false));
  add_argument({"v", 'v', "Verbose log level", "0"});
  return true;
}

bool CommandLine::Parse() {
  try {
    ParseImpl();
  } catch (const unknown_argument_error& e) {
    std::clog << "Unable to parse command line." << endl;
    std::clog << e.what() << endl;
    return false;
  }
  return true;
}

static bool is_shortarg_start(char c) { return c == '-'; }

void CommandLine::ParseImpl() {
  for (auto i = 1; i < ssize(raw_args_); i++) {
    const std::string& s{raw_args_[i]};
    if (s.empty()) {
      continue;
    }
    if (s == "--") {
      // Everything after this should be positional args.
      for (++i; i < ssize(raw_args_); i++) {
        remaining_.emplace_back(raw_args_[i]);
      }
      break;
    }
    if (starts_with(s, "--")) {
      const auto eq = s.find('=');
      const auto key = s.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
      const auto value = eq == std::string::npos ? std::string{} : s.substr(eq + 1);
      if (!contains(args_allowed_, key)) {
        if (unknown_args_allowed()) {
          continue;
        }
        throw unknown_argument_error(StrCat("key=", key));
      }
      SetCommandLineArgument(key, value, false);
    } else if (is_shortarg_start(s.front()) && s.size() > 1) {
      const auto key = ArgNameForKey(s[1]);
      if (key.empty()) {
        if (unknown_args_allowed()) {
          continue;
        }
        throw unknown_argument_error(StrCat("letter=", s[1]));
      }
      SetCommandLineArgument(key, s.substr(2), false);
    } else {
      remaining_.emplace_back(s);
    }
  }
}

bool CommandLine::SetNewDefault(const std::string& key, const std::string& value) {
  if (!contains_arg(key) || !arg(key).is_default()) {
    return false;
  }
  return SetCommandLineArgument(key, value, true);
}

bool CommandLine::SetCommandLineArgument(const std::string& key, const std::string& value,
                                         bool default_value) {
  if (!contains(args_allowed_, key)) {
    VLOG(1) << "No such argument: " << key;
    return false;
  }
  args_.erase(key); // "emplace" doesn't replace, so erase it first.
  if (args_allowed_.at(key).is_boolean) {
    if (value == "N" || value == "0" || value == "n" || iequals(value, "false")) {
      args_.emplace(key, CommandLineValue("false", default_value));
    } else {
      args_.emplace(key, CommandLineValue("true", default_value));
    }
  } else {
    args_.emplace(key, CommandLineValue(value, default_value));
  }
  return true;
}

bool CommandLine::contains_arg(const std::string& name) const noexcept {
  return args_.find(name) != args_.end();
}

CommandLineValue CommandLine::arg(const std::string& name) const {
  const auto it = args_.find(name);
  if (it == args_.end()) {
    VLOG(1) << "Unknown argument name: " << name;
    return CommandLineValue("", true);
  }
  return it->second;
}

std::string CommandLine::ArgNameForKey(char key) const {
  for (const auto& [name, a] : args_allowed_) {
    if (a.key_ != 0 && key == a.key_) {
      return name;
    }
  }
  return {};
}

std::string CommandLine::GetHelp() const {
  std::ostringstream ss;
  ss << "Usage:" << endl;
  ss << program_name_ << " [args]" << endl << endl;
  for (const auto& [_, c] : args_allowed_) {
    if (c.key_ != 0) {
      ss << "-" << c.key_ << " ";
    } else {
      ss << "   ";
    }
    auto text = c.name_;
    if (!c.is_boolean) {
      text = StrCat(c.name_, "=value");
    }
    ss << "--" << left << setw(25) << text << " " << c.help_text_ << endl;
  }
  return ss.str();
}

std::string CommandLine::ToString() const {
  std::ostringstream ss;
  ss << "args: ";
  for (const auto& [key, value] : args_) {
    ss << "{" << key << ": \"" << value.as_string() << "\"}";
  }
  if (!remaining_.empty()) {
    ss << "; remaining: " << JoinStrings(remaining_, ", ");
  }
  return ss.str();
}

} // namespace zlink::core
