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
#ifndef INCLUDED_ZLINK_CORE_COMMAND_LINE_H
#define INCLUDED_ZLINK_CORE_COMMAND_LINE_H

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * CommandLine support.
 *
 * 1) Declare the allowed arguments.
 * 2) Parse the actual commandline, reporting any errors.
 * 3) Get the values as needed.
 *
 * Example:
 * program: zlink [--download_dir, -d] [--upload, -u]
 *
 * CommandLine cmdline(argc, argv);
 * cmdline.add_argument({"download_dir", 'd', "Where received files go", "."});
 * cmdline.add_argument(BooleanCommandLineArgument{"progress_json", "Emit JSON events", false});
 * if (!cmdline.Parse()) { return 1; }
 *
 * const auto dir = cmdline.sarg("download_dir");
 */

namespace zlink::core {

struct unknown_argument_error : public std::runtime_error {
  explicit unknown_argument_error(const std::string& message);
};

class CommandLineValue {
public:
  CommandLineValue() noexcept : default_(true) {}
  explicit CommandLineValue(const std::string& s) noexcept : CommandLineValue(s, false) {}
  CommandLineValue(std::string value, bool default_value) noexcept
      : value_(std::move(value)), default_(default_value) {}

  [[nodiscard]] std::string as_string() const noexcept { return value_; }
  [[nodiscard]] int as_int() const noexcept;
  [[nodiscard]] bool as_bool() const noexcept { return value_ == "true"; }
  [[nodiscard]] bool is_default() const noexcept { return default_; }

private:
  std::string value_;
  bool default_;
};

class CommandLineArgument {
public:
  CommandLineArgument(std::string name, char key, std::string help_text,
                      std::string default_value, std::string environment_variable);

  CommandLineArgument(const std::string& name, char key, const std::string& help_text,
                      const std::string& default_value)
      : CommandLineArgument(name, key, help_text, default_value, "") {}

  CommandLineArgument(const std::string& name, const std::string& help_text,
                      const std::string& default_value)
      : CommandLineArgument(name, 0, help_text, default_value, "") {}

  CommandLineArgument(const std::string& name, const std::string& help_text)
      : CommandLineArgument(name, 0, help_text, "", "") {}

  [[nodiscard]] std::string default_value() const;

  std::string name_;
  char key_{0};
  std::string help_text_;
  std::string default_value_;
  std::string environment_variable_;
  bool is_boolean{false};
};

class BooleanCommandLineArgument : public CommandLineArgument {
public:
  BooleanCommandLineArgument(const std::string& name, char key, const std::string& help_text,
                             bool default_value)
      : CommandLineArgument(name, key, help_text, default_value ? "true" : "false") {
    is_boolean = true;
  }

  BooleanCommandLineArgument(const std::string& name, const std::string& help_text,
                             bool default_value)
      : CommandLineArgument(name, 0, help_text, default_value ? "true" : "false") {
    is_boolean = true;
  }
};

/**
 * Parses command line arguments of the forms --name=value, --flag, -Xvalue
 * and collects the positional arguments that follow.
 */
class CommandLine final {
public:
  CommandLine(const std::vector<std::string>& args);
  CommandLine(int argc, char** argv);
  CommandLine() = delete;
  CommandLine(const CommandLine&) = delete;

  bool add_argument(const CommandLineArgument& arg);
  /** Adds --help and -v, which every zlink binary accepts. */
  bool AddStandardArgs();
  bool Parse();

  /**
   * Replaces the default of key with value, unless the user supplied
   * key on the command line. Used to layer a config file underneath
   * the flags.
   */
  bool SetNewDefault(const std::string& key, const std::string& value);

  [[nodiscard]] CommandLineValue arg(const std::string& name) const;
  [[nodiscard]] bool contains_arg(const std::string& name) const noexcept;
  [[nodiscard]] std::string sarg(const std::string& name) const { return arg(name).as_string(); }
  [[nodiscard]] int iarg(const std::string& name) const { return arg(name).as_int(); }
  [[nodiscard]] bool barg(const std::string& name) const { return arg(name).as_bool(); }
  [[nodiscard]] bool help_requested() const { return barg("help"); }
  [[nodiscard]] const std::vector<std::string>& remaining() const { return remaining_; }
  [[nodiscard]] std::string program_name() const noexcept { return program_name_; }
  [[nodiscard]] std::string GetHelp() const;
  [[nodiscard]] std::string ToString() const;

  void set_unknown_args_allowed(bool u) { unknown_args_allowed_ = u; }
  [[nodiscard]] bool unknown_args_allowed() const { return unknown_args_allowed_; }

private:
  bool SetCommandLineArgument(const std::string& key, const std::string& value,
                              bool default_value);
  [[nodiscard]] std::string ArgNameForKey(char key) const;
  void ParseImpl();

  std::vector<std::string> raw_args_;
  std::string program_name_;
  // Values as allowed to be specified on the commandline.
  std::map<std::string, CommandLineArgument> args_allowed_;
  // Values as entered on the commandline.
  std::map<std::string, CommandLineValue> args_;
  std::vector<std::string> remaining_;
  bool unknown_args_allowed_{false};
};

} // namespace zlink::core

#endif // INCLUDED_ZLINK_CORE_COMMAND_LINE_H
