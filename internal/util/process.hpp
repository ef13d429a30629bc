#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace dataguard::util {

/*
  Shell command execution through popen(3).

  Commands run under /bin/sh. Callers quote their own arguments with
  ShellQuote(). Both runners throw util::CommandError when the command
  is empty or the shell cannot be started; a command that starts and
  fails is reported through exit_code.
*/

struct CommandResult {
  // -1 when the command was killed by a signal
  int         exit_code = -1;
  std::string output;

  bool ok() const {
    return exit_code == 0;
  }
};

using LineCallback = std::function<void(std::string_view)>;

std::string ShellQuote(std::string_view arg);

// Prefixes `cd <dir> &&` when working_directory is not empty.
std::string InDirectory(const std::string& working_directory, const std::string& command);

/*
  Run a text-producing command with stderr merged into stdout.
  Each complete line goes to on_line as it arrives; the combined output
  is returned only when capture is set.
*/
CommandResult RunCommand(const std::string& command, const LineCallback& on_line, bool capture);

/*
  Binary-safe capture of stdout. stderr is discarded.
*/
CommandResult CaptureCommand(const std::string& command);

} // namespace dataguard::util
