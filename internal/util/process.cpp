#include "process.hpp"

#include <sys/wait.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include "internal/util/errors.hpp"

namespace dataguard::util {

namespace {

int DecodeStatus(int status) {
  if (status == -1) return -1;
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return -1;
}

FILE* OpenPipe(const std::string& command, const std::string& shell_line) {
  if (command.empty()) {
    throw CommandError("empty command");
  }
  FILE* pipe = popen(shell_line.c_str(), "r");
  if (!pipe) {
    throw CommandError("cannot start '" + command + "': " + std::strerror(errno));
  }
  return pipe;
}

} // namespace

std::string ShellQuote(std::string_view arg) {
  std::string quoted;
  quoted.reserve(arg.size() + 2);
  quoted.push_back('\'');
  for (char c : arg) {
    if (c == '\'') {
      quoted.append("'\\''");
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string InDirectory(const std::string& working_directory, const std::string& command) {
  if (working_directory.empty()) return command;
  return "cd " + ShellQuote(working_directory) + " && " + command;
}

CommandResult RunCommand(const std::string& command, const LineCallback& on_line, bool capture) {
  CommandResult result;

  FILE* pipe = OpenPipe(command, "(" + command + ") 2>&1");

  std::array<char, 4096> buffer{};
  std::string            pending;
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
    std::string_view chunk(buffer.data());
    if (capture) result.output.append(chunk);

    pending.append(chunk);
    if (pending.back() != '\n') continue;

    pending.pop_back();
    if (on_line) on_line(pending);
    pending.clear();
  }
  if (!pending.empty() && on_line) on_line(pending);

  result.exit_code = DecodeStatus(pclose(pipe));
  return result;
}

CommandResult CaptureCommand(const std::string& command) {
  CommandResult result;

  FILE* pipe = OpenPipe(command, "(" + command + ") 2>/dev/null");

  std::array<char, 65536> buffer{};
  size_t                  n = 0;
  while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    result.output.append(buffer.data(), n);
  }

  result.exit_code = DecodeStatus(pclose(pipe));
  return result;
}

} // namespace dataguard::util
