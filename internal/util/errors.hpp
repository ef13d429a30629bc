#pragma once

#include <stdexcept>
#include <string>

namespace dataguard::util {

/*
  Central error types.

  File-scoped errors are caught at the per-file loops and turned into
  report entries; only startup errors reach main().
*/

class TableReadError : public std::runtime_error {
 public:
  explicit TableReadError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CommandError : public std::runtime_error {
 public:
  explicit CommandError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace dataguard::util
