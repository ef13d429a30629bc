#pragma once

#include <string>

#include "internal/collector/collector.hpp"

namespace dataguard::collector {

/*
  Runs the collection script through the shell, streaming its output
  into the log line by line.
*/
class CommandCollector final : public Collector {
 public:
  CommandCollector(std::string command, std::string working_directory, bool capture_output);

  CollectorOutcome Run() override;

 private:
  std::string command_;
  std::string working_directory_;
  bool        capture_output_;
};

} // namespace dataguard::collector
