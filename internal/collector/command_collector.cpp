#include "internal/collector/command_collector.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"

namespace dataguard::collector {

using dataguard::observability::IntField;
using dataguard::observability::StringField;

CommandCollector::CommandCollector(std::string command, std::string working_directory, bool capture_output)
    : command_(std::move(command)), working_directory_(std::move(working_directory)), capture_output_(capture_output) {}

CollectorOutcome CommandCollector::Run() {
  DATAGUARD_LOG_INFO("Collecting current jobs", {StringField("command", command_)});

  CollectorOutcome outcome;

  util::CommandResult result;
  try {
    result = util::RunCommand(
        command_.empty() ? command_ : util::InDirectory(working_directory_, command_),
        [](std::string_view line) { DATAGUARD_LOG_INFO("collector", {StringField("line", line)}); },
        capture_output_);
  } catch (const util::CommandError& e) {
    DATAGUARD_LOG_ERROR("Could not start data collection", {StringField("error", e.what())});
    return outcome;
  }

  outcome.success         = result.ok();
  outcome.combined_output = std::move(result.output);

  if (outcome.success) {
    DATAGUARD_LOG_INFO("Current data collection completed");
  } else {
    DATAGUARD_LOG_ERROR("Current data collection failed", {IntField("exit_code", result.exit_code)});
  }

  return outcome;
}

} // namespace dataguard::collector
