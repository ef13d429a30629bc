#include "internal/pipeline/propagator.hpp"

#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"

namespace dataguard::pipeline {

using dataguard::observability::IntField;
using dataguard::observability::StringField;

CommandPropagator::CommandPropagator(std::string command, std::string working_directory)
    : command_(std::move(command)), working_directory_(std::move(working_directory)) {}

/*
  The changed files are appended as quoted arguments so a commit script
  can stage exactly what was verified.
*/
bool CommandPropagator::Propagate(const model::IntegrityReport& report) {
  std::string command = command_;
  for (const auto& file : report.files) {
    if (file.status == model::FileStatus::kGrown) {
      command += " " + util::ShellQuote(std::filesystem::absolute(file.path).string());
    }
  }

  DATAGUARD_LOG_INFO("Propagating verified changes", {StringField("command", command)});

  util::CommandResult result;
  try {
    result = util::RunCommand(
        util::InDirectory(working_directory_, command),
        [](std::string_view line) { DATAGUARD_LOG_INFO("propagation", {StringField("line", line)}); },
        false);
  } catch (const util::CommandError& e) {
    DATAGUARD_LOG_ERROR("Could not start propagation command", {StringField("error", e.what())});
    return false;
  }

  if (!result.ok()) {
    DATAGUARD_LOG_ERROR("Propagation command failed", {IntField("exit_code", result.exit_code)});
    return false;
  }
  return true;
}

} // namespace dataguard::pipeline
