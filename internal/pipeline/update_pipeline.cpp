#include "internal/pipeline/update_pipeline.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace dataguard::pipeline {

using dataguard::observability::BoolField;
using dataguard::observability::IntField;
using dataguard::observability::StringField;

const char* ToString(RunStatus status) {
  switch (status) {
    case RunStatus::kPassed:
      return "passed";
    case RunStatus::kNoChanges:
      return "no_changes";
    case RunStatus::kBlocked:
      return "blocked";
    case RunStatus::kPropagationFailed:
      return "propagation_failed";
  }
  return "unknown";
}

UpdatePipeline::UpdatePipeline(PipelineDependencies deps)
    : deps_(std::move(deps)) {
  if (!deps_.tracked || !deps_.snapshots || !deps_.checker || !deps_.deltas || !deps_.collector) {
    throw std::invalid_argument("UpdatePipeline requires tracked files, snapshot store, checker, delta reporter and collector");
  }
}

RunResult UpdatePipeline::Run() {
  RunResult result;

  // ------------------------------------------------------------
  // Step 1: baseline
  // ------------------------------------------------------------
  const auto before   = deps_.tracked->Enumerate();
  const auto snapshot = deps_.snapshots->Capture(before);

  // ------------------------------------------------------------
  // Step 2: collection
  // ------------------------------------------------------------
  auto outcome               = deps_.collector->Run();
  result.collector_succeeded = outcome.success;

  if (!outcome.combined_output.empty()) {
    try {
      result.collection_stats = collector::ParseCollectionOutput(outcome.combined_output);
    } catch (const std::exception& e) {
      DATAGUARD_LOG_WARN("Could not parse collector output", {StringField("error", e.what())});
    }
  }

  // ------------------------------------------------------------
  // Step 3: integrity, run even when collection failed
  // ------------------------------------------------------------
  const auto after = deps_.tracked->Enumerate();
  result.report    = deps_.checker->Check(snapshot, after);

  const auto& verdict = result.report.verdict;
  if (!verdict.ok) {
    LogDataLoss(result.report);
    result.status = RunStatus::kBlocked;
    return result;
  }

  for (const auto& path : verdict.read_errors) {
    DATAGUARD_LOG_ERROR("Integrity check could not read file", {StringField("file", path.string())});
  }

  if (!verdict.changed) {
    DATAGUARD_LOG_INFO("No data files changed. Skipping summary.");
    result.status = verdict.read_errors.empty() ? RunStatus::kNoChanges : RunStatus::kBlocked;
    return result;
  }

  // ------------------------------------------------------------
  // Step 4: report
  // ------------------------------------------------------------
  result.deltas = deps_.deltas->Report(result.report);
  LogSummary(result);

  // ------------------------------------------------------------
  // Step 5: propagation gate
  // ------------------------------------------------------------
  if (!verdict.CanPropagate()) {
    DATAGUARD_LOG_WARN("Refusing to propagate: some data files could not be read",
                       {IntField("unreadable_files", static_cast<std::int64_t>(verdict.read_errors.size()))});
    result.status = RunStatus::kBlocked;
    return result;
  }

  if (!deps_.propagator) {
    DATAGUARD_LOG_INFO("Update completed successfully");
    result.status = RunStatus::kPassed;
    return result;
  }

  result.propagated = deps_.propagator->Propagate(result.report);
  result.status     = result.propagated ? RunStatus::kPassed : RunStatus::kPropagationFailed;
  return result;
}

void UpdatePipeline::LogDataLoss(const model::IntegrityReport& report) const {
  DATAGUARD_LOG_CRITICAL("DATA LOSS DETECTED! ABORTING ALL OPERATIONS!",
                         {IntField("shrunken_files", static_cast<std::int64_t>(report.diagnoses.size()))});

  for (const auto& diagnosis : report.diagnoses) {
    DATAGUARD_LOG_ERROR("Shrunken file",
                        {StringField("file", diagnosis.path.string()),
                         IntField("jobs_change", diagnosis.CountDelta()),
                         StringField("diagnosis", model::ToString(diagnosis.outcome)),
                         StringField("detail", diagnosis.message)});
  }

  std::string restore = "git checkout --";
  for (const auto& path : report.ShrunkenFiles()) {
    restore += " " + path.string();
  }

  DATAGUARD_LOG_ERROR("Some data files lost jobs. Refusing to commit or push changes to prevent data loss.");
  DATAGUARD_LOG_ERROR("Next steps: check the diagnostics above, restore data from git history if needed, fix the root cause before running again",
                      {StringField("restore_command", restore)});
}

void UpdatePipeline::LogSummary(const RunResult& result) const {
  DATAGUARD_LOG_INFO("UPDATE SUMMARY",
                     {BoolField("collector_succeeded", result.collector_succeeded),
                      IntField("total_added", result.deltas ? result.deltas->total_added : 0)});

  if (result.deltas) {
    for (const auto& delta : result.deltas->files) {
      DATAGUARD_LOG_INFO("Jobs added per file", {StringField("file", delta.filename), IntField("added", delta.added)});
    }
  }

  if (result.collection_stats) {
    const auto& stats = *result.collection_stats;
    DATAGUARD_LOG_INFO("Collector reported",
                       {IntField("new_jobs", stats.new_jobs),
                        IntField("files", static_cast<std::int64_t>(stats.jobs_per_file.size())),
                        IntField("failed_dates", static_cast<std::int64_t>(stats.failed_dates.size()))});
    for (const auto& error : stats.errors) {
      DATAGUARD_LOG_WARN("Collector error", {StringField("line", error)});
    }
  }
}

} // namespace dataguard::pipeline
