#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "internal/collector/collection_stats.hpp"
#include "internal/collector/collector.hpp"
#include "internal/integrity/delta_reporter.hpp"
#include "internal/integrity/integrity_checker.hpp"
#include "internal/integrity/snapshot_store.hpp"
#include "internal/integrity/tracked_files.hpp"
#include "internal/pipeline/propagator.hpp"

namespace dataguard::pipeline {

enum class RunStatus : std::uint8_t {
  // verified changes propagated (or nothing configured to propagate them)
  kPassed = 0,
  // nothing grew; reporting and propagation skipped
  kNoChanges = 1,
  // data loss or read errors; propagation refused
  kBlocked = 2,
  // verdict passed but the propagation command failed
  kPropagationFailed = 3,
};

const char* ToString(RunStatus status);

struct RunResult {
  RunStatus status = RunStatus::kBlocked;

  bool                                       collector_succeeded = false;
  std::optional<collector::CollectionStats> collection_stats;

  model::IntegrityReport report;

  // present only for passing runs with changes
  std::optional<integrity::DeltaSummary> deltas;

  bool propagated = false;

  const model::PipelineVerdict& verdict() const {
    return report.verdict;
  }
};

/*
  Collaborators of one update run. propagator may be null.
*/
struct PipelineDependencies {
  std::shared_ptr<integrity::TrackedFiles>     tracked;
  std::shared_ptr<integrity::SnapshotStore>    snapshots;
  std::shared_ptr<integrity::IntegrityChecker> checker;
  std::shared_ptr<integrity::DeltaReporter>    deltas;
  collector::CollectorPtr                      collector;
  PropagatorPtr                                propagator;
};

/*
  Strictly sequential:

      snapshot → collect → check → (diagnose) → report → propagate

  The snapshot lives on this call's stack and dies with it.
*/
class UpdatePipeline {
 public:
  explicit UpdatePipeline(PipelineDependencies deps);

  RunResult Run();

 private:
  void LogDataLoss(const model::IntegrityReport& report) const;
  void LogSummary(const RunResult& result) const;

  PipelineDependencies deps_;
};

} // namespace dataguard::pipeline
