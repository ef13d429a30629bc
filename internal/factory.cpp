#include "internal/factory.hpp"

#include <filesystem>

#include "internal/collector/command_collector.hpp"
#include "internal/history/git_history_fetcher.hpp"
#include "internal/storage/parquet/parquet_table_source.hpp"
#include "internal/util/errors.hpp"

namespace dataguard::factory {

namespace {

void ValidateCollector(const dataguard::runtime::config::CollectorConfig& cfg) {
  if (cfg.command().empty()) {
    throw util::ConfigError("collector.command must be set");
  }

  std::error_code ec;
  if (!cfg.working_directory().empty() && !std::filesystem::is_directory(cfg.working_directory(), ec)) {
    throw util::ConfigError("collector.working_directory does not exist: " + cfg.working_directory());
  }

  if (!cfg.required_file().empty()) {
    auto required = std::filesystem::path(cfg.working_directory()) / cfg.required_file();
    if (!std::filesystem::exists(required, ec)) {
      throw util::ConfigError("Please run from the collector directory: missing " + required.string());
    }
  }
}

} // namespace

pipeline::PipelineDependencies BuildPipeline(const dataguard::runtime::config::RuntimeConfig& config) {
  ValidateCollector(config.collector());

  auto tables  = std::make_shared<storage::ParquetTableSource>();
  auto history = std::make_shared<history::GitHistoryFetcher>(config.history().repository_root(), config.history().revision());

  integrity::DiagnosisLimits limits;
  limits.detail_limit = config.diagnosis().detail_limit();
  limits.sample_size  = config.diagnosis().sample_size();

  auto diagnoser = std::make_shared<integrity::ShrinkageDiagnoser>(tables, history, limits);

  pipeline::PipelineDependencies deps;
  deps.tracked   = std::make_shared<integrity::TrackedFiles>(config.datasets().glob());
  deps.snapshots = std::make_shared<integrity::SnapshotStore>(tables);
  deps.checker   = std::make_shared<integrity::IntegrityChecker>(tables, diagnoser);
  deps.deltas    = std::make_shared<integrity::DeltaReporter>();
  deps.collector = std::make_shared<collector::CommandCollector>(
      config.collector().command(), config.collector().working_directory(), config.collector().capture_output());

  if (!config.propagation().command().empty()) {
    deps.propagator = std::make_shared<pipeline::CommandPropagator>(config.propagation().command(), config.propagation().working_directory());
  }

  return deps;
}

} // namespace dataguard::factory
