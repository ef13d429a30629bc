#include "internal/integrity/integrity_checker.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/integrity/delta_reporter.hpp"
#include "internal/integrity/snapshot_store.hpp"
#include "tests/unit/test_support.hpp"

namespace {

using dataguard::integrity::DeltaReporter;
using dataguard::integrity::IntegrityChecker;
using dataguard::integrity::ShrinkageDiagnoser;
using dataguard::integrity::SnapshotStore;
using dataguard::model::DiagnosisOutcome;
using dataguard::model::FileStatus;
using dataguard::testing::FakeHistoryFetcher;
using dataguard::testing::FakeTableSource;
using dataguard::testing::MakeJobsTable;
using dataguard::testing::MakeRows;

using Paths = std::vector<std::filesystem::path>;

const std::filesystem::path kFileA = "data/current_jobs_2024.parquet";
const std::filesystem::path kFileB = "data/current_jobs_2025.parquet";

struct Fixture {
  std::shared_ptr<FakeTableSource>    tables  = std::make_shared<FakeTableSource>();
  std::shared_ptr<FakeHistoryFetcher> history = std::make_shared<FakeHistoryFetcher>();

  SnapshotStore    snapshots{tables};
  IntegrityChecker checker{tables, std::make_shared<ShrinkageDiagnoser>(tables, history)};

  void Put(const std::filesystem::path& path, int rows) {
    tables->Put(path, MakeJobsTable(MakeRows(path.stem().string() + "-", 0, rows)));
  }
};

void TestUnchangedFileIsOkWithoutChanges() {
  Fixture f;
  f.Put(kFileA, 100);

  auto snapshot = f.snapshots.Capture({kFileA});
  auto report   = f.checker.Check(snapshot, {kFileA});

  assert(report.verdict.ok);
  assert(!report.verdict.changed);
  assert(report.verdict.CanPropagate());
  assert(report.files.size() == 1);
  assert(report.files[0].status == FileStatus::kUnchanged);
  assert(report.diagnoses.empty());
}

void TestGrowthIsReportedAsDelta() {
  Fixture f;
  f.Put(kFileA, 100);
  auto snapshot = f.snapshots.Capture({kFileA});

  f.Put(kFileA, 130);
  auto report = f.checker.Check(snapshot, {kFileA});

  assert(report.verdict.ok);
  assert(report.verdict.changed);
  assert(report.files[0].status == FileStatus::kGrown);

  auto summary = DeltaReporter().Report(report);
  assert(summary.files.size() == 1);
  assert(summary.files[0].filename == "current_jobs_2024.parquet");
  assert(summary.files[0].added == 30);
  assert(summary.total_added == 30);
}

void TestOneShrunkenFileFailsDespiteNineGrowing() {
  Fixture f;
  Paths   paths;
  for (int year = 2015; year < 2025; ++year) {
    paths.emplace_back("data/current_jobs_" + std::to_string(year) + ".parquet");
    f.Put(paths.back(), 50);
  }
  auto snapshot = f.snapshots.Capture(paths);

  for (size_t i = 0; i < paths.size(); ++i) {
    f.Put(paths[i], i == 3 ? 40 : 60);
  }
  auto report = f.checker.Check(snapshot, paths);

  assert(!report.verdict.ok);
  assert(!report.verdict.changed);
  assert(!report.verdict.CanPropagate());
  assert(report.ShrunkenFiles().size() == 1);
  assert(report.ShrunkenFiles()[0] == paths[3]);
  assert(report.diagnoses.size() == 1);
  assert(report.diagnoses[0].path == paths[3]);
  // nothing committed in the fake history
  assert(report.diagnoses[0].outcome == DiagnosisOutcome::kHistoryUnavailable);
}

void TestEveryFileDiagnosedWhenSeveralShrink() {
  Fixture f;
  f.Put(kFileA, 20);
  f.Put(kFileB, 20);
  auto snapshot = f.snapshots.Capture({kFileA, kFileB});

  f.Put(kFileA, 10);
  f.Put(kFileB, 5);
  auto report = f.checker.Check(snapshot, {kFileA, kFileB});

  assert(!report.verdict.ok);
  assert(report.diagnoses.size() == 2);
  assert(f.history->fetches() == 2);
}

void TestReadErrorIsSeparateFromLossAndGrowth() {
  Fixture f;
  f.Put(kFileA, 100);
  f.Put(kFileB, 100);
  auto snapshot = f.snapshots.Capture({kFileA, kFileB});

  f.tables->MarkCorrupt(kFileA);
  f.Put(kFileB, 120);
  auto report = f.checker.Check(snapshot, {kFileA, kFileB});

  assert(report.verdict.ok);
  assert(report.verdict.changed);
  assert(report.verdict.read_errors.size() == 1);
  assert(report.verdict.read_errors[0] == kFileA);
  assert(!report.verdict.CanPropagate());
  assert(report.files[0].status == FileStatus::kReadError);
  assert(!report.files[0].error.empty());
  assert(report.diagnoses.empty());

  auto summary = DeltaReporter().Report(report);
  assert(summary.files.size() == 2);
  assert(summary.files[0].added == 0);
  assert(summary.files[1].added == 20);
}

void TestUnreadableBaselineCountsAsGrowth() {
  Fixture f;
  f.tables->MarkCorrupt(kFileA);
  auto snapshot = f.snapshots.Capture({kFileA});

  const auto* baseline = snapshot.Find(kFileA);
  assert(baseline != nullptr);
  assert(!baseline->readable);
  assert(baseline->count == 0);

  f.Put(kFileA, 12);
  auto report = f.checker.Check(snapshot, {kFileA});
  assert(report.verdict.ok);
  assert(report.verdict.changed);
}

void TestNewFileCreatedByCollectorIsGrowth() {
  Fixture f;
  f.Put(kFileA, 10);
  auto snapshot = f.snapshots.Capture({kFileA});

  f.Put(kFileB, 7);
  auto report = f.checker.Check(snapshot, {kFileA, kFileB});

  assert(report.verdict.ok);
  assert(report.verdict.changed);
  assert(report.files.size() == 2);
  assert(report.files[1].path == kFileB);
  assert(report.files[1].initial_count == 0);
  assert(report.files[1].current_count == 7);
}

void TestDeletedTrackedFileIsLoss() {
  Fixture f;
  f.Put(kFileA, 10);
  f.Put(kFileB, 10);
  auto snapshot = f.snapshots.Capture({kFileA, kFileB});

  auto report = f.checker.Check(snapshot, {kFileA});

  assert(!report.verdict.ok);
  assert(report.files[1].path == kFileB);
  assert(report.files[1].vanished);
  assert(report.files[1].status == FileStatus::kShrunk);
  assert(report.diagnoses.size() == 1);
}

void TestSecondCheckWithoutCollectionIsUnchanged() {
  Fixture f;
  f.Put(kFileA, 10);
  auto first_snapshot = f.snapshots.Capture({kFileA});
  f.Put(kFileA, 15);
  auto first = f.checker.Check(first_snapshot, {kFileA});
  assert(first.verdict.ok && first.verdict.changed);

  auto second_snapshot = f.snapshots.Capture({kFileA});
  auto second          = f.checker.Check(second_snapshot, {kFileA});
  assert(second.verdict.ok);
  assert(!second.verdict.changed);
}

void TestDeltasAreSortedByFilenameAndListZeros() {
  Fixture f;
  const std::filesystem::path late  = "z/current_jobs_2026.parquet";
  const std::filesystem::path early = "a/current_jobs_2020.parquet";
  f.Put(late, 5);
  f.Put(early, 5);
  f.Put(kFileB, 5);
  auto snapshot = f.snapshots.Capture({late, early, kFileB});

  f.Put(late, 8);
  auto report  = f.checker.Check(snapshot, {late, early, kFileB});
  auto summary = DeltaReporter().Report(report);

  assert(summary.files.size() == 3);
  assert(summary.files[0].filename == "current_jobs_2020.parquet");
  assert(summary.files[1].filename == "current_jobs_2025.parquet");
  assert(summary.files[2].filename == "current_jobs_2026.parquet");
  assert(summary.files[0].added == 0);
  assert(summary.files[1].added == 0);
  assert(summary.files[2].added == 3);
}

} // namespace

int main() {
  TestUnchangedFileIsOkWithoutChanges();
  TestGrowthIsReportedAsDelta();
  TestOneShrunkenFileFailsDespiteNineGrowing();
  TestEveryFileDiagnosedWhenSeveralShrink();
  TestReadErrorIsSeparateFromLossAndGrowth();
  TestUnreadableBaselineCountsAsGrowth();
  TestNewFileCreatedByCollectorIsGrowth();
  TestDeletedTrackedFileIsLoss();
  TestSecondCheckWithoutCollectionIsUnchanged();
  TestDeltasAreSortedByFilenameAndListZeros();

  std::cout << "dataguard_unit_integrity_checker: pass\n";
  return 0;
}
