#include "internal/integrity/integrity_checker.hpp"

#include <set>

#include "internal/observability/logging.hpp"

namespace dataguard::integrity {

using dataguard::model::FileCheck;
using dataguard::model::FileStatus;
using dataguard::observability::IntField;
using dataguard::observability::StringField;

IntegrityChecker::IntegrityChecker(storage::TableSourcePtr tables, std::shared_ptr<ShrinkageDiagnoser> diagnoser)
    : tables_(std::move(tables)), diagnoser_(std::move(diagnoser)) {}

model::IntegrityReport IntegrityChecker::Check(const model::DatasetSnapshot& snapshot,
                                               const std::vector<std::filesystem::path>& tracked) const {
  DATAGUARD_LOG_INFO("Checking data integrity (ensuring no job loss)");

  // files matched now, plus files that were tracked but no longer match
  std::set<std::filesystem::path> present(tracked.begin(), tracked.end());
  std::set<std::filesystem::path> all = present;
  for (const auto& [path, baseline] : snapshot.files) {
    all.insert(path);
  }

  model::IntegrityReport report;
  for (const auto& path : all) {
    report.files.push_back(CheckFile(snapshot, path, present.count(path) > 0));
  }

  auto& verdict = report.verdict;
  for (const auto& file : report.files) {
    switch (file.status) {
      case FileStatus::kShrunk:
        verdict.ok = false;
        break;
      case FileStatus::kGrown:
        verdict.changed = true;
        break;
      case FileStatus::kReadError:
        verdict.read_errors.push_back(file.path);
        break;
      case FileStatus::kUnchanged:
        break;
    }
  }

  // ------------------------------------------------------------
  // Diagnose every shrunken file
  // ------------------------------------------------------------
  if (!verdict.ok) {
    DATAGUARD_LOG_WARN("Diagnostic information for files with data loss");
    for (const auto& file : report.files) {
      if (file.status != FileStatus::kShrunk) continue;
      report.diagnoses.push_back(diagnoser_->Diagnose(file));
    }
    // loss blocks reporting, so growth elsewhere is irrelevant
    verdict.changed = false;
  }

  return report;
}

FileCheck IntegrityChecker::CheckFile(const model::DatasetSnapshot& snapshot, const std::filesystem::path& path, bool present) const {
  FileCheck check;
  check.path          = path;
  check.initial_size  = snapshot.InitialSize(path);
  check.initial_count = snapshot.InitialCount(path);

  if (!present) {
    check.vanished      = true;
    check.current_count = 0;
    check.status        = model::Classify(check.initial_count, check.current_count);
    if (check.status == FileStatus::kShrunk) {
      DATAGUARD_LOG_ERROR("File disappeared after collection",
                          {StringField("file", path.string()), IntField("jobs_before", check.initial_count)});
    }
    return check;
  }

  check.current_size = tables_->Size(path);

  try {
    check.current_count = tables_->Load(path)->num_rows();
  } catch (const std::exception& e) {
    check.status = FileStatus::kReadError;
    check.error  = e.what();
    DATAGUARD_LOG_ERROR("Could not check file", {StringField("file", path.string()), StringField("error", e.what())});
    return check;
  }

  check.status = model::Classify(check.initial_count, check.current_count);

  switch (check.status) {
    case FileStatus::kShrunk:
      DATAGUARD_LOG_ERROR("File LOST JOBS",
                          {StringField("file", path.string()),
                           IntField("jobs_before", check.initial_count),
                           IntField("jobs_after", check.current_count),
                           IntField("jobs_change", check.CountDelta()),
                           IntField("bytes_before", static_cast<std::int64_t>(check.initial_size)),
                           IntField("bytes_after", static_cast<std::int64_t>(check.current_size))});
      break;
    case FileStatus::kGrown:
      DATAGUARD_LOG_INFO("File grew",
                         {StringField("file", path.string()),
                          IntField("jobs_before", check.initial_count),
                          IntField("jobs_after", check.current_count),
                          IntField("jobs_change", check.CountDelta()),
                          IntField("bytes_change", check.SizeDelta())});
      break;
    default:
      DATAGUARD_LOG_INFO("File unchanged",
                         {StringField("file", path.string()),
                          IntField("jobs", check.current_count),
                          IntField("bytes", static_cast<std::int64_t>(check.current_size))});
      break;
  }

  return check;
}

} // namespace dataguard::integrity
