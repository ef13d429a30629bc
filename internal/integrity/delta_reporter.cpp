#include "internal/integrity/delta_reporter.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace dataguard::integrity {

using dataguard::observability::IntField;
using dataguard::observability::StringField;

DeltaSummary DeltaReporter::Report(const model::IntegrityReport& report) const {
  DATAGUARD_LOG_INFO("Calculating job additions");

  DeltaSummary summary;
  for (const auto& file : report.files) {
    FileDelta delta;
    delta.filename      = file.path.filename().string();
    delta.initial_count = file.initial_count;
    delta.current_count = file.current_count;

    // unreadable files report zero rather than a bogus negative
    if (file.status != model::FileStatus::kReadError) {
      delta.added = std::max<std::int64_t>(0, file.CountDelta());
    }

    summary.total_added += delta.added;
    summary.files.push_back(std::move(delta));
  }

  std::stable_sort(summary.files.begin(), summary.files.end(),
                   [](const FileDelta& a, const FileDelta& b) { return a.filename < b.filename; });

  for (const auto& delta : summary.files) {
    if (delta.added > 0) {
      DATAGUARD_LOG_INFO("Jobs added",
                         {StringField("file", delta.filename),
                          IntField("added", delta.added),
                          IntField("was", delta.initial_count),
                          IntField("now", delta.current_count)});
    } else {
      DATAGUARD_LOG_INFO("No new jobs", {StringField("file", delta.filename), IntField("added", 0), IntField("now", delta.current_count)});
    }
  }

  return summary;
}

} // namespace dataguard::integrity
