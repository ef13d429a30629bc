#include "internal/integrity/snapshot_store.hpp"

#include "internal/observability/logging.hpp"

namespace dataguard::integrity {

using dataguard::observability::IntField;
using dataguard::observability::StringField;

SnapshotStore::SnapshotStore(storage::TableSourcePtr tables)
    : tables_(std::move(tables)) {}

model::DatasetSnapshot SnapshotStore::Capture(const std::vector<std::filesystem::path>& paths) const {
  DATAGUARD_LOG_INFO("Recording initial file sizes and job counts", {IntField("files", static_cast<std::int64_t>(paths.size()))});

  model::DatasetSnapshot snapshot;

  for (const auto& path : paths) {
    model::FileBaseline baseline;
    baseline.size_bytes = tables_->Size(path);

    try {
      auto table        = tables_->Load(path);
      baseline.count    = table->num_rows();
      baseline.readable = true;

      DATAGUARD_LOG_INFO("Baseline recorded",
                         {StringField("file", path.filename().string()),
                          IntField("jobs", baseline.count),
                          IntField("bytes", static_cast<std::int64_t>(baseline.size_bytes))});
    } catch (const std::exception& e) {
      // new or corrupt file: no baseline to lose
      baseline.count = 0;
      baseline.error = e.what();

      DATAGUARD_LOG_WARN("Could not read file, assuming empty baseline",
                         {StringField("file", path.string()), StringField("error", e.what())});
    }

    snapshot.files[path] = std::move(baseline);
  }

  return snapshot;
}

} // namespace dataguard::integrity
