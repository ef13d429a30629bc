#pragma once

#include <filesystem>
#include <vector>

#include "internal/model/dataset_file.hpp"
#include "internal/storage/table_source.hpp"

namespace dataguard::integrity {

/*
  Records size and row count of every tracked file before collection.

  Unreadable files get count 0 and never fail the capture.
*/
class SnapshotStore {
 public:
  explicit SnapshotStore(storage::TableSourcePtr tables);

  model::DatasetSnapshot Capture(const std::vector<std::filesystem::path>& paths) const;

 private:
  storage::TableSourcePtr tables_;
};

} // namespace dataguard::integrity
