#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace dataguard::integrity {

/*
  Tracked dataset files, selected by a POSIX glob such as
  data/current_jobs_*.parquet. Evaluated before and after collection so
  files created by the collector are picked up.
*/
class TrackedFiles {
 public:
  explicit TrackedFiles(std::string pattern);

  // Sorted; empty when nothing matches. Throws on glob(3) failures.
  std::vector<std::filesystem::path> Enumerate() const;

 private:
  std::string pattern_;
};

} // namespace dataguard::integrity
