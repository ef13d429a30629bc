#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/verdict.hpp"

namespace dataguard::integrity {

struct FileDelta {
  std::string  filename;
  std::int64_t initial_count = 0;
  std::int64_t current_count = 0;
  std::int64_t added         = 0;
};

struct DeltaSummary {
  // sorted by filename
  std::vector<FileDelta> files;
  std::int64_t           total_added = 0;
};

/*
  Net additions per tracked file for a passing, changed run.
*/
class DeltaReporter {
 public:
  DeltaSummary Report(const model::IntegrityReport& report) const;
};

} // namespace dataguard::integrity
