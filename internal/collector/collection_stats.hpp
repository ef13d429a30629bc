#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dataguard::collector {

/*
  Figures scraped from the collector's console output. Informational
  only; the verdict never depends on them.
*/
struct CollectionStats {
  std::int64_t new_jobs = 0;

  // filename → jobs reported for it
  std::map<std::string, std::int64_t> jobs_per_file;

  std::vector<std::string> failed_dates;

  // at most kMaxErrorLines
  std::vector<std::string> errors;
};

inline constexpr std::size_t kMaxErrorLines = 3;

CollectionStats ParseCollectionOutput(std::string_view output);

} // namespace dataguard::collector
