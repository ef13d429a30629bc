#include "internal/integrity/tracked_files.hpp"

#include <glob.h>

#include <algorithm>
#include <stdexcept>

namespace dataguard::integrity {

namespace {

struct GlobGuard {
  glob_t result{};
  ~GlobGuard() {
    globfree(&result);
  }
};

} // namespace

TrackedFiles::TrackedFiles(std::string pattern)
    : pattern_(std::move(pattern)) {}

std::vector<std::filesystem::path> TrackedFiles::Enumerate() const {
  std::vector<std::filesystem::path> paths;

  GlobGuard guard;
  const int rc = glob(pattern_.c_str(), 0, nullptr, &guard.result);
  if (rc == GLOB_NOMATCH) {
    return paths;
  }
  if (rc != 0) {
    throw std::runtime_error("glob failed for pattern " + pattern_ + " (code " + std::to_string(rc) + ")");
  }

  for (size_t i = 0; i < guard.result.gl_pathc; ++i) {
    std::filesystem::path path(guard.result.gl_pathv[i]);
    std::error_code       ec;
    if (std::filesystem::is_regular_file(path, ec)) {
      paths.push_back(std::move(path));
    }
  }

  std::sort(paths.begin(), paths.end());
  return paths;
}

} // namespace dataguard::integrity
