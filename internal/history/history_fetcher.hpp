#pragma once

#include <arrow/buffer.h>

#include <filesystem>
#include <memory>
#include <string>

namespace dataguard::history {

enum class FetchStatus {
  Found = 0,

  // the path has no committed version
  NotFound,

  // retrieval itself failed (no repository, command error, ...)
  Failed
};

struct FetchResult {
  FetchStatus                    status = FetchStatus::NotFound;
  std::shared_ptr<arrow::Buffer> content;
  std::string                    message;

  static FetchResult Found(std::shared_ptr<arrow::Buffer> content) {
    return {FetchStatus::Found, std::move(content), {}};
  }

  static FetchResult NotFound(std::string msg = {}) {
    return {FetchStatus::NotFound, nullptr, std::move(msg)};
  }

  static FetchResult Failed(std::string msg) {
    return {FetchStatus::Failed, nullptr, std::move(msg)};
  }

  explicit operator bool() const {
    return status == FetchStatus::Found;
  }
};

/*
  Retrieves a dataset file as it was at the last committed state.

  Implementations must not throw: every failure maps to NotFound or
  Failed, which the diagnoser treats as "historical comparison
  unavailable".
*/
class HistoryFetcher {
 public:
  virtual ~HistoryFetcher() = default;

  virtual FetchResult Fetch(const std::filesystem::path& path) = 0;
};

using HistoryFetcherPtr = std::shared_ptr<HistoryFetcher>;

} // namespace dataguard::history
