#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace dataguard::model {

/*
  State of one tracked file when the run started.
  An unreadable file is recorded with count 0 so anything found later
  counts as growth.
*/
struct FileBaseline {
  std::uint64_t size_bytes = 0;
  std::int64_t  count      = 0;
  bool          readable   = false;
  std::string   error;
};

/*
  Run-scoped snapshot: written once before collection, read-only after.
*/
struct DatasetSnapshot {
  std::map<std::filesystem::path, FileBaseline> files;

  const FileBaseline* Find(const std::filesystem::path& path) const {
    auto it = files.find(path);
    return it == files.end() ? nullptr : &it->second;
  }

  std::int64_t InitialCount(const std::filesystem::path& path) const {
    const auto* baseline = Find(path);
    return baseline ? baseline->count : 0;
  }

  std::uint64_t InitialSize(const std::filesystem::path& path) const {
    const auto* baseline = Find(path);
    return baseline ? baseline->size_bytes : 0;
  }
};

enum class FileStatus : std::uint8_t {
  kUnchanged = 0,
  kGrown     = 1,
  kShrunk    = 2,
  kReadError = 3,
};

constexpr const char* ToString(FileStatus status) {
  switch (status) {
    case FileStatus::kUnchanged:
      return "unchanged";
    case FileStatus::kGrown:
      return "grown";
    case FileStatus::kShrunk:
      return "shrunk";
    case FileStatus::kReadError:
      return "read_error";
  }
  return "unknown";
}

/*
  Before/after comparison of one tracked file.
*/
struct FileCheck {
  std::filesystem::path path;

  std::uint64_t initial_size  = 0;
  std::uint64_t current_size  = 0;
  std::int64_t  initial_count = 0;
  std::int64_t  current_count = 0;

  FileStatus status = FileStatus::kUnchanged;

  // tracked at snapshot time but no longer matched after collection
  bool vanished = false;

  std::string error;

  std::int64_t CountDelta() const {
    return current_count - initial_count;
  }

  std::int64_t SizeDelta() const {
    return static_cast<std::int64_t>(current_size) - static_cast<std::int64_t>(initial_size);
  }
};

constexpr FileStatus Classify(std::int64_t initial_count, std::int64_t current_count) {
  if (current_count < initial_count) {
    return FileStatus::kShrunk;
  }
  if (current_count > initial_count) {
    return FileStatus::kGrown;
  }
  return FileStatus::kUnchanged;
}

}  // namespace dataguard::model
