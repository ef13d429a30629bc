#pragma once

#include <filesystem>
#include <vector>

#include "internal/model/dataset_file.hpp"
#include "internal/model/diagnosis.hpp"

namespace dataguard::model {

/*
  ok      → no tracked file lost records
  changed → at least one tracked file grew

  Read errors never flip ok; they are carried separately and close the
  propagation gate on their own.
*/
struct PipelineVerdict {
  bool ok      = true;
  bool changed = false;

  std::vector<std::filesystem::path> read_errors;

  bool CanPropagate() const {
    return ok && read_errors.empty();
  }
};

struct IntegrityReport {
  std::vector<FileCheck>          files;
  std::vector<ShrinkageDiagnosis> diagnoses;
  PipelineVerdict                 verdict;

  std::vector<std::filesystem::path> ShrunkenFiles() const {
    std::vector<std::filesystem::path> result;
    for (const auto& file : files) {
      if (file.status == FileStatus::kShrunk) result.push_back(file.path);
    }
    return result;
  }
};

}  // namespace dataguard::model
