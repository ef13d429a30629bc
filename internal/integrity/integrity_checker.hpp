#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "internal/integrity/shrinkage_diagnoser.hpp"
#include "internal/model/verdict.hpp"

namespace dataguard::integrity {

/*
  Compares the post-collection state of every tracked file against the
  snapshot and renders the verdict.

  Zero tolerance: one shrunken file fails the whole run no matter how many
  others grew. Read errors are reported per file and never change ok.
*/
class IntegrityChecker {
 public:
  IntegrityChecker(storage::TableSourcePtr tables, std::shared_ptr<ShrinkageDiagnoser> diagnoser);

  model::IntegrityReport Check(const model::DatasetSnapshot& snapshot, const std::vector<std::filesystem::path>& tracked) const;

 private:
  model::FileCheck CheckFile(const model::DatasetSnapshot& snapshot, const std::filesystem::path& path, bool present) const;

  storage::TableSourcePtr             tables_;
  std::shared_ptr<ShrinkageDiagnoser> diagnoser_;
};

} // namespace dataguard::integrity
