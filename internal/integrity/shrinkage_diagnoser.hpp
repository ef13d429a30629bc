#pragma once

#include <cstddef>

#include "internal/history/history_fetcher.hpp"
#include "internal/integrity/record_set.hpp"
#include "internal/model/dataset_file.hpp"
#include "internal/model/diagnosis.hpp"
#include "internal/storage/table_source.hpp"

namespace dataguard::integrity {

struct DiagnosisLimits {
  // removed records resolved to full rows up to this many
  std::size_t detail_limit = 10;
  // identifiers listed once detail_limit is exceeded
  std::size_t sample_size = 5;
};

model::DiffResult ComputeDiff(const RecordIdSet& historical_ids, const RecordIdSet& current_ids);

/*
  Explains a count drop by reconciling identifiers against the committed
  version of the file.

  Never throws: every failure becomes the outcome of the returned
  diagnosis. The verdict is already a failure when this runs.
*/
class ShrinkageDiagnoser {
 public:
  ShrinkageDiagnoser(storage::TableSourcePtr tables, history::HistoryFetcherPtr history, DiagnosisLimits limits = {});

  model::ShrinkageDiagnosis Diagnose(const model::FileCheck& check) const;

 private:
  void Reconcile(const arrow::Table& historical, const arrow::Table* current, model::ShrinkageDiagnosis& diagnosis) const;

  storage::TableSourcePtr    tables_;
  history::HistoryFetcherPtr history_;
  DiagnosisLimits            limits_;
};

} // namespace dataguard::integrity
