#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/record.hpp"

namespace dataguard::model {

/*
  Identifier reconciliation against the historical version.
  removed_ids and added_ids are disjoint by construction.
*/
struct DiffResult {
  RecordIdSet removed_ids;
  RecordIdSet added_ids;
};

enum class DiagnosisOutcome : std::uint8_t {
  // identifier diff computed
  kComplete = 0,
  // no identifier column in either version: counts only
  kCountsOnly = 1,
  // historical version could not be fetched or parsed
  kHistoryUnavailable = 2,
  // unexpected failure while diagnosing this file
  kError = 3,
};

constexpr const char* ToString(DiagnosisOutcome outcome) {
  switch (outcome) {
    case DiagnosisOutcome::kComplete:
      return "complete";
    case DiagnosisOutcome::kCountsOnly:
      return "counts_only";
    case DiagnosisOutcome::kHistoryUnavailable:
      return "history_unavailable";
    case DiagnosisOutcome::kError:
      return "error";
  }
  return "unknown";
}

struct ShrinkageDiagnosis {
  std::filesystem::path path;

  std::int64_t initial_count = 0;
  std::int64_t current_count = 0;

  DiagnosisOutcome outcome = DiagnosisOutcome::kError;
  std::string      message;

  std::optional<DiffResult> diff;

  // populated when the removed set is within the detail limit
  std::vector<RecordDetails> removed_records;

  // populated when the removed set exceeds the detail limit
  std::vector<RecordIdentifier> removed_sample;

  std::int64_t CountDelta() const {
    return current_count - initial_count;
  }
};

} // namespace dataguard::model
