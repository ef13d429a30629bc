#include "internal/integrity/shrinkage_diagnoser.hpp"

#include <algorithm>
#include <iterator>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dataguard::integrity {

using dataguard::observability::IntField;
using dataguard::observability::StringField;

namespace {

std::string Join(const std::vector<RecordIdentifier>& ids) {
  std::string out;
  for (const auto& id : ids) {
    if (!out.empty()) out += ",";
    out += id;
  }
  return out;
}

} // namespace

model::DiffResult ComputeDiff(const RecordIdSet& historical_ids, const RecordIdSet& current_ids) {
  model::DiffResult diff;
  std::set_difference(historical_ids.begin(), historical_ids.end(), current_ids.begin(), current_ids.end(),
                      std::inserter(diff.removed_ids, diff.removed_ids.end()));
  std::set_difference(current_ids.begin(), current_ids.end(), historical_ids.begin(), historical_ids.end(),
                      std::inserter(diff.added_ids, diff.added_ids.end()));
  return diff;
}

ShrinkageDiagnoser::ShrinkageDiagnoser(storage::TableSourcePtr tables, history::HistoryFetcherPtr history, DiagnosisLimits limits)
    : tables_(std::move(tables)), history_(std::move(history)), limits_(limits) {}

model::ShrinkageDiagnosis ShrinkageDiagnoser::Diagnose(const model::FileCheck& check) const {
  model::ShrinkageDiagnosis diagnosis;
  diagnosis.path          = check.path;
  diagnosis.initial_count = check.initial_count;
  diagnosis.current_count = check.current_count;

  const auto file = check.path.filename().string();

  try {
    // ------------------------------------------------------------
    // Current state
    // ------------------------------------------------------------
    std::shared_ptr<arrow::Table> current;
    if (!check.vanished) {
      current                 = tables_->Load(check.path);
      diagnosis.current_count = current->num_rows();
    }

    DATAGUARD_LOG_INFO("Diagnosing file",
                       {StringField("file", file),
                        IntField("initial_jobs", diagnosis.initial_count),
                        IntField("current_jobs", diagnosis.current_count),
                        IntField("jobs_lost", -diagnosis.CountDelta()),
                        observability::BoolField("vanished", check.vanished)});

    // ------------------------------------------------------------
    // Historical version
    // ------------------------------------------------------------
    auto fetched = history_->Fetch(check.path);
    if (!fetched) {
      diagnosis.outcome = model::DiagnosisOutcome::kHistoryUnavailable;
      diagnosis.message = "historical comparison unavailable: " + fetched.message;
      DATAGUARD_LOG_WARN("Could not load previous version for detailed comparison",
                         {StringField("file", file), StringField("reason", fetched.message)});
      return diagnosis;
    }

    std::shared_ptr<arrow::Table> historical;
    try {
      historical = tables_->Parse(fetched.content);
    } catch (const util::TableReadError& e) {
      diagnosis.outcome = model::DiagnosisOutcome::kHistoryUnavailable;
      diagnosis.message = "historical comparison unavailable: " + std::string(e.what());
      DATAGUARD_LOG_WARN("Could not parse previous version for detailed comparison",
                         {StringField("file", file), StringField("error", e.what())});
      return diagnosis;
    }

    Reconcile(*historical, current.get(), diagnosis);
  } catch (const std::exception& e) {
    diagnosis.outcome = model::DiagnosisOutcome::kError;
    diagnosis.message = e.what();
    DATAGUARD_LOG_ERROR("Error during diagnosis", {StringField("file", file), StringField("error", e.what())});
  }

  return diagnosis;
}

void ShrinkageDiagnoser::Reconcile(const arrow::Table& historical, const arrow::Table* current, model::ShrinkageDiagnosis& diagnosis) const {
  const auto file = diagnosis.path.filename().string();

  auto historical_set = ExtractRecordSet(historical);

  // a vanished file holds no records under whatever schema it had
  RecordSet current_set;
  if (current) {
    current_set = ExtractRecordSet(*current);
  } else {
    current_set.variant = historical_set.variant;
  }

  if (!historical_set.HasIdentifierColumn() || !current_set.HasIdentifierColumn()) {
    diagnosis.outcome = model::DiagnosisOutcome::kCountsOnly;
    diagnosis.message = "no control number column found for comparison";
    DATAGUARD_LOG_WARN("No control number column found for comparison",
                       {StringField("file", file),
                        StringField("historical_schema", ToString(historical_set.variant)),
                        StringField("current_schema", ToString(current_set.variant))});
    return;
  }

  diagnosis.diff      = ComputeDiff(historical_set.ids, current_set.ids);
  const auto& removed = diagnosis.diff->removed_ids;

  DATAGUARD_LOG_INFO("Identifier reconciliation",
                     {StringField("file", file),
                      IntField("historical_jobs", static_cast<std::int64_t>(historical_set.ids.size())),
                      IntField("jobs_removed", static_cast<std::int64_t>(removed.size())),
                      IntField("jobs_added", static_cast<std::int64_t>(diagnosis.diff->added_ids.size()))});

  if (removed.empty()) {
    DATAGUARD_LOG_WARN("Count dropped but no control number vanished", {StringField("file", file)});
  } else if (removed.size() <= limits_.detail_limit) {
    diagnosis.removed_records = ResolveRecords(historical, removed);
    for (const auto& record : diagnosis.removed_records) {
      DATAGUARD_LOG_INFO("Removed job",
                         {StringField("control_number", record.id),
                          StringField("title", record.title),
                          StringField("agency", record.organization),
                          StringField("opened", record.open_date)});
    }
  } else {
    auto end = removed.begin();
    std::advance(end, static_cast<std::ptrdiff_t>(std::min(limits_.sample_size, removed.size())));
    diagnosis.removed_sample.assign(removed.begin(), end);

    DATAGUARD_LOG_INFO("Too many removed jobs to list",
                       {StringField("file", file),
                        IntField("total", static_cast<std::int64_t>(removed.size())),
                        StringField("first_control_numbers", Join(diagnosis.removed_sample))});
  }

  diagnosis.outcome = model::DiagnosisOutcome::kComplete;
  diagnosis.message = std::to_string(removed.size()) + " removed, " + std::to_string(diagnosis.diff->added_ids.size()) + " added";
}

} // namespace dataguard::integrity
