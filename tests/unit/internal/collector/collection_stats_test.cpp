#include "internal/collector/collection_stats.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using dataguard::collector::ParseCollectionOutput;

void TestNewJobsAndPerFileCounts() {
  const std::string output =
      "Fetching page 1 of 12\n"
      "Saved 120 jobs to /srv/data/current_jobs_2025.parquet\n"
      "Saved 3 jobs to ../../data/current_jobs_2024.parquet\n"
      "Added 123 new jobs total\n"
      "Final summary:\n"
      "  current_jobs_2025.parquet: 45,210 jobs\n"
      "  current_jobs_2023.parquet: 1,002 jobs\n";

  auto stats = ParseCollectionOutput(output);

  assert(stats.new_jobs == 123);
  assert(stats.jobs_per_file.size() == 3);
  // explicit "Saved" lines win over summary totals
  assert(stats.jobs_per_file.at("current_jobs_2025.parquet") == 120);
  assert(stats.jobs_per_file.at("current_jobs_2024.parquet") == 3);
  assert(stats.jobs_per_file.at("current_jobs_2023.parquet") == 1002);
  assert(stats.failed_dates.empty());
  assert(stats.errors.empty());
}

void TestHistoricalSavedPattern() {
  auto stats = ParseCollectionOutput("Done: 88 jobs saved\n");
  assert(stats.new_jobs == 88);
}

void TestFailuresCollectDatesAndAtMostThreeErrorLines() {
  const std::string output =
      "Failed to fetch 2025-01-03: HTTP 503\n"
      "Failed to fetch 2025-01-04: HTTP 503\n"
      "ERROR: retry budget exhausted\n"
      "error writing checkpoint\n"
      "Added 0 new jobs total\n";

  auto stats = ParseCollectionOutput(output);

  assert(stats.failed_dates.size() == 2);
  assert(stats.failed_dates[0] == "2025-01-03");
  assert(stats.failed_dates[1] == "2025-01-04");
  assert(stats.errors.size() == dataguard::collector::kMaxErrorLines);
  assert(stats.errors[2] == "ERROR: retry budget exhausted");
  assert(stats.new_jobs == 0);
}

void TestJobsSavedOverridesTotalRegardlessOfOrder() {
  auto stats = ParseCollectionOutput("12 jobs saved\nAdded 3 new jobs total\n");
  assert(stats.new_jobs == 12);

  stats = ParseCollectionOutput("Added 3 new jobs total\nAdded 9 new jobs total\n");
  assert(stats.new_jobs == 3);
}

void TestEveryFailedDateOnALineIsCollected() {
  auto stats = ParseCollectionOutput("Failed 2025-01-01 Failed 2025-01-02\n");

  assert(stats.failed_dates.size() == 2);
  assert(stats.failed_dates[0] == "2025-01-01");
  assert(stats.failed_dates[1] == "2025-01-02");
  assert(stats.errors.size() == 1);
}

void TestQuietOutputYieldsEmptyStats() {
  auto stats = ParseCollectionOutput("");
  assert(stats.new_jobs == 0);
  assert(stats.jobs_per_file.empty());
  assert(stats.errors.empty());
}

} // namespace

int main() {
  TestNewJobsAndPerFileCounts();
  TestHistoricalSavedPattern();
  TestFailuresCollectDatesAndAtMostThreeErrorLines();
  TestJobsSavedOverridesTotalRegardlessOfOrder();
  TestEveryFailedDateOnALineIsCollected();
  TestQuietOutputYieldsEmptyStats();

  std::cout << "dataguard_unit_collection_stats: pass\n";
  return 0;
}
