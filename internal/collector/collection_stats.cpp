#include "internal/collector/collection_stats.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>
#include <sstream>

namespace dataguard::collector {

namespace {

std::string ToLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string Trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

std::int64_t ParseCount(std::string digits) {
  digits.erase(std::remove(digits.begin(), digits.end(), ','), digits.end());
  return std::stoll(digits);
}

} // namespace

CollectionStats ParseCollectionOutput(std::string_view output) {
  static const std::regex kNewJobsTotal(R"(Added (\d+) new jobs total)");
  static const std::regex kJobsSaved(R"((\d+) jobs saved)");
  static const std::regex kSavedToFile(R"(Saved (\d+) jobs to (.+\.parquet))");
  static const std::regex kFileSummary(R"((current_jobs_\d+\.parquet): ([\d,]+) jobs)");
  static const std::regex kFailedDate(R"(Failed.*?(\d{4}-\d{2}-\d{2}))");

  CollectionStats stats;

  const std::string text(output);
  std::smatch       match;

  // "jobs saved" comes from the historical collector and overrides the total
  if (std::regex_search(text, match, kNewJobsTotal)) {
    stats.new_jobs = std::stoll(match[1].str());
  }
  if (std::regex_search(text, match, kJobsSaved)) {
    stats.new_jobs = std::stoll(match[1].str());
  }

  for (auto it = std::sregex_iterator(text.begin(), text.end(), kSavedToFile); it != std::sregex_iterator(); ++it) {
    const auto filename           = std::filesystem::path(Trim((*it)[2].str())).filename().string();
    stats.jobs_per_file[filename] = std::stoll((*it)[1].str());
  }

  // per-file totals only fill gaps left by explicit "Saved N jobs" lines
  for (auto it = std::sregex_iterator(text.begin(), text.end(), kFileSummary); it != std::sregex_iterator(); ++it) {
    stats.jobs_per_file.emplace((*it)[1].str(), ParseCount((*it)[2].str()));
  }

  const bool has_failures = text.find("CRITICAL DATA ISSUE") != std::string::npos || ToLower(text).find("failed") != std::string::npos;
  if (!has_failures) {
    return stats;
  }

  for (auto it = std::sregex_iterator(text.begin(), text.end(), kFailedDate); it != std::sregex_iterator(); ++it) {
    stats.failed_dates.push_back((*it)[1].str());
  }

  std::istringstream lines(text);
  std::string        line;
  while (stats.errors.size() < kMaxErrorLines && std::getline(lines, line)) {
    const auto lowered_line = ToLower(line);
    if (lowered_line.find("error") != std::string::npos || lowered_line.find("failed") != std::string::npos) {
      stats.errors.push_back(Trim(line));
    }
  }

  return stats;
}

} // namespace dataguard::collector
