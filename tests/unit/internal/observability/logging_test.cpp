#include "internal/observability/logging.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace {

using dataguard::observability::BoolField;
using dataguard::observability::IntField;
using dataguard::observability::StringField;

std::shared_ptr<spdlog::logger> CapturingLogger(std::ostringstream& out) {
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = std::make_shared<spdlog::logger>("dataguard_test", sink);
  logger->set_pattern("[%l] %v");
  logger->set_level(spdlog::level::trace);
  return logger;
}

void TestFieldsAreRenderedAsKeyValuePairs() {
  std::ostringstream out;
  spdlog::set_default_logger(CapturingLogger(out));

  DATAGUARD_LOG_INFO("Diagnosing file",
                     {StringField("file", "current_jobs_2025.parquet"), IntField("jobs_lost", 5), BoolField("vanished", false)});

  assert(out.str() == "[info] Diagnosing file file=current_jobs_2025.parquet jobs_lost=5 vanished=false\n");
}

void TestValuesWithSpacesAreQuoted() {
  std::ostringstream out;
  spdlog::set_default_logger(CapturingLogger(out));

  DATAGUARD_LOG_WARN("Removed job", {StringField("title", "Budget Analyst")});

  assert(out.str() == "[warning] Removed job title=\"Budget Analyst\"\n");
}

void TestDataLossIsLoggedAtCriticalLevel() {
  std::ostringstream out;
  spdlog::set_default_logger(CapturingLogger(out));

  DATAGUARD_LOG_CRITICAL("DATA LOSS DETECTED!", {IntField("shrunken_files", 2)});
  DATAGUARD_LOG_CRITICAL("no fields");

  const auto text = out.str();
  assert(text.find("[critical] DATA LOSS DETECTED! shrunken_files=2\n") == 0);
  assert(text.find("[critical] no fields\n") != std::string::npos);
}

} // namespace

int main() {
  TestFieldsAreRenderedAsKeyValuePairs();
  TestValuesWithSpacesAreQuoted();
  TestDataLossIsLoggedAtCriticalLevel();

  std::cout << "dataguard_unit_logging: pass\n";
  return 0;
}
