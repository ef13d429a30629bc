#include "internal/collector/command_collector.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"

namespace {

using dataguard::collector::CommandCollector;

void TestSuccessfulCollectionCapturesOutput() {
  CommandCollector collector("printf 'Added 4 new jobs total\\n'; echo warn 1>&2", "", true);

  auto outcome = collector.Run();

  assert(outcome.success);
  assert(outcome.combined_output.find("Added 4 new jobs total") != std::string::npos);
  assert(outcome.combined_output.find("warn") != std::string::npos);
}

void TestOutputIsDroppedWithoutCapture() {
  CommandCollector collector("echo hidden", "", false);

  auto outcome = collector.Run();

  assert(outcome.success);
  assert(outcome.combined_output.empty());
}

void TestFailingCollectorIsReportedNotThrown() {
  CommandCollector collector("echo partial; exit 3", "", true);

  auto outcome = collector.Run();

  assert(!outcome.success);
  assert(outcome.combined_output.find("partial") != std::string::npos);
}

void TestCollectorRunsInWorkingDirectory() {
  const auto dir = std::filesystem::temp_directory_path() / "dataguard_command_collector_tests";
  std::filesystem::create_directories(dir);

  CommandCollector collector("pwd", dir.string(), true);

  auto outcome = collector.Run();

  assert(outcome.success);
  assert(outcome.combined_output.find(dir.filename().string()) != std::string::npos);
}

void TestEmptyCommandIsACommandError() {
  bool threw = false;
  try {
    dataguard::util::RunCommand("", nullptr, true);
  } catch (const dataguard::util::CommandError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    dataguard::util::CaptureCommand("");
  } catch (const dataguard::util::CommandError&) {
    threw = true;
  }
  assert(threw);
}

void TestCollectorThatCannotStartFailsCleanly() {
  CommandCollector collector("", "", true);

  auto outcome = collector.Run();

  assert(!outcome.success);
  assert(outcome.combined_output.empty());
}

} // namespace

int main() {
  TestSuccessfulCollectionCapturesOutput();
  TestOutputIsDroppedWithoutCapture();
  TestFailingCollectorIsReportedNotThrown();
  TestCollectorRunsInWorkingDirectory();
  TestEmptyCommandIsACommandError();
  TestCollectorThatCannotStartFailsCleanly();

  std::cout << "dataguard_unit_command_collector: pass\n";
  return 0;
}
