#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "dataguard_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
datasets:
  glob: "../../data/current_jobs_*.parquet"
collector:
  command: "python ./collect_current_data.py --data-dir ../../data"
  working_directory: "src/generate_data"
  required_file: "collect_current_data.py"
  capture_output: true
history:
  repository_root: ".."
  revision: "HEAD~1"
diagnosis:
  detail_limit: 20
  sample_size: 8
propagation:
  command: "./publish.sh"
)");

  auto config = dataguard::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.datasets().glob() == "../../data/current_jobs_*.parquet");
  assert(config.collector().capture_output());
  assert(config.collector().required_file() == "collect_current_data.py");
  assert(config.history().revision() == "HEAD~1");
  assert(config.diagnosis().detail_limit() == 20);
  assert(config.diagnosis().sample_size() == 8);
  assert(config.propagation().command() == "./publish.sh");
}

void TestDefaultsAreAppliedToMissingSections() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(collector:
  command: "true"
)");

  auto config = dataguard::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.collector().command() == "true");
  assert(config.datasets().glob() == dataguard::config::kDefaultDatasetGlob);
  assert(config.history().revision() == "HEAD");
  assert(config.diagnosis().detail_limit() == 10);
  assert(config.diagnosis().sample_size() == 5);
  assert(config.propagation().command().empty());
}

void TestQuotedNumericScalarStaysString() {
  const auto yaml_path = WriteYaml("quoted_numeric",
                                   R"(collector:
  command: "2025"
history:
  revision: "4242"
)");

  auto config = dataguard::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.collector().command() == "2025");
  assert(config.history().revision() == "4242");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(collector:
  command: "true"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)dataguard::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)dataguard::config::ConfigLoader::LoadFromYaml("/nonexistent/dataguard.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestDefaultsAreAppliedToMissingSections();
  TestQuotedNumericScalarStaysString();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "dataguard_unit_config_loader: pass\n";
  return 0;
}
