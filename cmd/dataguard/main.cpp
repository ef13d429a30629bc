#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/update_pipeline.hpp"

using dataguard::pipeline::RunStatus;
using dataguard::pipeline::UpdatePipeline;

namespace {

constexpr int kExitOk                = 0;
constexpr int kExitUsage             = 1;
constexpr int kExitFatal             = 2;
constexpr int kExitBlocked           = 3;
constexpr int kExitPropagationFailed = 4;

int ExitCode(RunStatus status) {
  switch (status) {
    case RunStatus::kPassed:
    case RunStatus::kNoChanges:
      return kExitOk;
    case RunStatus::kBlocked:
      return kExitBlocked;
    case RunStatus::kPropagationFailed:
      return kExitPropagationFailed;
  }
  return kExitFatal;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: dataguard <config.yaml> OR dataguard --config <config.yaml>" << std::endl;
    return kExitUsage;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = dataguard::config::ConfigLoader::LoadFromYaml(config_path);

    dataguard::observability::InitializeLogging(config.logging());

    DATAGUARD_LOG_INFO("Data pipeline update starting",
                       {dataguard::observability::StringField("datasets", config.datasets().glob())});

    // ------------------------------------------------------------
    // Build and run
    // ------------------------------------------------------------
    UpdatePipeline pipeline(dataguard::factory::BuildPipeline(config));
    auto           result = pipeline.Run();

    DATAGUARD_LOG_INFO("Update finished",
                       {dataguard::observability::StringField("status", dataguard::pipeline::ToString(result.status)),
                        dataguard::observability::BoolField("ok", result.verdict().ok),
                        dataguard::observability::BoolField("changed", result.verdict().changed),
                        dataguard::observability::BoolField("propagated", result.propagated)});

    dataguard::observability::ShutdownLogging();
    return ExitCode(result.status);
  } catch (const std::exception& e) {
    DATAGUARD_LOG_ERROR("Fatal error", {dataguard::observability::StringField("error", e.what())});
    dataguard::observability::ShutdownLogging();
    return kExitFatal;
  }
}
