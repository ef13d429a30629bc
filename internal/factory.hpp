#pragma once

#include "config/config.pb.h"

#include "internal/pipeline/update_pipeline.hpp"

namespace dataguard::factory {

/*
  BuildPipeline

  Composition root: the ONLY place that knows the concrete table source,
  history fetcher, collector and propagator types.

  Throws util::ConfigError when the collector is not runnable from the
  configured working directory.
*/
pipeline::PipelineDependencies BuildPipeline(const dataguard::runtime::config::RuntimeConfig& config);

} // namespace dataguard::factory
