#pragma once

#include <string>

#include "config/config.pb.h"

namespace dataguard::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Missing optional settings are filled with defaults after parsing.
*/
class ConfigLoader {
 public:
  static dataguard::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(dataguard::runtime::config::RuntimeConfig& config);
};

inline constexpr const char* kDefaultDatasetGlob  = "data/current_jobs_*.parquet";
inline constexpr const char* kDefaultRevision     = "HEAD";
inline constexpr unsigned    kDefaultDetailLimit  = 10;
inline constexpr unsigned    kDefaultSampleSize   = 5;

} // namespace dataguard::config
