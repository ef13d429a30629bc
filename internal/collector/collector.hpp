#pragma once

#include <memory>
#include <string>

namespace dataguard::collector {

struct CollectorOutcome {
  bool        success = false;
  // empty unless output capture is enabled
  std::string combined_output;
};

/*
  The external process that fetches and writes dataset files.

  Run() blocks until the process finishes. Failure is an input to the
  integrity check, never a reason to skip it.
*/
class Collector {
 public:
  virtual ~Collector() = default;

  virtual CollectorOutcome Run() = 0;
};

using CollectorPtr = std::shared_ptr<Collector>;

} // namespace dataguard::collector
