#pragma once

#include <memory>
#include <string>

#include "internal/model/verdict.hpp"

namespace dataguard::pipeline {

/*
  Downstream publication of a verified dataset state (commit, push, ...).
  Only invoked once the verdict allows propagation.
*/
class Propagator {
 public:
  virtual ~Propagator() = default;

  virtual bool Propagate(const model::IntegrityReport& report) = 0;
};

using PropagatorPtr = std::shared_ptr<Propagator>;

class CommandPropagator final : public Propagator {
 public:
  CommandPropagator(std::string command, std::string working_directory);

  bool Propagate(const model::IntegrityReport& report) override;

 private:
  std::string command_;
  std::string working_directory_;
};

} // namespace dataguard::pipeline
