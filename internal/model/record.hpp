#pragma once

#include <set>
#include <string>

namespace dataguard::model {

// Control number of a job posting, unique within a dataset file.
using RecordIdentifier = std::string;
using RecordIdSet      = std::set<RecordIdentifier>;

struct RecordDetails {
  RecordIdentifier id;
  std::string      title;
  std::string      organization;
  std::string      open_date;
};

} // namespace dataguard::model
