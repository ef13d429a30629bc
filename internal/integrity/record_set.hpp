#pragma once

#include <arrow/table.h>

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/record.hpp"

namespace dataguard::integrity {

using model::RecordDetails;
using model::RecordIdentifier;
using model::RecordIdSet;

/*
  Dataset files come in two identifier spellings:

    Current → usajobs_control_number
    Legacy  → usajobsControlNumber

  The variant is resolved once per loaded table. When both columns exist
  the current spelling wins.
*/
enum class SchemaVariant {
  Current,
  Legacy,
  Unknown
};

inline constexpr std::string_view kCurrentIdentifierColumn = "usajobs_control_number";
inline constexpr std::string_view kLegacyIdentifierColumn  = "usajobsControlNumber";

inline constexpr std::string_view kTitleColumn        = "positionTitle";
inline constexpr std::string_view kOrganizationColumn = "hiringAgencyName";
inline constexpr std::string_view kOpenDateColumn     = "positionOpenDate";

inline constexpr std::string_view kUnknownField = "Unknown";

SchemaVariant DetectSchemaVariant(const arrow::Schema& schema);

// Empty for SchemaVariant::Unknown.
std::string_view IdentifierColumn(SchemaVariant variant);

std::string_view ToString(SchemaVariant variant);

struct RecordSet {
  SchemaVariant variant = SchemaVariant::Unknown;
  RecordIdSet   ids;

  bool HasIdentifierColumn() const {
    return variant != SchemaVariant::Unknown;
  }
};

/*
  Unique identifiers of a table. Null and empty values are dropped.
  A table without an identifier column yields an empty set flagged Unknown.
*/
RecordSet ExtractRecordSet(const arrow::Table& table);

/*
  Rows of table whose identifier is in ids, in table order.
  Missing or null detail cells read as "Unknown".
*/
std::vector<RecordDetails> ResolveRecords(const arrow::Table& table, const RecordIdSet& ids);

} // namespace dataguard::integrity
