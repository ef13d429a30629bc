#include "internal/integrity/record_set.hpp"

#include <arrow/array/concatenate.h>

#include <memory>
#include <unordered_set>

#include "internal/storage/common/arrow_utils.hpp"

namespace dataguard::integrity {

using dataguard::storage::common::CellToString;
using dataguard::storage::common::Unwrap;

namespace {

// Column as one contiguous array; nullptr when absent or chunkless.
std::shared_ptr<arrow::Array> FlattenColumn(const arrow::Table& table, std::string_view name) {
  auto column = table.GetColumnByName(std::string(name));
  if (!column || column->num_chunks() == 0) {
    return nullptr;
  }
  if (column->num_chunks() == 1) {
    return column->chunk(0);
  }
  return Unwrap(arrow::Concatenate(column->chunks()));
}

std::string DetailAt(const std::shared_ptr<arrow::Array>& column, int64_t row) {
  if (!column || row >= column->length()) {
    return std::string(kUnknownField);
  }
  auto value = CellToString(*column, row);
  return value ? *value : std::string(kUnknownField);
}

} // namespace

SchemaVariant DetectSchemaVariant(const arrow::Schema& schema) {
  if (schema.GetFieldIndex(std::string(kCurrentIdentifierColumn)) >= 0) {
    return SchemaVariant::Current;
  }
  if (schema.GetFieldIndex(std::string(kLegacyIdentifierColumn)) >= 0) {
    return SchemaVariant::Legacy;
  }
  return SchemaVariant::Unknown;
}

std::string_view IdentifierColumn(SchemaVariant variant) {
  switch (variant) {
    case SchemaVariant::Current:
      return kCurrentIdentifierColumn;
    case SchemaVariant::Legacy:
      return kLegacyIdentifierColumn;
    case SchemaVariant::Unknown:
      break;
  }
  return {};
}

std::string_view ToString(SchemaVariant variant) {
  switch (variant) {
    case SchemaVariant::Current:
      return "current";
    case SchemaVariant::Legacy:
      return "legacy";
    case SchemaVariant::Unknown:
      break;
  }
  return "unknown";
}

RecordSet ExtractRecordSet(const arrow::Table& table) {
  RecordSet result;
  result.variant = DetectSchemaVariant(*table.schema());
  if (!result.HasIdentifierColumn()) {
    return result;
  }

  auto column = table.GetColumnByName(std::string(IdentifierColumn(result.variant)));
  for (const auto& chunk : column->chunks()) {
    for (int64_t i = 0; i < chunk->length(); ++i) {
      auto id = CellToString(*chunk, i);
      if (id && !id->empty()) {
        result.ids.insert(std::move(*id));
      }
    }
  }
  return result;
}

std::vector<RecordDetails> ResolveRecords(const arrow::Table& table, const RecordIdSet& ids) {
  std::vector<RecordDetails> records;

  const auto variant = DetectSchemaVariant(*table.schema());
  if (variant == SchemaVariant::Unknown || ids.empty()) {
    return records;
  }

  auto id_column = FlattenColumn(table, IdentifierColumn(variant));
  if (!id_column) {
    return records;
  }

  auto title_column        = FlattenColumn(table, kTitleColumn);
  auto organization_column = FlattenColumn(table, kOrganizationColumn);
  auto open_date_column    = FlattenColumn(table, kOpenDateColumn);

  std::unordered_set<std::string> seen;
  for (int64_t row = 0; row < id_column->length(); ++row) {
    auto id = CellToString(*id_column, row);
    if (!id || ids.count(*id) == 0 || !seen.insert(*id).second) {
      continue;
    }

    RecordDetails details;
    details.id           = *id;
    details.title        = DetailAt(title_column, row);
    details.organization = DetailAt(organization_column, row);
    details.open_date    = DetailAt(open_date_column, row);
    records.push_back(std::move(details));
  }

  return records;
}

} // namespace dataguard::integrity
