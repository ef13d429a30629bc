#pragma once

#include <arrow/buffer.h>
#include <arrow/table.h>

#include <cstdint>
#include <filesystem>
#include <memory>

namespace dataguard::storage {

/*
  Dataset table abstraction.

  Every dataset file is read as an arrow::Table. The integrity code never
  touches the on-disk format directly, only tables.

  Implementations:
    PARQUET → Arrow parquet reader
*/

class TableSource {
 public:
  virtual ~TableSource() = default;

  // ------------------------------------------------------------------
  // Load
  // ------------------------------------------------------------------
  /*
    Load the table stored at path.

    Throws util::TableReadError when the file is missing or corrupt.
  */
  virtual std::shared_ptr<arrow::Table> Load(const std::filesystem::path& path) = 0;

  // ------------------------------------------------------------------
  // Parse
  // ------------------------------------------------------------------
  /*
    Decode a table from raw file bytes (e.g. a historical version).
  */
  virtual std::shared_ptr<arrow::Table> Parse(const std::shared_ptr<arrow::Buffer>& content) = 0;

  // ------------------------------------------------------------------
  // Size
  // ------------------------------------------------------------------
  /*
    Size in bytes, informational only. Zero when it cannot be determined.
  */
  virtual uint64_t Size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
  }
};

using TableSourcePtr = std::shared_ptr<TableSource>;

} // namespace dataguard::storage
