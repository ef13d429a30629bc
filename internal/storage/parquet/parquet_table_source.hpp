#pragma once

#include <arrow/io/interfaces.h>
#include <arrow/memory_pool.h>

#include "internal/storage/table_source.hpp"

namespace dataguard::storage {

/*
  Parquet datasets read through Arrow.

  Properties:
    - whole-file reads, no column projection
    - historical bytes parsed in memory, no temp files
*/

class ParquetTableSource final : public TableSource {
public:
  explicit ParquetTableSource(arrow::MemoryPool* pool = arrow::default_memory_pool());

  std::shared_ptr<arrow::Table>
  Load(const std::filesystem::path& path) override;

  std::shared_ptr<arrow::Table>
  Parse(const std::shared_ptr<arrow::Buffer>& content) override;

private:
  std::shared_ptr<arrow::Table>
  ReadTable(std::shared_ptr<arrow::io::RandomAccessFile> input);

  arrow::MemoryPool* pool_;
};

}
