#include "parquet_table_source.hpp"

#include <arrow/io/file.h>
#include <arrow/io/memory.h>
#include <parquet/arrow/reader.h>
#include <parquet/exception.h>

#include "internal/storage/common/arrow_utils.hpp"

namespace dataguard::storage {

using namespace dataguard::storage::common;

ParquetTableSource::ParquetTableSource(arrow::MemoryPool* pool)
    : pool_(pool) {}

/*
  Read a whole dataset file from disk.
*/
std::shared_ptr<arrow::Table>
ParquetTableSource::Load(const std::filesystem::path& path) {

  auto input = Unwrap(arrow::io::ReadableFile::Open(path.string(), pool_));
  return ReadTable(std::move(input));
}

/*
  Decode bytes fetched from version control.
*/
std::shared_ptr<arrow::Table>
ParquetTableSource::Parse(const std::shared_ptr<arrow::Buffer>& content) {

  if (!content)
    throw util::TableReadError("no content to parse");

  return ReadTable(std::make_shared<arrow::io::BufferReader>(content));
}

std::shared_ptr<arrow::Table>
ParquetTableSource::ReadTable(std::shared_ptr<arrow::io::RandomAccessFile> input) {

  // the parquet footer parser reports corruption by throwing
  try {
    auto reader = Unwrap(parquet::arrow::OpenFile(std::move(input), pool_));

    std::shared_ptr<arrow::Table> table;
    Unwrap(reader->ReadTable(&table));
    return table;
  }
  catch (const parquet::ParquetException& e) {
    throw util::TableReadError(e.what());
  }
}

}
