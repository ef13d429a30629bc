#include "arrow_utils.hpp"

#include <arrow/array/array_binary.h>
#include <arrow/array/array_primitive.h>
#include <arrow/scalar.h>
#include <arrow/type.h>

namespace dataguard::storage::common {

std::optional<std::string> CellToString(const arrow::Array& array, int64_t index) {
  if (array.IsNull(index)) {
    return std::nullopt;
  }

  switch (array.type_id()) {
    case arrow::Type::STRING:
      return static_cast<const arrow::StringArray&>(array).GetString(index);
    case arrow::Type::LARGE_STRING:
      return static_cast<const arrow::LargeStringArray&>(array).GetString(index);
    case arrow::Type::INT64:
      return std::to_string(static_cast<const arrow::Int64Array&>(array).Value(index));
    case arrow::Type::INT32:
      return std::to_string(static_cast<const arrow::Int32Array&>(array).Value(index));
    case arrow::Type::DICTIONARY: {
      const auto& dictionary_array = static_cast<const arrow::DictionaryArray&>(array);
      return CellToString(*dictionary_array.dictionary(), dictionary_array.GetValueIndex(index));
    }
    default: {
      auto scalar = Unwrap(array.GetScalar(index));
      return scalar->ToString();
    }
  }
}

} // namespace dataguard::storage::common
