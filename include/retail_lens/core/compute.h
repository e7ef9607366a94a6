#pragma once
#include <memory>
#include <string>
#include <vector>

#include <arrow/array.h>
#include <arrow/compute/api.h>
#include <arrow/datum.h>

namespace retail_lens::compute {

// Runs a registered Arrow compute function; throws std::runtime_error naming
// the function when it fails.
arrow::Datum Call(std::string const &function,
                  std::vector<arrow::Datum> const &args,
                  arrow::compute::FunctionOptions const *options = nullptr);

// Call for functions that produce an array from array arguments
std::shared_ptr<arrow::Array>
CallArray(std::string const &function, std::vector<arrow::Datum> const &args,
          arrow::compute::FunctionOptions const *options = nullptr);

std::shared_ptr<arrow::Array>
CastArray(std::shared_ptr<arrow::Array> const &array,
          std::shared_ptr<arrow::DataType> const &type);

} // namespace retail_lens::compute
