#include <retail_lens/core/compute.h>

#include <stdexcept>

namespace retail_lens::compute {

arrow::Datum Call(std::string const &function,
                  std::vector<arrow::Datum> const &args,
                  arrow::compute::FunctionOptions const *options) {
  auto result = arrow::compute::CallFunction(function, args, options);
  if (!result.ok()) {
    throw std::runtime_error("Arrow " + function + " failed: " +
                             result.status().ToString());
  }
  return result.MoveValueUnsafe();
}

std::shared_ptr<arrow::Array>
CallArray(std::string const &function, std::vector<arrow::Datum> const &args,
          arrow::compute::FunctionOptions const *options) {
  return Call(function, args, options).make_array();
}

std::shared_ptr<arrow::Array>
CastArray(std::shared_ptr<arrow::Array> const &array,
          std::shared_ptr<arrow::DataType> const &type) {
  if (array->type()->Equals(*type)) {
    return array;
  }
  const arrow::compute::CastOptions options =
      arrow::compute::CastOptions::Safe(type);
  return Call("cast", {array}, &options).make_array();
}

} // namespace retail_lens::compute
