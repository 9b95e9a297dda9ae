/// @file src/core/types.cpp
/// @brief String conversions for the shared primitive types.

#include "adjarr/types.hpp"

#include <fmt/format.h>

namespace adjarr {

const char* to_string(Dtype dtype) noexcept {
    switch (dtype) {
        case Dtype::Float64:    return "float64";
        case Dtype::Int64:      return "int64";
        case Dtype::Datetime64: return "datetime64[ns]";
        case Dtype::Label:      return "label";
    }
    return "unknown";
}

std::string to_string(const Shape& shape) {
    return fmt::format("({}, {})", shape.rows, shape.cols);
}

}  // namespace adjarr
