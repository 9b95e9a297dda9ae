/// @file src/mask/mask.cpp
/// @brief Masking layer — shape validation and label masking.

#include "adjarr/mask.hpp"
#include "adjarr/errors.hpp"

#include <fmt/format.h>

namespace adjarr {

void validate_mask_shape(const Shape& data, const OptionalMask& mask) {
    if (!mask) {
        return;
    }
    const Shape mask_shape = shape_of(*mask);
    if (mask_shape != data) {
        throw ConfigurationError(fmt::format(
            "Mask shape {} != data shape {}", to_string(mask_shape), to_string(data)));
    }
}

LabelArray apply_mask(const LabelArray& data, const OptionalMask& mask) {
    validate_mask_shape(data.shape(), mask);

    LabelArray out = data.clone();
    if (mask) {
        out.set_missing((!mask->array()).matrix());
    }
    return out;
}

}  // namespace adjarr
