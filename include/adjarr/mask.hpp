#pragma once

/// @file include/adjarr/mask.hpp
/// @brief Masking layer: substitute a missing value at invalid positions.
///
/// # Module: Masking
///
/// ## Responsibility
/// Produce the masked baseline the engine traverses from:
///   out[r, c] = mask[r, c] ? data[r, c] : missing_value
///
/// `NOMASK` means every position is valid; the data is copied through.
///
/// ## Guarantees
/// - Caller memory is never modified: every function returns a new buffer
/// - A shape mismatch raises ConfigurationError naming both shapes, e.g.
///   "Mask shape (2, 3) != data shape (5, 5)"

#include "adjarr/label_array.hpp"
#include "adjarr/types.hpp"

#include <optional>

namespace adjarr {

/// Optional validity mask. `std::nullopt` (spelled NOMASK) means "no mask".
using OptionalMask = std::optional<Mask>;

/// Explicit "no mask" sentinel.
inline constexpr std::nullopt_t NOMASK = std::nullopt;

/// Throw ConfigurationError unless `mask` is absent or has shape `data`.
void validate_mask_shape(const Shape& data, const OptionalMask& mask);

/// Masked copy of a numeric buffer.
template <typename T>
[[nodiscard]] Matrix<T> apply_mask(const Matrix<T>& data,
                                   const OptionalMask& mask,
                                   T missing_value) {
    validate_mask_shape(shape_of(data), mask);
    if (!mask) {
        return data;
    }
    return mask->select(data, Matrix<T>::Constant(data.rows(), data.cols(),
                                                  missing_value));
}

/// Masked copy of a label array. Invalid cells take the array's missing code.
/// The copy has its own vocabulary.
[[nodiscard]] LabelArray apply_mask(const LabelArray& data,
                                    const OptionalMask& mask);

}  // namespace adjarr
