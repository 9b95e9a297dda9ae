#pragma once

/// @file src/engine/apply_adjustment.hpp
/// @brief In-place application of one adjustment to a working buffer.
///
/// Internal to the engine. Callers guarantee that the adjustment kind is
/// accepted by the buffer's dtype and that its region fits the buffer;
/// AdjustedArray checks both once at construction so the traversal loop
/// does not.

#include "adjarr/adjusted_array.hpp"

namespace adjarr::detail {

/// Mutate `buffer` according to `adj`.
///
/// Throws DtypeError if the adjustment cannot act on the buffer variant.
void apply_adjustment(WindowTraversal::Buffer& buffer, const Adjustment& adj);

}  // namespace adjarr::detail
