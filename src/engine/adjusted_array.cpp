/// @file src/engine/adjusted_array.cpp
/// @brief AdjustedArray construction, validation and traversal entry point.

#include "adjarr/adjusted_array.hpp"
#include "adjarr/errors.hpp"
#include "adjarr/mask.hpp"

#include <fmt/format.h>

#include <type_traits>
#include <utility>

namespace adjarr {

// ─── missing_value_for ────────────────────────────────────────────────────────

MissingValue missing_value_for(Dtype dtype) {
    switch (dtype) {
        case Dtype::Float64:    return constants::FLOAT64_MISSING;
        case Dtype::Datetime64: return constants::NaT;
        case Dtype::Label:      return std::string{};
        case Dtype::Int64:      break;
    }
    throw ConfigurationError(fmt::format(
        "no default missing value for dtype {}", to_string(dtype)));
}

// ─── Factories ────────────────────────────────────────────────────────────────

AdjustedArray AdjustedArray::from_float64(const Float64Matrix& data,
                                          const OptionalMask& mask,
                                          AdjustmentSchedule adjustments,
                                          double missing_value,
                                          AdjustedArrayConfig config) {
    return AdjustedArray(Dtype::Float64,
                         apply_mask(data, mask, missing_value),
                         std::move(adjustments),
                         missing_value,
                         config);
}

AdjustedArray AdjustedArray::from_int64(const Int64Matrix& data,
                                        const OptionalMask& mask,
                                        AdjustmentSchedule adjustments,
                                        std::int64_t missing_value,
                                        AdjustedArrayConfig config) {
    return AdjustedArray(Dtype::Int64,
                         apply_mask(data, mask, missing_value),
                         std::move(adjustments),
                         missing_value,
                         config);
}

AdjustedArray AdjustedArray::from_datetime64(const Int64Matrix& data,
                                             const OptionalMask& mask,
                                             AdjustmentSchedule adjustments,
                                             Timestamp missing_value,
                                             AdjustedArrayConfig config) {
    return AdjustedArray(Dtype::Datetime64,
                         apply_mask(data, mask, missing_value.value),
                         std::move(adjustments),
                         missing_value,
                         config);
}

AdjustedArray AdjustedArray::from_strings(const StringRows& data,
                                          const OptionalMask& mask,
                                          AdjustmentSchedule adjustments,
                                          std::string missing_value,
                                          AdjustedArrayConfig config) {
    const LabelArray encoded = LabelArray::encode(data, missing_value);
    return AdjustedArray(Dtype::Label,
                         apply_mask(encoded, mask),
                         std::move(adjustments),
                         std::move(missing_value),
                         config);
}

AdjustedArray AdjustedArray::from_labels(const LabelArray& data,
                                         const OptionalMask& mask,
                                         AdjustmentSchedule adjustments,
                                         AdjustedArrayConfig config) {
    return AdjustedArray(Dtype::Label,
                         apply_mask(data, mask),
                         std::move(adjustments),
                         data.missing_value(),
                         config);
}

// ─── Construction ─────────────────────────────────────────────────────────────

AdjustedArray::AdjustedArray(Dtype dtype,
                             WindowTraversal::Buffer baseline,
                             AdjustmentSchedule adjustments,
                             MissingValue missing_value,
                             AdjustedArrayConfig config)
    : dtype_(dtype)
    , baseline_(std::move(baseline))
    , missing_value_(std::move(missing_value))
    , config_(config)
{
    schedule_ = std::make_shared<const AdjustmentSchedule>(
        validate_schedule(dtype_, shape(), std::move(adjustments),
                          config_.bounds_policy));
}

AdjustmentSchedule AdjustedArray::validate_schedule(Dtype dtype,
                                                    const Shape& shape,
                                                    AdjustmentSchedule adjustments,
                                                    BoundsPolicy policy) {
    AdjustmentSchedule out;

    for (auto& [row, list] : adjustments) {
        if (row < 0) {
            throw ConfigurationError(fmt::format(
                "adjustment schedule key {} is negative", row));
        }

        std::vector<Adjustment> kept;
        kept.reserve(list.size());

        for (auto& adj : list) {
            const AdjustmentKind kind = kind_of(adj);
            if (!accepts(kind, dtype)) {
                throw ConfigurationError(fmt::format(
                    "{} at row {} cannot adjust a {} buffer",
                    to_string(kind), row, to_string(dtype)));
            }

            const Region& region = region_of(adj);
            if (region.fits(shape)) {
                kept.push_back(std::move(adj));
                continue;
            }

            if (policy == BoundsPolicy::Reject) {
                throw AdjustmentError(fmt::format(
                    "{} at row {} is outside data shape {}",
                    to_string(adj), row, to_string(shape)));
            }

            const Region clipped = region.clipped(shape);
            if (clipped.empty()) {
                continue;
            }
            kept.push_back(std::visit([&clipped](const auto& a) -> Adjustment {
                using A = std::decay_t<decltype(a)>;
                return A(clipped.first_row, clipped.last_row,
                         clipped.first_col, clipped.last_col, a.value());
            }, adj));
        }

        if (!kept.empty()) {
            out.emplace(row, std::move(kept));
        }
    }
    return out;
}

// ─── Accessors ────────────────────────────────────────────────────────────────

Shape AdjustedArray::shape() const noexcept {
    return std::visit([](const auto& b) {
        using B = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<B, LabelArray>) {
            return b.shape();
        } else {
            return shape_of(b);
        }
    }, baseline_);
}

const Float64Matrix& AdjustedArray::baseline_float64() const {
    if (const auto* b = std::get_if<Float64Matrix>(&baseline_)) {
        return *b;
    }
    throw DtypeError(fmt::format("baseline is {}, not float64", to_string(dtype_)));
}

const Int64Matrix& AdjustedArray::baseline_int64() const {
    if (const auto* b = std::get_if<Int64Matrix>(&baseline_)) {
        return *b;
    }
    throw DtypeError(fmt::format("baseline is {}, not int64", to_string(dtype_)));
}

const LabelArray& AdjustedArray::baseline_labels() const {
    if (const auto* b = std::get_if<LabelArray>(&baseline_)) {
        return *b;
    }
    throw DtypeError(fmt::format("baseline is {}, not label", to_string(dtype_)));
}

// ─── Traversal ────────────────────────────────────────────────────────────────

void AdjustedArray::check_window_length(Index window_length) const {
    if (window_length <= 0) {
        throw WindowLengthNotPositive(fmt::format(
            "window length must be positive, got {}", window_length));
    }
    const Index rows = shape().rows;
    if (window_length > rows) {
        throw WindowLengthTooLong(fmt::format(
            "window length {} exceeds the {} rows of the buffer",
            window_length, rows));
    }
}

Index AdjustedArray::window_count(Index window_length) const {
    check_window_length(window_length);
    return shape().rows - window_length + 1;
}

WindowTraversal AdjustedArray::traverse(Index window_length) const {
    check_window_length(window_length);

    // Label baselines are cloned so overwrites intern into a private
    // vocabulary rather than the shared baseline one.
    WindowTraversal::Buffer working = std::visit(
        [](const auto& b) -> WindowTraversal::Buffer {
            using B = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<B, LabelArray>) {
                return b.clone();
            } else {
                return b;
            }
        },
        baseline_);

    return WindowTraversal(dtype_, std::move(working), schedule_, window_length, config_);
}

}  // namespace adjarr
