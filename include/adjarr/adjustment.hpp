#pragma once

/// @file include/adjarr/adjustment.hpp
/// @brief Immutable adjustment records and the adjustment schedule.
///
/// # Module: Adjustments
///
/// ## Responsibility
/// Describe a rectangular region of a buffer and an operation to apply to it
/// once a traversal reaches the adjustment's effective row:
///   - scale-multiply: `buffer[r, c] *= value`
///   - overwrite:      `buffer[r, c]  = value`
///
/// All bounds are inclusive. One record type exists per (operation × dtype
/// family); `Adjustment` is the closed tagged union of them.
///
/// ## Guarantees
/// - Records are immutable once constructed
/// - Construction fails with AdjustmentError when `first > last` or any
///   bound is negative
/// - Whether a region fits a particular buffer is checked by the engine,
///   not here

#include "adjarr/types.hpp"

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace adjarr {

// ─── Region ───────────────────────────────────────────────────────────────────

/// Inclusive rectangular region `[first_row, last_row] × [first_col, last_col]`.
struct Region {
    Index first_row;
    Index last_row;
    Index first_col;
    Index last_col;

    [[nodiscard]] Index rows() const noexcept { return last_row - first_row + 1; }
    [[nodiscard]] Index cols() const noexcept { return last_col - first_col + 1; }

    /// True if the whole region lies inside a buffer of the given shape.
    [[nodiscard]] bool fits(const Shape& shape) const noexcept;

    /// Intersect with a buffer of the given shape. The result may be empty
    /// (`first > last` on some axis), see `empty()`.
    [[nodiscard]] Region clipped(const Shape& shape) const noexcept;

    [[nodiscard]] bool empty() const noexcept {
        return first_row > last_row || first_col > last_col;
    }

    friend bool operator==(const Region& a, const Region& b) noexcept {
        return a.first_row == b.first_row && a.last_row == b.last_row &&
               a.first_col == b.first_col && a.last_col == b.last_col;
    }
};

// ─── AdjustmentKind ───────────────────────────────────────────────────────────

enum class AdjustmentKind : std::uint8_t {
    Float64Multiply,
    Float64Overwrite,
    Int64Overwrite,
    Datetime64Overwrite,
    ObjectOverwrite,
};

[[nodiscard]] const char* to_string(AdjustmentKind kind) noexcept;

/// True if adjustments of `kind` may be applied to a buffer of `dtype`.
[[nodiscard]] bool accepts(AdjustmentKind kind, Dtype dtype) noexcept;

// ─── Record Types ─────────────────────────────────────────────────────────────

namespace detail {

/// Shared storage for every concrete record: a validated region and a value.
template <AdjustmentKind K, typename V>
class AdjustmentRecord {
public:
    using value_type = V;
    static constexpr AdjustmentKind kind = K;

    AdjustmentRecord(Index first_row, Index last_row,
                     Index first_col, Index last_col,
                     V value);

    [[nodiscard]] const Region& region() const noexcept { return region_; }
    [[nodiscard]] Index first_row() const noexcept { return region_.first_row; }
    [[nodiscard]] Index last_row() const noexcept { return region_.last_row; }
    [[nodiscard]] Index first_col() const noexcept { return region_.first_col; }
    [[nodiscard]] Index last_col() const noexcept { return region_.last_col; }
    [[nodiscard]] const V& value() const noexcept { return value_; }

    friend bool operator==(const AdjustmentRecord& a,
                           const AdjustmentRecord& b) {
        return a.region_ == b.region_ && a.value_ == b.value_;
    }

private:
    Region region_;
    V      value_;
};

/// Throws AdjustmentError unless the region is well formed.
void validate_region(AdjustmentKind kind, const Region& region);

template <AdjustmentKind K, typename V>
AdjustmentRecord<K, V>::AdjustmentRecord(Index first_row, Index last_row,
                                         Index first_col, Index last_col,
                                         V value)
    : region_{first_row, last_row, first_col, last_col}
    , value_(std::move(value))
{
    validate_region(K, region_);
}

}  // namespace detail

/// Multiply every cell of the region by `value`. Float64 buffers only.
using Float64Multiply =
    detail::AdjustmentRecord<AdjustmentKind::Float64Multiply, double>;

using Float64Overwrite =
    detail::AdjustmentRecord<AdjustmentKind::Float64Overwrite, double>;

using Int64Overwrite =
    detail::AdjustmentRecord<AdjustmentKind::Int64Overwrite, std::int64_t>;

using Datetime64Overwrite =
    detail::AdjustmentRecord<AdjustmentKind::Datetime64Overwrite, Timestamp>;

/// Overwrite a region of a label buffer with a string. Strings not yet in
/// the buffer's vocabulary are interned when the adjustment is applied.
using ObjectOverwrite =
    detail::AdjustmentRecord<AdjustmentKind::ObjectOverwrite, std::string>;

/// Tagged union of every adjustment record.
using Adjustment = std::variant<Float64Multiply,
                                Float64Overwrite,
                                Int64Overwrite,
                                Datetime64Overwrite,
                                ObjectOverwrite>;

/// Effective row → adjustments that become visible once a window ending at
/// or after that row is emitted. Lists are applied in the order given.
using AdjustmentSchedule = std::map<Index, std::vector<Adjustment>>;

// ─── Free Functions ───────────────────────────────────────────────────────────

[[nodiscard]] AdjustmentKind kind_of(const Adjustment& adj) noexcept;

[[nodiscard]] const Region& region_of(const Adjustment& adj) noexcept;

/// Construction-style repr, e.g.
/// `Float64Multiply(first_row=2, last_row=3, first_col=0, last_col=0, value=4.000000)`.
[[nodiscard]] std::string to_string(const Adjustment& adj);

/// Repr of a whole schedule: `{4: [Float64Multiply(...)], 5: [...]}`.
[[nodiscard]] std::string to_string(const AdjustmentSchedule& schedule);

/// Build a record of `kind` over the region. Float64Multiply,
/// Float64Overwrite and Int64Overwrite take a numeric value.
///
/// Throws AdjustmentError if `kind` does not carry a numeric payload.
[[nodiscard]] Adjustment make_adjustment(AdjustmentKind kind,
                                         Index first_row, Index last_row,
                                         Index first_col, Index last_col,
                                         double value);

}  // namespace adjarr
