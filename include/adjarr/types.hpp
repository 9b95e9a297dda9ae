#pragma once

/// @file include/adjarr/types.hpp
/// @brief Shared primitive types for the adjusted-array engine.
///
/// Every module includes this file. It defines the dtype tags, the
/// Eigen-based 2-D buffer aliases and the small strong value types used
/// throughout the library.

#include <Eigen/Dense>

#include <cstdint>
#include <string>
#include <vector>

namespace adjarr {

using Index = Eigen::Index;

// ─── Dtype ────────────────────────────────────────────────────────────────────

/// Logical dtype of a buffer.
///
/// Datetime64 buffers share Int64 storage; the tag alone decides how values
/// are interpreted and which adjustments they accept.
enum class Dtype : std::uint8_t {
    Float64,     ///< IEEE double, missing value usually NaN
    Int64,       ///< signed 64-bit integer
    Datetime64,  ///< nanoseconds since the epoch, missing value NaT
    Label,       ///< dictionary-encoded strings (see LabelArray)
};

/// Canonical dtype name: "float64", "int64", "datetime64[ns]" or "label".
[[nodiscard]] const char* to_string(Dtype dtype) noexcept;

// ─── Strong Scalar Types ──────────────────────────────────────────────────────

/// A point in time, in nanoseconds since 1970-01-01T00:00:00Z.
struct Timestamp {
    std::int64_t value;

    friend bool operator==(Timestamp a, Timestamp b) noexcept {
        return a.value == b.value;
    }
};

/// Integer code of a label inside a Vocabulary.
using LabelCode = std::int32_t;

// ─── Buffer Aliases ───────────────────────────────────────────────────────────

/// Rows are chronological, columns are independent series. Row-major so that
/// a run of whole rows is one contiguous block.
template <typename T>
using Matrix = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

using Float64Matrix = Matrix<double>;
using Int64Matrix   = Matrix<std::int64_t>;
using CodeMatrix    = Matrix<LabelCode>;

/// Validity mask: `true` marks a valid position.
using Mask = Matrix<bool>;

/// Read-only, non-owning view of a rectangular region of a Matrix<T>.
template <typename T>
using ConstView = Eigen::Map<const Matrix<T>, Eigen::Unaligned, Eigen::OuterStride<>>;

/// Row-major table of raw strings, used for textual input and decode output.
using StringRows = std::vector<std::vector<std::string>>;

// ─── Shape ────────────────────────────────────────────────────────────────────

/// Rows × columns of a 2-D buffer.
struct Shape {
    Index rows{0};
    Index cols{0};

    friend bool operator==(const Shape& a, const Shape& b) noexcept {
        return a.rows == b.rows && a.cols == b.cols;
    }
};

/// Format as "(rows, cols)".
[[nodiscard]] std::string to_string(const Shape& shape);

template <typename Derived>
[[nodiscard]] Shape shape_of(const Eigen::DenseBase<Derived>& m) noexcept {
    return Shape{m.rows(), m.cols()};
}

/// Build a read-only view over `rows × cols` cells of `m` starting at
/// (`first_row`, `first_col`). Bounds are the caller's responsibility.
template <typename T>
[[nodiscard]] ConstView<T> const_view(const Matrix<T>& m,
                                      Index first_row, Index rows,
                                      Index first_col, Index cols) noexcept {
    return ConstView<T>(m.data() + first_row * m.cols() + first_col,
                        rows, cols, Eigen::OuterStride<>(m.cols()));
}

}  // namespace adjarr
