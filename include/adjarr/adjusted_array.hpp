#pragma once

/// @file include/adjarr/adjusted_array.hpp
/// @brief Adjusted Array Engine — windowed traversal with point-in-time
///        adjustments.
///
/// # Module: Adjusted Array
///
/// ## Responsibility
/// Own a masked baseline buffer and an adjustment schedule, and produce the
/// sequence of fixed-length windows a rolling computation reads:
///
///   for o in 0 .. rows − w:
///       apply every not-yet-applied adjustment keyed at r ≤ o + w − 1
///       emit rows [o, o + w) of the working buffer, read-only
///
/// An adjustment keyed at row r records the last row whose un-adjusted value
/// was still valid, so it becomes visible to every window whose final row is
/// at or after r. Each adjustment is applied exactly once per traversal, in
/// increasing key order and, within one key, in list order.
///
/// ## Usage
/// ```cpp
/// AdjustmentSchedule adj;
/// adj[3].push_back(Float64Multiply(0, 2, 0, 0, 0.5));  // 2:1 split
/// auto prices = AdjustedArray::from_float64(data, NOMASK, std::move(adj));
/// for (const Window& w : prices.traverse(5)) {
///     consume(w.float64());
/// }
/// ```
///
/// ## Guarantees
/// - Construction validates mask shape, adjustment kinds and regions; a
///   constructed engine never fails mid-traversal
/// - `traverse()` never mutates the baseline; every call starts from it
/// - Windows are const views: writing through them does not compile
/// - Concurrent traversals of one engine are safe (each owns its buffer)

#include "adjarr/adjustment.hpp"
#include "adjarr/constants.hpp"
#include "adjarr/label_array.hpp"
#include "adjarr/mask.hpp"
#include "adjarr/types.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace adjarr {

// ─── AdjustedArrayConfig ──────────────────────────────────────────────────────

/// What to do with an adjustment whose region leaves the buffer.
enum class BoundsPolicy : std::uint8_t {
    Reject,  ///< Raise AdjustmentError at construction
    Clip,    ///< Intersect with the buffer; drop regions entirely outside it
};

struct AdjustedArrayConfig {
    /// Out-of-bounds adjustment handling.
    BoundsPolicy bounds_policy = BoundsPolicy::Reject;

    /// If true, emit one line per applied adjustment and emitted window to
    /// stderr.
    bool verbose = false;
};

// ─── MissingValue ─────────────────────────────────────────────────────────────

/// A missing value of any supported dtype.
using MissingValue = std::variant<double, std::int64_t, Timestamp, std::string>;

/// Default missing value for `dtype`: NaN, NaT or the empty string.
///
/// Throws ConfigurationError for Dtype::Int64, which has no natural sentinel.
[[nodiscard]] MissingValue missing_value_for(Dtype dtype);

// ─── Window ───────────────────────────────────────────────────────────────────

/// One emitted window: rows [offset, offset + length) of a traversal's
/// working buffer, all columns.
///
/// A Window borrows from its WindowTraversal and is valid until that
/// traversal advances. Copy the data out to keep it longer.
class Window {
public:
    [[nodiscard]] Dtype dtype() const noexcept { return dtype_; }
    [[nodiscard]] Index offset() const noexcept { return offset_; }
    [[nodiscard]] Index rows() const noexcept { return rows_; }
    [[nodiscard]] Index cols() const noexcept { return cols_; }
    [[nodiscard]] Shape shape() const noexcept { return Shape{rows_, cols_}; }

    /// Last buffer row covered by this window.
    [[nodiscard]] Index last_row() const noexcept { return offset_ + rows_ - 1; }

    /// Throws DtypeError unless dtype() is Float64.
    [[nodiscard]] ConstView<double> float64() const;

    /// Raw storage of an Int64 or Datetime64 window.
    ///
    /// Throws DtypeError for other dtypes.
    [[nodiscard]] ConstView<std::int64_t> int64() const;

    /// Throws DtypeError unless dtype() is Label.
    [[nodiscard]] LabelView labels() const;

private:
    friend class WindowTraversal;

    using Data = std::variant<const double*, const std::int64_t*, LabelView>;

    Window(Dtype dtype, Index offset, Index rows, Index cols, Data data) noexcept;

    Dtype dtype_;
    Index offset_;
    Index rows_;
    Index cols_;
    Data  data_;
};

// ─── WindowTraversal ──────────────────────────────────────────────────────────

/// Single forward pass over one working copy of the baseline.
///
/// State: the working buffer, the next window offset and the first schedule
/// entry not yet applied. Produced by AdjustedArray::traverse().
class WindowTraversal {
public:
    /// Storage variants the engine works on.
    using Buffer = std::variant<Float64Matrix, Int64Matrix, LabelArray>;

    WindowTraversal(const WindowTraversal&) = delete;
    WindowTraversal& operator=(const WindowTraversal&) = delete;
    WindowTraversal(WindowTraversal&&) noexcept = default;
    WindowTraversal& operator=(WindowTraversal&&) noexcept = default;

    /// Apply every adjustment due for the next window and return it, or
    /// nullopt once all windows have been produced.
    ///
    /// Windows borrow the working buffer, so a temporary traversal cannot
    /// hand one out.
    [[nodiscard]] std::optional<Window> next() &;
    std::optional<Window> next() && = delete;

    [[nodiscard]] bool done() const noexcept { return offset_ > last_offset_; }

    /// Offset of the window next() will produce.
    [[nodiscard]] Index offset() const noexcept { return offset_; }

    [[nodiscard]] Index window_length() const noexcept { return window_length_; }

    /// Total number of windows: rows − window_length + 1.
    [[nodiscard]] Index size() const noexcept { return last_offset_ + 1; }

    /// Adjustments applied so far.
    [[nodiscard]] std::size_t applied() const noexcept { return applied_; }

    // ── Range support ────────────────────────────────────────────────────────

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using difference_type   = std::ptrdiff_t;
        using value_type        = Window;
        using reference         = const Window&;
        using pointer           = const Window*;

        iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            current_ = owner_->next();
            return *this;
        }

        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
            return !it.current_.has_value();
        }

    private:
        friend class WindowTraversal;

        explicit iterator(WindowTraversal* owner)
            : owner_(owner), current_(owner->next()) {}

        WindowTraversal*      owner_ = nullptr;
        std::optional<Window> current_;
    };

    /// Starts pulling windows from the current position.
    [[nodiscard]] iterator begin() & { return iterator(this); }
    iterator begin() && = delete;
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

private:
    friend class AdjustedArray;

    WindowTraversal(Dtype dtype,
                    Buffer working,
                    std::shared_ptr<const AdjustmentSchedule> schedule,
                    Index window_length,
                    AdjustedArrayConfig config);

    /// Apply schedule entries keyed at or before `last_row`.
    void advance_to(Index last_row);

    [[nodiscard]] Window make_window() const;

    Dtype                                     dtype_;
    Buffer                                    working_;
    std::shared_ptr<const AdjustmentSchedule> schedule_;
    AdjustmentSchedule::const_iterator        next_entry_;
    Index                                     window_length_;
    Index                                     offset_ = 0;
    Index                                     last_offset_;
    std::size_t                               applied_ = 0;
    AdjustedArrayConfig                       config_;
};

// ─── AdjustedArray ────────────────────────────────────────────────────────────

class AdjustedArray {
public:
    [[nodiscard]] static AdjustedArray
    from_float64(const Float64Matrix& data,
                 const OptionalMask& mask,
                 AdjustmentSchedule adjustments,
                 double missing_value = constants::FLOAT64_MISSING,
                 AdjustedArrayConfig config = AdjustedArrayConfig{});

    [[nodiscard]] static AdjustedArray
    from_int64(const Int64Matrix& data,
               const OptionalMask& mask,
               AdjustmentSchedule adjustments,
               std::int64_t missing_value,
               AdjustedArrayConfig config = AdjustedArrayConfig{});

    /// `data` holds nanoseconds since the epoch.
    [[nodiscard]] static AdjustedArray
    from_datetime64(const Int64Matrix& data,
                    const OptionalMask& mask,
                    AdjustmentSchedule adjustments,
                    Timestamp missing_value = constants::NaT,
                    AdjustedArrayConfig config = AdjustedArrayConfig{});

    /// Encode raw strings with `missing_value` as the reserved label.
    [[nodiscard]] static AdjustedArray
    from_strings(const StringRows& data,
                 const OptionalMask& mask,
                 AdjustmentSchedule adjustments,
                 std::string missing_value,
                 AdjustedArrayConfig config = AdjustedArrayConfig{});

    /// Use an already-encoded label array. Its missing value is the engine's.
    [[nodiscard]] static AdjustedArray
    from_labels(const LabelArray& data,
                const OptionalMask& mask,
                AdjustmentSchedule adjustments,
                AdjustedArrayConfig config = AdjustedArrayConfig{});

    [[nodiscard]] Dtype dtype() const noexcept { return dtype_; }
    [[nodiscard]] Shape shape() const noexcept;
    [[nodiscard]] const MissingValue& missing_value() const noexcept { return missing_value_; }
    [[nodiscard]] const AdjustmentSchedule& adjustments() const noexcept { return *schedule_; }
    [[nodiscard]] const AdjustedArrayConfig& config() const noexcept { return config_; }

    /// Masked baseline, before any adjustment. Throw DtypeError on mismatch.
    [[nodiscard]] const Float64Matrix& baseline_float64() const;
    [[nodiscard]] const Int64Matrix& baseline_int64() const;
    [[nodiscard]] const LabelArray& baseline_labels() const;

    /// Number of windows traverse(window_length) yields. Same checks.
    [[nodiscard]] Index window_count(Index window_length) const;

    /// Start a traversal over a fresh copy of the masked baseline.
    ///
    /// Throws WindowLengthNotPositive if `window_length <= 0`, and
    /// WindowLengthTooLong if it exceeds the number of rows, before any
    /// window is produced.
    [[nodiscard]] WindowTraversal traverse(Index window_length) const;

    /// Human-readable dump of the baseline and the schedule.
    [[nodiscard]] std::string inspect() const;

private:
    AdjustedArray(Dtype dtype,
                  WindowTraversal::Buffer baseline,
                  AdjustmentSchedule adjustments,
                  MissingValue missing_value,
                  AdjustedArrayConfig config);

    /// Check kinds and regions against the baseline; clip if configured.
    static AdjustmentSchedule validate_schedule(Dtype dtype,
                                                const Shape& shape,
                                                AdjustmentSchedule adjustments,
                                                BoundsPolicy policy);

    void check_window_length(Index window_length) const;

    Dtype                                     dtype_;
    WindowTraversal::Buffer                   baseline_;
    std::shared_ptr<const AdjustmentSchedule> schedule_;
    MissingValue                              missing_value_;
    AdjustedArrayConfig                       config_;
};

}  // namespace adjarr
