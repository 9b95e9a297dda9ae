/// @file src/engine/window_traversal.cpp
/// @brief WindowTraversal — the single-pass windowing state machine.
///
/// Each call to next():
///   1. computes the last row of the upcoming window, o + w − 1
///   2. applies every schedule entry keyed at or before that row which has
///      not been applied yet (the map is ordered, so this is a cursor walk)
///   3. returns a const view of rows [o, o + w)
///
/// Total work per traversal is O(rows + adjusted cells): every schedule
/// entry is visited once and the window itself is never copied.

#include "adjarr/adjusted_array.hpp"
#include "adjarr/errors.hpp"

#include "apply_adjustment.hpp"

#include <fmt/format.h>

#include <type_traits>

namespace adjarr {

// ─── Window ───────────────────────────────────────────────────────────────────

Window::Window(Dtype dtype, Index offset, Index rows, Index cols, Data data) noexcept
    : dtype_(dtype)
    , offset_(offset)
    , rows_(rows)
    , cols_(cols)
    , data_(std::move(data))
{}

ConstView<double> Window::float64() const {
    if (dtype_ != Dtype::Float64) {
        throw DtypeError(fmt::format("window is {}, not float64", to_string(dtype_)));
    }
    return ConstView<double>(std::get<const double*>(data_), rows_, cols_,
                             Eigen::OuterStride<>(cols_));
}

ConstView<std::int64_t> Window::int64() const {
    if (dtype_ != Dtype::Int64 && dtype_ != Dtype::Datetime64) {
        throw DtypeError(fmt::format("window is {}, not int64", to_string(dtype_)));
    }
    return ConstView<std::int64_t>(std::get<const std::int64_t*>(data_), rows_, cols_,
                                   Eigen::OuterStride<>(cols_));
}

LabelView Window::labels() const {
    if (dtype_ != Dtype::Label) {
        throw DtypeError(fmt::format("window is {}, not label", to_string(dtype_)));
    }
    return std::get<LabelView>(data_);
}

// ─── WindowTraversal ──────────────────────────────────────────────────────────

WindowTraversal::WindowTraversal(Dtype dtype,
                                 Buffer working,
                                 std::shared_ptr<const AdjustmentSchedule> schedule,
                                 Index window_length,
                                 AdjustedArrayConfig config)
    : dtype_(dtype)
    , working_(std::move(working))
    , schedule_(std::move(schedule))
    , next_entry_(schedule_->begin())
    , window_length_(window_length)
    , config_(config)
{
    const Index rows = std::visit([](const auto& b) { return b.rows(); }, working_);
    last_offset_ = rows - window_length_;

    if (config_.verbose) {
        fmt::print(stderr, "[adjarr] traverse dtype={} rows={} window={} windows={}\n",
                   to_string(dtype_), rows, window_length_, size());
    }
}

std::optional<Window> WindowTraversal::next() & {
    if (done()) {
        return std::nullopt;
    }

    advance_to(offset_ + window_length_ - 1);
    Window window = make_window();

    if (config_.verbose) {
        fmt::print(stderr, "[adjarr] window rows=[{}, {}] applied={}\n",
                   window.offset(), window.last_row(), applied_);
    }

    ++offset_;
    return window;
}

void WindowTraversal::advance_to(Index last_row) {
    while (next_entry_ != schedule_->end() && next_entry_->first <= last_row) {
        const auto& [row, adjustments] = *next_entry_;
        for (const Adjustment& adj : adjustments) {
            detail::apply_adjustment(working_, adj);
            ++applied_;
            if (config_.verbose) {
                fmt::print(stderr, "[adjarr] apply row={} {}\n", row, to_string(adj));
            }
        }
        ++next_entry_;
    }
}

Window WindowTraversal::make_window() const {
    return std::visit([this](const auto& b) -> Window {
        using B = std::decay_t<decltype(b)>;
        const Index cols = b.cols();
        if constexpr (std::is_same_v<B, LabelArray>) {
            return Window(dtype_, offset_, window_length_, cols,
                          b.slice(offset_, window_length_, 0, cols));
        } else {
            return Window(dtype_, offset_, window_length_, cols,
                          b.data() + offset_ * cols);
        }
    }, working_);
}

}  // namespace adjarr
