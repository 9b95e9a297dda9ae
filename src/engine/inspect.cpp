/// @file src/engine/inspect.cpp
/// @brief AdjustedArray::inspect — deterministic text dump for debugging.
///
/// Layout:
///
///     Adjusted Array (float64):
///
///     Data:
///     array([[0., 1., 2.],
///            [3., 4., 5.]])
///
///     Adjustments:
///     {1: [Float64Multiply(first_row=0, last_row=0, first_col=0, last_col=0, value=2.000000)]}
///
/// Cells are right-aligned to the widest cell of the buffer. Integral
/// floats keep a trailing point ("2.") so they read as floats.

#include "adjarr/adjusted_array.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <vector>

namespace adjarr {

namespace {

std::string format_cell(double v) {
    if (std::isfinite(v) && std::floor(v) == v) {
        return fmt::format("{:.0f}.", v);
    }
    return fmt::format("{:g}", v);
}

std::string format_cell(std::int64_t v)  { return fmt::format("{}", v); }

std::string format_timestamp(std::int64_t ns) {
    return ns == constants::NaT.value ? std::string("NaT") : fmt::format("{}", ns);
}

/// numpy-style rendering of a table of already-formatted cells.
std::string format_table(const std::vector<std::vector<std::string>>& cells,
                         const Shape& shape) {
    if (shape.rows == 0 || shape.cols == 0) {
        return fmt::format("array([], shape={})", to_string(shape));
    }

    std::size_t width = 0;
    for (const auto& row : cells) {
        for (const auto& cell : row) {
            width = std::max(width, cell.size());
        }
    }

    std::string out = "array([";
    for (std::size_t r = 0; r < cells.size(); ++r) {
        if (r > 0) out += ",\n       ";
        out += "[";
        for (std::size_t c = 0; c < cells[r].size(); ++c) {
            if (c > 0) out += ", ";
            out += fmt::format("{:>{}}", cells[r][c], width);
        }
        out += "]";
    }
    out += "])";
    return out;
}

template <typename T, typename Fmt>
std::vector<std::vector<std::string>> format_matrix(const Matrix<T>& m, Fmt&& fmt_cell) {
    std::vector<std::vector<std::string>> cells(static_cast<std::size_t>(m.rows()));
    for (Index r = 0; r < m.rows(); ++r) {
        auto& row = cells[static_cast<std::size_t>(r)];
        for (Index c = 0; c < m.cols(); ++c) {
            row.push_back(fmt_cell(m(r, c)));
        }
    }
    return cells;
}

}  // anonymous namespace

std::string AdjustedArray::inspect() const {
    const Shape shp = shape();

    const auto cells = std::visit([this](const auto& b) {
        using B = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<B, Float64Matrix>) {
            return format_matrix(b, [](double v) { return format_cell(v); });
        } else if constexpr (std::is_same_v<B, Int64Matrix>) {
            if (dtype_ == Dtype::Datetime64) {
                return format_matrix(b, format_timestamp);
            }
            return format_matrix(b, [](std::int64_t v) { return format_cell(v); });
        } else {
            StringRows rows = b.decode();
            for (auto& row : rows) {
                for (auto& cell : row) {
                    cell = fmt::format("'{}'", cell);
                }
            }
            return rows;
        }
    }, baseline_);

    return fmt::format("Adjusted Array ({}):\n"
                       "\n"
                       "Data:\n"
                       "{}\n"
                       "\n"
                       "Adjustments:\n"
                       "{}\n",
                       to_string(dtype_),
                       format_table(cells, shp),
                       to_string(*schedule_));
}

}  // namespace adjarr
