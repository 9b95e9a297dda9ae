/// @file src/adjustment/adjustment.cpp
/// @brief Adjustment records: validation, dtype compatibility and reprs.

#include "adjarr/adjustment.hpp"
#include "adjarr/constants.hpp"
#include "adjarr/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace adjarr {

// ─── Region ───────────────────────────────────────────────────────────────────

bool Region::fits(const Shape& shape) const noexcept {
    return first_row >= 0 && first_col >= 0 &&
           last_row < shape.rows && last_col < shape.cols;
}

Region Region::clipped(const Shape& shape) const noexcept {
    return Region{
        .first_row = std::max<Index>(first_row, 0),
        .last_row  = std::min<Index>(last_row, shape.rows - 1),
        .first_col = std::max<Index>(first_col, 0),
        .last_col  = std::min<Index>(last_col, shape.cols - 1),
    };
}

namespace detail {

void validate_region(AdjustmentKind kind, const Region& region) {
    if (region.first_row < 0 || region.first_col < 0) {
        throw AdjustmentError(fmt::format(
            "{}: negative bound (first_row={}, first_col={})",
            to_string(kind), region.first_row, region.first_col));
    }
    if (region.first_row > region.last_row) {
        throw AdjustmentError(fmt::format(
            "{}: first_row={} > last_row={}",
            to_string(kind), region.first_row, region.last_row));
    }
    if (region.first_col > region.last_col) {
        throw AdjustmentError(fmt::format(
            "{}: first_col={} > last_col={}",
            to_string(kind), region.first_col, region.last_col));
    }
}

}  // namespace detail

// ─── AdjustmentKind ───────────────────────────────────────────────────────────

const char* to_string(AdjustmentKind kind) noexcept {
    switch (kind) {
        case AdjustmentKind::Float64Multiply:     return "Float64Multiply";
        case AdjustmentKind::Float64Overwrite:    return "Float64Overwrite";
        case AdjustmentKind::Int64Overwrite:      return "Int64Overwrite";
        case AdjustmentKind::Datetime64Overwrite: return "Datetime64Overwrite";
        case AdjustmentKind::ObjectOverwrite:     return "ObjectOverwrite";
    }
    return "UnknownAdjustment";
}

bool accepts(AdjustmentKind kind, Dtype dtype) noexcept {
    switch (kind) {
        case AdjustmentKind::Float64Multiply:
        case AdjustmentKind::Float64Overwrite:
            return dtype == Dtype::Float64;
        case AdjustmentKind::Int64Overwrite:
            return dtype == Dtype::Int64;
        case AdjustmentKind::Datetime64Overwrite:
            return dtype == Dtype::Datetime64;
        case AdjustmentKind::ObjectOverwrite:
            return dtype == Dtype::Label;
    }
    return false;
}

// ─── Variant helpers ──────────────────────────────────────────────────────────

AdjustmentKind kind_of(const Adjustment& adj) noexcept {
    return std::visit([](const auto& a) { return std::decay_t<decltype(a)>::kind; }, adj);
}

const Region& region_of(const Adjustment& adj) noexcept {
    return std::visit([](const auto& a) -> const Region& { return a.region(); }, adj);
}

namespace {

std::string format_value(double v)              { return fmt::format("{:f}", v); }
std::string format_value(std::int64_t v)        { return fmt::format("{}", v); }
std::string format_value(const std::string& v)  { return fmt::format("'{}'", v); }

std::string format_value(Timestamp v) {
    if (v == constants::NaT) {
        return "NaT";
    }
    return fmt::format("{}ns", v.value);
}

}  // anonymous namespace

std::string to_string(const Adjustment& adj) {
    return std::visit([](const auto& a) {
        return fmt::format(
            "{}(first_row={}, last_row={}, first_col={}, last_col={}, value={})",
            to_string(a.kind), a.first_row(), a.last_row(),
            a.first_col(), a.last_col(), format_value(a.value()));
    }, adj);
}

std::string to_string(const AdjustmentSchedule& schedule) {
    std::string out = "{";
    bool first_key = true;
    for (const auto& [row, adjustments] : schedule) {
        if (!first_key) out += ", ";
        first_key = false;

        out += fmt::format("{}: [", row);
        for (std::size_t i = 0; i < adjustments.size(); ++i) {
            if (i > 0) out += ", ";
            out += to_string(adjustments[i]);
        }
        out += "]";
    }
    out += "}";
    return out;
}

Adjustment make_adjustment(AdjustmentKind kind,
                           Index first_row, Index last_row,
                           Index first_col, Index last_col,
                           double value) {
    switch (kind) {
        case AdjustmentKind::Float64Multiply:
            return Float64Multiply(first_row, last_row, first_col, last_col, value);
        case AdjustmentKind::Float64Overwrite:
            return Float64Overwrite(first_row, last_row, first_col, last_col, value);
        case AdjustmentKind::Int64Overwrite:
            // [-2^63, 2^63): the doubles that convert to int64 without overflow.
            if (!std::isfinite(value) || value < -9223372036854775808.0 ||
                value >= 9223372036854775808.0) {
                throw AdjustmentError(fmt::format(
                    "{} value {} is not representable as int64", to_string(kind), value));
            }
            return Int64Overwrite(first_row, last_row, first_col, last_col,
                                  static_cast<std::int64_t>(value));
        case AdjustmentKind::Datetime64Overwrite:
        case AdjustmentKind::ObjectOverwrite:
            break;
    }
    throw AdjustmentError(fmt::format(
        "{} does not take a numeric value", to_string(kind)));
}

}  // namespace adjarr
