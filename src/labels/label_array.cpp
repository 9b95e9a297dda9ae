/// @file src/labels/label_array.cpp
/// @brief LabelArray and LabelView — dictionary-encoded string buffers.

#include "adjarr/label_array.hpp"
#include "adjarr/errors.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <utility>

namespace adjarr {

namespace {

void check_block(const Shape& shape, Index first_row, Index rows,
                 Index first_col, Index cols) {
    if (first_row < 0 || first_col < 0 || rows < 0 || cols < 0 ||
        first_row + rows > shape.rows || first_col + cols > shape.cols) {
        throw std::out_of_range(fmt::format(
            "block at ({}, {}) of shape ({}, {}) exceeds shape {}",
            first_row, first_col, rows, cols, to_string(shape)));
    }
}

StringRows decode_codes(const ConstView<LabelCode>& codes, const Vocabulary& vocab) {
    StringRows out(static_cast<std::size_t>(codes.rows()));
    for (Index r = 0; r < codes.rows(); ++r) {
        auto& row = out[static_cast<std::size_t>(r)];
        row.reserve(static_cast<std::size_t>(codes.cols()));
        for (Index c = 0; c < codes.cols(); ++c) {
            row.push_back(vocab.label(codes(r, c)));
        }
    }
    return out;
}

Mask matches_code(const ConstView<LabelCode>& codes,
                  const Vocabulary& vocab,
                  std::string_view value) {
    const auto code = vocab.find(value);
    if (!code) {
        return Mask::Constant(codes.rows(), codes.cols(), false);
    }
    return (codes.array() == *code).matrix();
}

/// Label-wise equality of two code blocks with possibly different vocabularies.
bool same_labels(const ConstView<LabelCode>& a, const Vocabulary& va,
                 const ConstView<LabelCode>& b, const Vocabulary& vb) {
    if (a.rows() != b.rows() || a.cols() != b.cols()) {
        return false;
    }
    if (&va == &vb) {
        return a == b;
    }
    for (Index r = 0; r < a.rows(); ++r) {
        for (Index c = 0; c < a.cols(); ++c) {
            if (va.label(a(r, c)) != vb.label(b(r, c))) {
                return false;
            }
        }
    }
    return true;
}

}  // anonymous namespace

// ─── LabelView ────────────────────────────────────────────────────────────────

LabelView::LabelView(ConstView<LabelCode> codes,
                     std::shared_ptr<const Vocabulary> vocabulary) noexcept
    : data_(codes.data())
    , rows_(codes.rows())
    , cols_(codes.cols())
    , stride_(codes.outerStride())
    , vocabulary_(std::move(vocabulary))
{}

LabelView LabelView::slice(Index first_row, Index rows,
                           Index first_col, Index cols) const {
    check_block(shape(), first_row, rows, first_col, cols);
    return LabelView(
        ConstView<LabelCode>(data_ + first_row * stride_ + first_col,
                             rows, cols, Eigen::OuterStride<>(stride_)),
        vocabulary_);
}

StringRows LabelView::decode() const {
    return decode_codes(codes(), *vocabulary_);
}

Mask LabelView::is_missing() const {
    return (codes().array() == constants::MISSING_LABEL_CODE).matrix();
}

Mask LabelView::matches(std::string_view value) const {
    return matches_code(codes(), *vocabulary_, value);
}

bool operator==(const LabelView& a, const LabelView& b) {
    return same_labels(a.codes(), *a.vocabulary_, b.codes(), *b.vocabulary_);
}

// ─── LabelArray construction ──────────────────────────────────────────────────

LabelArray::LabelArray(CodeMatrix codes, std::shared_ptr<Vocabulary> vocabulary) noexcept
    : codes_(std::move(codes))
    , vocabulary_(std::move(vocabulary))
{}

LabelArray LabelArray::encode(const StringRows& values, std::string missing_value) {
    const auto rows = static_cast<Index>(values.size());
    const auto cols = values.empty() ? Index{0} : static_cast<Index>(values.front().size());

    auto vocab = std::make_shared<Vocabulary>(std::move(missing_value));
    CodeMatrix codes(rows, cols);

    for (Index r = 0; r < rows; ++r) {
        const auto& row = values[static_cast<std::size_t>(r)];
        if (static_cast<Index>(row.size()) != cols) {
            throw ConfigurationError(fmt::format(
                "ragged string input: row {} has {} values, expected {}",
                r, row.size(), cols));
        }
        for (Index c = 0; c < cols; ++c) {
            codes(r, c) = vocab->intern(row[static_cast<std::size_t>(c)]);
        }
    }
    return LabelArray(std::move(codes), std::move(vocab));
}

LabelArray LabelArray::encode_fixed_width(std::string_view bytes,
                                          Shape shape,
                                          std::size_t width,
                                          std::string missing_value) {
    if (missing_value.size() > width) {
        throw ConfigurationError(fmt::format(
            "missing value '{}' does not fit in {}-byte strings",
            missing_value, width));
    }
    if (missing_value.find('\0') != std::string::npos) {
        throw ConfigurationError(
            "missing value contains a NUL byte, which fixed-width strings strip");
    }
    if (shape.rows < 0 || shape.cols < 0) {
        throw ConfigurationError(fmt::format("invalid shape {}", to_string(shape)));
    }

    const auto cells = static_cast<std::size_t>(shape.rows * shape.cols);
    if (bytes.size() != cells * width) {
        throw ConfigurationError(fmt::format(
            "fixed-width buffer holds {} bytes, expected {} ({} cells of {} bytes)",
            bytes.size(), cells * width, cells, width));
    }

    auto vocab = std::make_shared<Vocabulary>(std::move(missing_value));
    CodeMatrix codes(shape.rows, shape.cols);

    for (std::size_t i = 0; i < cells; ++i) {
        std::string_view cell = bytes.substr(i * width, width);
        const auto end = cell.find_last_not_of('\0');
        cell = (end == std::string_view::npos) ? std::string_view{} : cell.substr(0, end + 1);
        codes(static_cast<Index>(i) / shape.cols,
              static_cast<Index>(i) % shape.cols) = vocab->intern(cell);
    }
    return LabelArray(std::move(codes), std::move(vocab));
}

LabelArray LabelArray::missing(Shape shape, std::string missing_value) {
    return LabelArray(
        CodeMatrix::Constant(shape.rows, shape.cols, constants::MISSING_LABEL_CODE),
        std::make_shared<Vocabulary>(std::move(missing_value)));
}

// ─── LabelArray views ─────────────────────────────────────────────────────────

LabelView LabelArray::view() const {
    return LabelView(const_view(codes_, 0, rows(), 0, cols()), vocabulary_);
}

LabelView LabelArray::slice(Index first_row, Index rows,
                            Index first_col, Index cols) const {
    check_block(shape(), first_row, rows, first_col, cols);
    return LabelView(const_view(codes_, first_row, rows, first_col, cols), vocabulary_);
}

StringRows LabelArray::decode() const {
    return view().decode();
}

// ─── LabelArray mutation ──────────────────────────────────────────────────────

void LabelArray::assign(const Region& region, std::string_view value) {
    if (!region.fits(shape())) {
        throw AdjustmentError(fmt::format(
            "region rows [{}, {}] cols [{}, {}] outside label array of shape {}",
            region.first_row, region.last_row, region.first_col, region.last_col,
            to_string(shape())));
    }
    const LabelCode code = vocabulary_->intern(value);
    codes_.block(region.first_row, region.first_col, region.rows(), region.cols())
        .setConstant(code);
}

void LabelArray::set_missing(const Mask& where) {
    if (shape_of(where) != shape()) {
        throw ConfigurationError(fmt::format(
            "Mask shape {} != data shape {}",
            to_string(shape_of(where)), to_string(shape())));
    }
    codes_ = where.select(
        CodeMatrix::Constant(rows(), cols(), constants::MISSING_LABEL_CODE), codes_);
}

// ─── LabelArray queries ───────────────────────────────────────────────────────

Mask LabelArray::is_missing() const {
    return (codes_.array() == constants::MISSING_LABEL_CODE).matrix();
}

Mask LabelArray::not_missing() const {
    return (codes_.array() != constants::MISSING_LABEL_CODE).matrix();
}

Mask LabelArray::matches(std::string_view value) const {
    return view().matches(value);
}

LabelArray LabelArray::clone() const {
    return LabelArray(codes_, std::make_shared<Vocabulary>(*vocabulary_));
}

bool operator==(const LabelArray& a, const LabelArray& b) {
    return a.view() == b.view();
}

}  // namespace adjarr
