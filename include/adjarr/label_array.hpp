#pragma once

/// @file include/adjarr/label_array.hpp
/// @brief Dictionary-encoded 2-D string arrays.
///
/// # Module: Label Encoder
///
/// ## Responsibility
/// Store a rectangular table of strings as a dense `CodeMatrix` plus a
/// growable `Vocabulary`. Code 0 is reserved for the array's missing value,
/// so a masked or unset cell always decodes to that value.
///
/// ## Sharing
/// A `LabelArray` holds its vocabulary through a `shared_ptr`. Views
/// (`LabelView`) and slices never copy it: they keep a reference to the same
/// table and narrow only the code array. New labels are appended, so codes
/// handed out earlier stay valid for every view.
///
/// ## Equality
/// Two label arrays compare equal when they decode to the same strings,
/// regardless of how either vocabulary numbered them.
///
/// ## Usage
/// ```cpp
/// auto labels = LabelArray::encode({{"AAPL", "MSFT"}, {"", "IBM"}}, "");
/// labels.assign(Region{0, 0, 1, 1}, "GOOG");
/// StringRows back = labels.decode();  // {{"AAPL", "GOOG"}, {"", "IBM"}}
/// ```

#include "adjarr/adjustment.hpp"
#include "adjarr/constants.hpp"
#include "adjarr/types.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace adjarr {

// ─── Vocabulary ───────────────────────────────────────────────────────────────

/// Append-only string table. Code 0 always holds the missing value.
///
/// References returned by `label()` and `missing_value()` stay valid for the
/// table's lifetime: interning never moves existing labels.
class Vocabulary {
public:
    explicit Vocabulary(std::string missing_value);

    /// Return the code of `label`, appending it if unseen.
    ///
    /// Throws ConfigurationError when the code space is exhausted.
    LabelCode intern(std::string_view label);

    /// Code of `label`, or nullopt if it has never been interned.
    [[nodiscard]] std::optional<LabelCode> find(std::string_view label) const;

    [[nodiscard]] bool contains(std::string_view label) const {
        return find(label).has_value();
    }

    /// Label for `code`. Throws DtypeError for a code this table never issued.
    [[nodiscard]] const std::string& label(LabelCode code) const;

    [[nodiscard]] const std::string& missing_value() const noexcept {
        return labels_.front();
    }

    [[nodiscard]] std::size_t size() const noexcept { return labels_.size(); }

    [[nodiscard]] const std::deque<std::string>& labels() const noexcept {
        return labels_;
    }

private:
    std::deque<std::string>                    labels_;
    std::unordered_map<std::string, LabelCode> codes_;
};

class LabelArray;

// ─── LabelView ────────────────────────────────────────────────────────────────

/// Read-only window onto a region of a label array's codes.
///
/// Valid while the array it was taken from is alive and unmodified. The
/// vocabulary itself is kept alive by the view.
class LabelView {
public:
    LabelView(ConstView<LabelCode> codes,
              std::shared_ptr<const Vocabulary> vocabulary) noexcept;

    [[nodiscard]] Shape shape() const noexcept { return Shape{rows_, cols_}; }
    [[nodiscard]] Index rows() const noexcept { return rows_; }
    [[nodiscard]] Index cols() const noexcept { return cols_; }

    [[nodiscard]] ConstView<LabelCode> codes() const noexcept {
        return ConstView<LabelCode>(data_, rows_, cols_, Eigen::OuterStride<>(stride_));
    }

    [[nodiscard]] LabelCode code(Index row, Index col) const noexcept {
        return data_[row * stride_ + col];
    }

    [[nodiscard]] const std::string& label(Index row, Index col) const {
        return vocabulary_->label(code(row, col));
    }

    [[nodiscard]] const Vocabulary& vocabulary() const noexcept { return *vocabulary_; }

    [[nodiscard]] const std::shared_ptr<const Vocabulary>& vocabulary_ptr() const noexcept {
        return vocabulary_;
    }

    [[nodiscard]] const std::string& missing_value() const noexcept {
        return vocabulary_->missing_value();
    }

    /// Narrower view sharing the same vocabulary and codes.
    ///
    /// Throws std::out_of_range if the requested block does not fit.
    [[nodiscard]] LabelView slice(Index first_row, Index rows,
                                  Index first_col, Index cols) const;

    [[nodiscard]] StringRows decode() const;

    [[nodiscard]] Mask is_missing() const;

    /// Elementwise `label == value`.
    [[nodiscard]] Mask matches(std::string_view value) const;

    friend bool operator==(const LabelView& a, const LabelView& b);

private:
    const LabelCode*                  data_;
    Index                             rows_;
    Index                             cols_;
    Index                             stride_;
    std::shared_ptr<const Vocabulary> vocabulary_;
};

// ─── LabelArray ───────────────────────────────────────────────────────────────

class LabelArray {
public:
    /// Encode variable-length strings. Every row must have the same length.
    ///
    /// Throws ConfigurationError on ragged input.
    [[nodiscard]] static LabelArray encode(const StringRows& values,
                                           std::string missing_value);

    /// Encode fixed-width byte strings laid out row-major, `width` bytes per
    /// cell, NUL-padded on the right (trailing NULs are stripped).
    ///
    /// Throws ConfigurationError if `bytes.size() != rows * cols * width`, or
    /// if `missing_value` cannot be stored in a cell of `width` bytes
    /// (too long, or contains a NUL byte).
    [[nodiscard]] static LabelArray encode_fixed_width(std::string_view bytes,
                                                       Shape shape,
                                                       std::size_t width,
                                                       std::string missing_value);

    /// Array of `shape` with every cell missing.
    [[nodiscard]] static LabelArray missing(Shape shape, std::string missing_value);

    [[nodiscard]] Shape shape() const noexcept { return shape_of(codes_); }
    [[nodiscard]] Index rows() const noexcept { return codes_.rows(); }
    [[nodiscard]] Index cols() const noexcept { return codes_.cols(); }

    [[nodiscard]] const CodeMatrix& codes() const noexcept { return codes_; }
    [[nodiscard]] const Vocabulary& vocabulary() const noexcept { return *vocabulary_; }

    [[nodiscard]] std::shared_ptr<const Vocabulary> vocabulary_ptr() const noexcept {
        return vocabulary_;
    }

    [[nodiscard]] const std::string& missing_value() const noexcept {
        return vocabulary_->missing_value();
    }

    [[nodiscard]] const std::string& label(Index row, Index col) const {
        return vocabulary_->label(codes_(row, col));
    }

    [[nodiscard]] LabelView view() const;

    /// Throws std::out_of_range if the requested block does not fit.
    [[nodiscard]] LabelView slice(Index first_row, Index rows,
                                  Index first_col, Index cols) const;

    [[nodiscard]] StringRows decode() const;

    /// Write `value` into every cell of `region`, interning it if unseen.
    ///
    /// Throws AdjustmentError if the region does not fit the array.
    void assign(const Region& region, std::string_view value);

    /// Set every cell where `where` is true to the missing value.
    ///
    /// Throws ConfigurationError on a shape mismatch.
    void set_missing(const Mask& where);

    [[nodiscard]] Mask is_missing() const;
    [[nodiscard]] Mask not_missing() const;

    [[nodiscard]] Mask matches(std::string_view value) const;

    /// Deep copy with a private vocabulary. Later `assign` calls on the copy
    /// never touch views of the original.
    [[nodiscard]] LabelArray clone() const;

    friend bool operator==(const LabelArray& a, const LabelArray& b);

private:
    LabelArray(CodeMatrix codes, std::shared_ptr<Vocabulary> vocabulary) noexcept;

    CodeMatrix                  codes_;
    std::shared_ptr<Vocabulary> vocabulary_;
};

}  // namespace adjarr
