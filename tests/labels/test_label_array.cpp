/// @file tests/labels/test_label_array.cpp
/// @brief LabelArray / LabelView: encoding, decoding, views and mutation.

#include "adjarr/constants.hpp"
#include "adjarr/errors.hpp"
#include "adjarr/label_array.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace adjarr;

namespace {

const StringRows kTickers{
    {"AAPL", "MSFT", ""},
    {"AAPL", "",     "IBM"},
    {"GOOG", "MSFT", "IBM"},
};

/// Pack `rows` as NUL-padded cells of `width` bytes.
std::string pack_fixed(const StringRows& rows, std::size_t width) {
    std::string out;
    for (const auto& row : rows) {
        for (const auto& cell : row) {
            std::string padded = cell;
            padded.resize(width, '\0');
            out += padded;
        }
    }
    return out;
}

}  // anonymous namespace

// ─── Encoding ─────────────────────────────────────────────────────────────────

TEST(LabelArrayEncode, DecodeRoundTripsIncludingMissing) {
    const auto labels = LabelArray::encode(kTickers, "");
    EXPECT_EQ(labels.shape(), (Shape{3, 3}));
    EXPECT_EQ(labels.decode(), kTickers);
    EXPECT_EQ(labels.missing_value(), "");
}

TEST(LabelArrayEncode, MissingCellsUseCodeZero) {
    const auto labels = LabelArray::encode(kTickers, "");
    EXPECT_EQ(labels.codes()(0, 2), constants::MISSING_LABEL_CODE);
    EXPECT_EQ(labels.codes()(1, 1), constants::MISSING_LABEL_CODE);
    EXPECT_NE(labels.codes()(0, 0), constants::MISSING_LABEL_CODE);

    Mask expected(3, 3);
    expected << false, false, true,
                false, true,  false,
                false, false, false;
    EXPECT_EQ(labels.is_missing(), expected);
    EXPECT_EQ(labels.not_missing(), Mask((!expected.array()).matrix()));
}

TEST(LabelArrayEncode, NonEmptyMissingValue) {
    const auto labels = LabelArray::encode({{"x", "?"}}, "?");
    EXPECT_TRUE(labels.is_missing()(0, 1));
    EXPECT_FALSE(labels.is_missing()(0, 0));
    // The empty string is an ordinary label when it is not the missing value.
    const auto other = LabelArray::encode({{""}}, "?");
    EXPECT_FALSE(other.is_missing()(0, 0));
}

TEST(LabelArrayEncode, RaggedInputThrows) {
    EXPECT_THROW((void)LabelArray::encode({{"a", "b"}, {"c"}}, ""), ConfigurationError);
}

TEST(LabelArrayEncode, EmptyInput) {
    const auto labels = LabelArray::encode({}, "");
    EXPECT_EQ(labels.shape(), (Shape{0, 0}));
    EXPECT_TRUE(labels.decode().empty());
}

TEST(LabelArrayEncode, MissingArray) {
    const auto labels = LabelArray::missing(Shape{2, 4}, "NA");
    EXPECT_EQ(labels.shape(), (Shape{2, 4}));
    EXPECT_TRUE(labels.is_missing().all());
    EXPECT_EQ(labels.label(1, 3), "NA");
}

// ─── Fixed-width Encoding ─────────────────────────────────────────────────────

TEST(LabelArrayFixedWidth, EqualsVariableWidthEncoding) {
    const auto fixed = LabelArray::encode_fixed_width(pack_fixed(kTickers, 4),
                                                      Shape{3, 3}, 4, "");
    const auto variable = LabelArray::encode(kTickers, "");
    EXPECT_EQ(fixed, variable);
    EXPECT_EQ(fixed.decode(), kTickers);
}

TEST(LabelArrayFixedWidth, MissingValueLongerThanWidthThrows) {
    EXPECT_THROW((void)LabelArray::encode_fixed_width(pack_fixed(kTickers, 4),
                                                      Shape{3, 3}, 4, "TOO LONG"),
                 ConfigurationError);
}

TEST(LabelArrayFixedWidth, MissingValueWithNulThrows) {
    EXPECT_THROW((void)LabelArray::encode_fixed_width(pack_fixed(kTickers, 4),
                                                      Shape{3, 3}, 4, std::string("a\0", 2)),
                 ConfigurationError);
}

TEST(LabelArrayFixedWidth, WrongBufferSizeThrows) {
    EXPECT_THROW((void)LabelArray::encode_fixed_width("abc", Shape{2, 2}, 1, ""),
                 ConfigurationError);
}

TEST(LabelArrayFixedWidth, FullWidthCellsKeepEveryByte) {
    const std::string bytes("abcdxy\0\0", 8);
    const auto full = LabelArray::encode_fixed_width(bytes, Shape{1, 2}, 4, "");
    EXPECT_EQ(full.label(0, 0), "abcd");
    EXPECT_EQ(full.label(0, 1), "xy");
}

// ─── Views ────────────────────────────────────────────────────────────────────

TEST(LabelView, SharesVocabularyWithArray) {
    const auto labels = LabelArray::encode(kTickers, "");
    const LabelView view = labels.view();
    const LabelView block = labels.slice(1, 2, 1, 2);

    EXPECT_EQ(view.vocabulary_ptr(), labels.vocabulary_ptr());
    EXPECT_EQ(block.vocabulary_ptr(), labels.vocabulary_ptr());
    EXPECT_EQ(&block.vocabulary(), &labels.vocabulary());
}

TEST(LabelView, SliceSelectsBlock) {
    const auto labels = LabelArray::encode(kTickers, "");
    const LabelView block = labels.slice(1, 2, 1, 2);
    EXPECT_EQ(block.shape(), (Shape{2, 2}));

    const StringRows expected{{"", "IBM"}, {"MSFT", "IBM"}};
    EXPECT_EQ(block.decode(), expected);
    EXPECT_EQ(block.label(1, 0), "MSFT");
    EXPECT_EQ(block.missing_value(), "");

    const LabelView inner = block.slice(1, 1, 0, 2);
    EXPECT_EQ(inner.decode(), (StringRows{{"MSFT", "IBM"}}));
}

TEST(LabelView, SliceOutOfBoundsThrows) {
    const auto labels = LabelArray::encode(kTickers, "");
    EXPECT_THROW((void)labels.slice(2, 2, 0, 1), std::out_of_range);
    EXPECT_THROW((void)labels.slice(0, 1, -1, 1), std::out_of_range);
    EXPECT_THROW((void)labels.view().slice(0, 4, 0, 1), std::out_of_range);
}

TEST(LabelView, MatchesAndMissing) {
    const auto labels = LabelArray::encode(kTickers, "");
    const LabelView view = labels.slice(0, 2, 0, 3);

    Mask aapl(2, 3);
    aapl << true,  false, false,
            true,  false, false;
    EXPECT_EQ(view.matches("AAPL"), aapl);
    EXPECT_FALSE(view.matches("TSLA").any());

    Mask missing(2, 3);
    missing << false, false, true,
               false, true,  false;
    EXPECT_EQ(view.is_missing(), missing);
    EXPECT_EQ(labels.matches("IBM").count(), 2);
}

TEST(LabelView, EqualityIsByLabelNotCode) {
    // Same strings, interned in different orders.
    const auto a = LabelArray::encode({{"x", "y"}}, "");
    const auto b = LabelArray::encode({{"y", "x"}, {"x", "y"}}, "");
    EXPECT_NE(a.codes()(0, 0), b.codes()(1, 0));
    EXPECT_EQ(a.view(), b.slice(1, 1, 0, 2));
    EXPECT_FALSE(a.view() == b.slice(0, 1, 0, 2));
    EXPECT_FALSE(a.view() == b.view());
}

// ─── Mutation ─────────────────────────────────────────────────────────────────

TEST(LabelArrayAssign, InternsNewLabel) {
    auto labels = LabelArray::encode(kTickers, "");
    const std::size_t before = labels.vocabulary().size();

    labels.assign(Region{0, 1, 0, 0}, "TSLA");
    EXPECT_EQ(labels.vocabulary().size(), before + 1);
    EXPECT_EQ(labels.label(0, 0), "TSLA");
    EXPECT_EQ(labels.label(1, 0), "TSLA");
    EXPECT_EQ(labels.label(2, 0), "GOOG");
}

TEST(LabelArrayAssign, ExistingViewsSeeNewLabels) {
    auto labels = LabelArray::encode(kTickers, "");
    const LabelView view = labels.view();

    labels.assign(Region{2, 2, 2, 2}, "NFLX");
    EXPECT_EQ(view.label(2, 2), "NFLX");
}

TEST(LabelArrayAssign, MissingValueAssignsCodeZero) {
    auto labels = LabelArray::encode(kTickers, "");
    labels.assign(Region{0, 0, 0, 1}, "");
    EXPECT_EQ(labels.codes()(0, 0), constants::MISSING_LABEL_CODE);
    EXPECT_EQ(labels.codes()(0, 1), constants::MISSING_LABEL_CODE);
}

TEST(LabelArrayAssign, RegionOutsideArrayThrows) {
    auto labels = LabelArray::encode(kTickers, "");
    EXPECT_THROW(labels.assign(Region{0, 3, 0, 0}, "x"), AdjustmentError);
    EXPECT_EQ(labels.decode(), kTickers);
}

TEST(LabelArrayAssign, HeldLabelReferencesSurviveNewLabels) {
    auto labels = LabelArray::encode(kTickers, "NA");
    const LabelView view = labels.view();
    const std::string& missing = labels.missing_value();
    const std::string& view_missing = view.missing_value();
    const std::string& ibm = view.label(1, 2);

    for (int i = 0; i < 64; ++i) {
        labels.assign(Region{0, 0, 0, 0}, "label" + std::to_string(i));
    }
    EXPECT_EQ(missing, "NA");
    EXPECT_EQ(view_missing, "NA");
    EXPECT_EQ(ibm, "IBM");
    EXPECT_EQ(view.label(0, 0), "label63");
}

TEST(LabelArraySetMissing, MarksSelectedCells) {
    auto labels = LabelArray::encode(kTickers, "");
    Mask where = Mask::Constant(3, 3, false);
    where(2, 0) = true;
    labels.set_missing(where);
    EXPECT_EQ(labels.label(2, 0), "");
    EXPECT_EQ(labels.label(2, 1), "MSFT");

    EXPECT_THROW(labels.set_missing(Mask::Constant(2, 3, true)), ConfigurationError);
}

TEST(LabelArrayClone, HasIndependentVocabulary) {
    const auto original = LabelArray::encode(kTickers, "");
    const LabelView original_view = original.view();

    auto copy = original.clone();
    EXPECT_EQ(copy, original);
    EXPECT_NE(copy.vocabulary_ptr(), original.vocabulary_ptr());

    copy.assign(Region{0, 2, 0, 2}, "NEW");
    EXPECT_FALSE(original.vocabulary().contains("NEW"));
    EXPECT_EQ(original_view.decode(), kTickers);
    EXPECT_FALSE(copy == original);
}
