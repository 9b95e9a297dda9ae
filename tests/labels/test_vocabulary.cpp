/// @file tests/labels/test_vocabulary.cpp
/// @brief Vocabulary: code assignment, lookup and the reserved missing code.

#include "adjarr/constants.hpp"
#include "adjarr/errors.hpp"
#include "adjarr/label_array.hpp"

#include <gtest/gtest.h>

#include <deque>
#include <string>

using namespace adjarr;

TEST(Vocabulary, MissingValueHoldsCodeZero) {
    Vocabulary vocab("N/A");
    EXPECT_EQ(vocab.size(), 1u);
    EXPECT_EQ(vocab.missing_value(), "N/A");
    EXPECT_EQ(vocab.label(constants::MISSING_LABEL_CODE), "N/A");
    EXPECT_EQ(vocab.intern("N/A"), constants::MISSING_LABEL_CODE);
}

TEST(Vocabulary, InternIsIdempotentAndAppendOnly) {
    Vocabulary vocab("");
    const LabelCode a = vocab.intern("AAPL");
    const LabelCode b = vocab.intern("MSFT");
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 2);
    EXPECT_EQ(vocab.intern("AAPL"), a);
    EXPECT_EQ(vocab.size(), 3u);

    const std::deque<std::string> expected{"", "AAPL", "MSFT"};
    EXPECT_EQ(vocab.labels(), expected);
}

TEST(Vocabulary, FindDoesNotIntern) {
    Vocabulary vocab("");
    EXPECT_FALSE(vocab.find("x").has_value());
    EXPECT_FALSE(vocab.contains("x"));
    EXPECT_EQ(vocab.size(), 1u);

    (void)vocab.intern("x");
    ASSERT_TRUE(vocab.find("x").has_value());
    EXPECT_EQ(*vocab.find("x"), 1);
    EXPECT_TRUE(vocab.contains("x"));
}

TEST(Vocabulary, UnknownCodeThrows) {
    Vocabulary vocab("");
    EXPECT_THROW((void)vocab.label(1), DtypeError);
    EXPECT_THROW((void)vocab.label(-1), DtypeError);
}

TEST(Vocabulary, LabelsMayContainEmbeddedNul) {
    Vocabulary vocab("");
    const std::string with_nul("a\0b", 3);
    const LabelCode code = vocab.intern(with_nul);
    EXPECT_NE(code, vocab.intern("a"));
    EXPECT_EQ(vocab.label(code), with_nul);
}

TEST(Vocabulary, LabelReferencesSurviveGrowth) {
    Vocabulary vocab("missing");
    const LabelCode first = vocab.intern("first");
    const std::string& missing = vocab.missing_value();
    const std::string& label = vocab.label(first);

    for (int i = 0; i < 1000; ++i) {
        (void)vocab.intern("label" + std::to_string(i));
    }
    EXPECT_EQ(missing, "missing");
    EXPECT_EQ(label, "first");
    EXPECT_EQ(&missing, &vocab.missing_value());
}
