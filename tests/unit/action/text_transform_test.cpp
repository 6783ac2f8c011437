#include <gtest/gtest.h>

#include "edext/action/text_transform.hpp"

using namespace edext::action;
using edext::plugin::TransformOp;

TEST(TextTransformTest, CaseOperations) {
    EXPECT_EQ(toUpper("Hello, World 42"), "HELLO, WORLD 42");
    EXPECT_EQ(toLower("Hello, World"), "hello, world");
    EXPECT_EQ(swapCase("aBc"), "AbC");
    EXPECT_EQ(toTitleCase("the qUICK\tbrown  fox"), "The Quick\tBrown  Fox");
}

TEST(TextTransformTest, UppercaseIsIdempotent) {
    const std::string text = "mixed Case text\nline two";
    EXPECT_EQ(toUpper(toUpper(text)), toUpper(text));
}

TEST(TextTransformTest, CaseLeavesMultiByteAlone) {
    EXPECT_EQ(toUpper("caf\xC3\xA9"), "CAF\xC3\xA9");
}

TEST(TextTransformTest, ReverseByCodePoint) {
    EXPECT_EQ(reverseCodePoints("abc"), "cba");
    // Two-, three- and four-byte sequences stay intact.
    EXPECT_EQ(reverseCodePoints("a\xC3\xB1\xE2\x82\xAC\xF0\x9F\x98\x80"),
              "\xF0\x9F\x98\x80\xE2\x82\xAC\xC3\xB1" "a");
    EXPECT_EQ(reverseCodePoints(""), "");
}

TEST(TextTransformTest, ReverseIsInvolutive) {
    const std::string text = "h\xC3\xA9llo w\xC3\xB6rld \xE2\x9C\x93";
    EXPECT_EQ(reverseCodePoints(reverseCodePoints(text)), text);
}

TEST(TextTransformTest, ReverseToleratesMalformedBytes) {
    const std::string text = "a\xC3" "b\xFF";
    EXPECT_EQ(reverseCodePoints(text), "\xFF" "b\xC3" "a");
}

TEST(TextTransformTest, ReverseIsInvolutiveOnLatin1Bytes) {
    const std::string text = "x\xA9\xC3y";
    EXPECT_EQ(reverseCodePoints(text), "y\xC3\xA9x");
    EXPECT_EQ(reverseCodePoints(reverseCodePoints(text)), text);

    const std::string mixed = "caf\xC3\xA9 \xE9t\xE9";
    EXPECT_EQ(reverseCodePoints(reverseCodePoints(mixed)), mixed);
}

TEST(TextTransformTest, Trim) {
    EXPECT_EQ(trim("  \t ab  \n"), "ab");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trimLines("  a  \n\tb\n"), "a\nb\n");
}

TEST(TextTransformTest, LineOperationsPreserveTrailingNewline) {
    EXPECT_EQ(sortLines("pear\napple\nfig\n"), "apple\nfig\npear\n");
    EXPECT_EQ(sortLines("b\na"), "a\nb");
    EXPECT_EQ(reverseLines("1\n2\n3\n"), "3\n2\n1\n");
    EXPECT_EQ(sortLines(""), "");
}

TEST(TextTransformTest, UniqueKeepsFirstOccurrence) {
    EXPECT_EQ(uniqueLines("b\na\nb\nc\na\n"), "b\na\nc\n");
}

TEST(TextTransformTest, RemoveEmptyLinesDropsWhitespaceOnly) {
    EXPECT_EQ(removeEmptyLines("a\n\n  \nb\n\t\n"), "a\nb\n");
}

TEST(TextTransformTest, ApplyDispatches) {
    EXPECT_EQ(applyTransform(TransformOp::Uppercase, "ab"), "AB");
    EXPECT_EQ(applyTransform(TransformOp::Reverse, "ab"), "ba");
    EXPECT_EQ(applyTransform(TransformOp::Trim, " ab "), "ab");
    EXPECT_EQ(applyTransform(TransformOp::UniqueLines, "x\nx"), "x");
}
