#include "sheetpress/core/TextSanitizer.hpp"
#include "sheetpress/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace sheetpress {
namespace core {

TEST(TextSanitizerTest, TrimsSurroundingWhitespace) {
    EXPECT_EQ(TextSanitizer::sanitize("  Alice \t"), "Alice");
    EXPECT_EQ(TextSanitizer::sanitize("Bob"), "Bob");
    EXPECT_EQ(TextSanitizer::sanitize(""), "");
    EXPECT_EQ(TextSanitizer::sanitize("   "), "");
}

TEST(TextSanitizerTest, JoinsLinesWithSingleSpace) {
    EXPECT_EQ(TextSanitizer::sanitize("first\nsecond"), "first second");
    EXPECT_EQ(TextSanitizer::sanitize("first\r\nsecond"), "first second");
    EXPECT_EQ(TextSanitizer::sanitize("first\rsecond"), "first second");
    EXPECT_EQ(TextSanitizer::sanitize("a\n\n\nb"), "a b");
}

TEST(TextSanitizerTest, KeepsInnerWhitespaceOfSegments) {
    EXPECT_EQ(TextSanitizer::sanitize("a  b"), "a  b");
    EXPECT_EQ(TextSanitizer::sanitize(" a \n b "), "a   b");
}

TEST(TextSanitizerTest, UnicodeLineSeparators) {
    EXPECT_EQ(TextSanitizer::sanitize("uno\xE2\x80\xA8" "dos"), "uno dos");
    EXPECT_EQ(TextSanitizer::sanitize("\xC2\xA0" "caf\xC3\xA9" "\xC2\xA0"), "caf\xC3\xA9");
}

TEST(TextSanitizerTest, InvalidUtf8IsReplaced) {
    std::string result = TextSanitizer::sanitize("ab\xFF" "cd");
    EXPECT_EQ(result, "ab\xEF\xBF\xBD" "cd");
}

TEST(TextSanitizerTest, Idempotent) {
    const std::vector<std::string> samples = {
        "", "plain", "  padded  ", "multi\nline\r\ntext", "\n\nleading breaks",
        "a \n b", "tab\tinside", "x\xE2\x80\xA9y", " \xE3\x80\x80wide\xE3\x80\x80 ",
        "a\n   \nb"
    };
    for (const auto& sample : samples) {
        std::string once = TextSanitizer::sanitize(sample);
        EXPECT_EQ(TextSanitizer::sanitize(once), once) << sample;
    }
}

TEST(TextSanitizerTest, ClassifiesCodePoints) {
    EXPECT_TRUE(TextSanitizer::isLineBreak(U'\n'));
    EXPECT_TRUE(TextSanitizer::isLineBreak(0x2029));
    EXPECT_FALSE(TextSanitizer::isLineBreak(U' '));
    EXPECT_TRUE(TextSanitizer::isWhitespace(U' '));
    EXPECT_TRUE(TextSanitizer::isWhitespace(0x3000));
    EXPECT_FALSE(TextSanitizer::isWhitespace(U'x'));
}

}} // namespace sheetpress::core
