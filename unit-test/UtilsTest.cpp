#include "gtest/gtest.h"
#include "common/utils.hpp"

using namespace std;
using namespace hjudge;

TEST(UtilsTest, TruncateKeepsShortText) {
    EXPECT_EQ(truncate_text("abc", 3), "abc");
    EXPECT_EQ(truncate_text("abcdef", 3), "abc\n[Truncated]");
}

TEST(UtilsTest, TruncateStopsAtCharacterBoundary) {
    string text = "中中中";
    EXPECT_EQ(truncate_text(text, 4), "中\n[Truncated]");
    EXPECT_EQ(truncate_text(text, 6), "中中\n[Truncated]");
    EXPECT_EQ(sanitize_utf8(truncate_text(text, 5)), truncate_text(text, 5));
}

TEST(UtilsTest, SanitizeKeepsValidText) {
    EXPECT_EQ(sanitize_utf8("answer: 中文 ok"), "answer: 中文 ok");
    EXPECT_EQ(sanitize_utf8(""), "");
}

TEST(UtilsTest, SanitizeReplacesInvalidBytes) {
    EXPECT_EQ(sanitize_utf8("a\xff" "b"), "a\xef\xbf\xbd" "b");
    // 截断的多字节字符
    EXPECT_EQ(sanitize_utf8("x\xe4\xb8"), "x\xef\xbf\xbd\xef\xbf\xbd");
    // 过长编码和代理项
    EXPECT_EQ(sanitize_utf8("\xc0\xaf"), "\xef\xbf\xbd\xef\xbf\xbd");
    EXPECT_EQ(sanitize_utf8("\xed\xa0\x80"), "\xef\xbf\xbd\xef\xbf\xbd\xef\xbf\xbd");
}
