#include <gtest/gtest.h>

#include "tinydc/Utf8.hpp"

TEST(Utf8Test, ClipNeverSplitsAMultiByteCharacter) {
    // "Fotos-Übersicht": Ü is two bytes.
    const std::string name = "Fotos-\xC3\x9C" "bersicht";
    EXPECT_EQ(ClipUtf8(name, 7), "Fotos-\xC3\x9C");
    EXPECT_EQ(ClipUtf8(name, 6), "Fotos-");
    EXPECT_EQ(ClipUtf8(name, 100), name);
    EXPECT_EQ(ClipUtf8(name, 0), "");

    // Three CJK characters, three bytes each.
    const std::string cjk = "\xE6\x96\x87\xE6\x9B\xB8\xE9\xA1\x9E";
    EXPECT_EQ(ClipUtf8(cjk, 2), "\xE6\x96\x87\xE6\x9B\xB8");
}

TEST(Utf8Test, CodePointCountIgnoresContinuationBytes) {
    EXPECT_EQ(CodePointCount(""), 0u);
    EXPECT_EQ(CodePointCount("docs"), 4u);
    EXPECT_EQ(CodePointCount("\xE6\x96\x87\xE6\x9B\xB8/"), 3u);
}

TEST(Utf8Test, AppendAndPopWorkOnWholeCodePoints) {
    std::string buffer = "a";
    AppendUtf8(buffer, U'ü');
    AppendUtf8(buffer, U'文');
    AppendUtf8(buffer, U'\U0001F600');
    EXPECT_EQ(buffer, "a\xC3\xBC\xE6\x96\x87\xF0\x9F\x98\x80");

    PopUtf8(buffer);
    EXPECT_EQ(buffer, "a\xC3\xBC\xE6\x96\x87");
    PopUtf8(buffer);
    PopUtf8(buffer);
    EXPECT_EQ(buffer, "a");
    PopUtf8(buffer);
    PopUtf8(buffer);
    EXPECT_TRUE(buffer.empty());
}
