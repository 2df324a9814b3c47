#include <gtest/gtest.h>

#include "tinydc/EntryFilter.hpp"

namespace {
std::vector<Entry> Sample() {
    return {
        Entry{"Projects", "/home/u/Projects", std::nullopt},
        Entry{"photos", "/home/u/photos", std::nullopt},
        Entry{"src", "/home/u/src", std::nullopt},
        Entry{"PROTO", "/home/u/PROTO", std::nullopt},
        Entry{"notes", "/home/u/notes", std::nullopt},
    };
}

std::vector<std::string> Names(const std::vector<Entry>& entries) {
    std::vector<std::string> names;
    for (const Entry& entry : entries) {
        names.push_back(entry.display_name);
    }
    return names;
}
}

TEST(EntryFilterTest, MatchesCaseInsensitiveSubstringInOriginalOrder) {
    EXPECT_EQ(Names(ApplyFilter(Sample(), "pro")), (std::vector<std::string>{"Projects", "PROTO"}));
    EXPECT_EQ(Names(ApplyFilter(Sample(), "OT")), (std::vector<std::string>{"photos", "PROTO", "notes"}));
}

TEST(EntryFilterTest, EmptyQueryRestoresTheFullList) {
    const std::vector<Entry> narrowed = ApplyFilter(Sample(), "src");
    EXPECT_EQ(Names(narrowed), std::vector<std::string>{"src"});
    EXPECT_EQ(Names(ApplyFilter(Sample(), "")), Names(Sample()));
}

TEST(EntryFilterTest, MatchesDisplayNameNotPath) {
    EXPECT_TRUE(ApplyFilter(Sample(), "home").empty());
}

TEST(EntryFilterTest, MatchPositionFindsFirstHit) {
    EXPECT_EQ(MatchPosition("Projects", "JEC"), 3u);
    EXPECT_EQ(MatchPosition("notes", "x"), std::string::npos);
    EXPECT_EQ(MatchPosition("notes", ""), 0u);
}
