#include <gtest/gtest.h>

#include <set>
#include <string>

#include "tinydc/ShortcutAssigner.hpp"

TEST(ShortcutAssignerTest, SmallListsGetSingleKeysInPriorityOrder) {
    EXPECT_EQ(AssignShortcuts(4), (std::vector<std::string>{"a", "s", "d", "f"}));
    EXPECT_TRUE(AssignShortcuts(0).empty());
}

TEST(ShortcutAssignerTest, AlphabetAvoidsNavigationKeys) {
    const std::string alphabet = kDefaultShortcutAlphabet;
    for (char reserved : std::string("hjklgGq/?_.0123456789")) {
        EXPECT_EQ(alphabet.find(reserved), std::string::npos) << reserved;
    }
}

TEST(ShortcutAssignerTest, SwitchesToTwoKeyLabelsWhenSingleKeysRunOut) {
    const std::string alphabet = "abc";
    EXPECT_EQ(AssignShortcuts(3, alphabet), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(AssignShortcuts(4, alphabet), (std::vector<std::string>{"a", "b", "ca", "cb"}));
    EXPECT_EQ(AssignShortcuts(6, alphabet), (std::vector<std::string>{"a", "ba", "bb", "bc", "ca", "cb"}));
}

TEST(ShortcutAssignerTest, RowsBeyondCapacityStayUnlabelled) {
    const std::vector<std::string> labels = AssignShortcuts(10, "ab");
    ASSERT_EQ(labels.size(), 10u);
    EXPECT_EQ(labels[3], "bb");
    EXPECT_EQ(labels[4], "");
    EXPECT_EQ(labels[9], "");
}

TEST(ShortcutAssignerTest, LabelsAreDistinctAndPrefixFree) {
    for (std::size_t count : {1u, 19u, 20u, 21u, 57u, 120u, 400u}) {
        const std::vector<std::string> labels = AssignShortcuts(count);
        ASSERT_EQ(labels.size(), count);
        std::set<std::string> unique(labels.begin(), labels.end());
        EXPECT_EQ(unique.size(), count) << count;
        for (const std::string& label : labels) {
            ASSERT_FALSE(label.empty()) << count;
            EXPECT_FALSE(IsShortcutPrefix(labels, label)) << label;
        }
    }
}

TEST(ShortcutAssignerTest, LookupHelpers) {
    const std::vector<std::string> labels = AssignShortcuts(6, "abc");
    EXPECT_EQ(FindShortcut(labels, "a"), 0u);
    EXPECT_EQ(FindShortcut(labels, "bc"), 3u);
    EXPECT_EQ(FindShortcut(labels, "b"), std::string::npos);
    EXPECT_EQ(FindShortcut(labels, ""), std::string::npos);
    EXPECT_TRUE(IsShortcutPrefix(labels, "b"));
    EXPECT_TRUE(IsShortcutPrefix(labels, "c"));
    EXPECT_FALSE(IsShortcutPrefix(labels, "a"));
}
