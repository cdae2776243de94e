#include <gtest/gtest.h>
#include "../../src/common/entry.h"
#include "../../src/common/verdict.h"

using namespace BibSane;

TEST(EntryTest, ReservedFieldsAlwaysPresent) {
    Entry entry("article", "Smith2020");
    EXPECT_EQ(entry.type(), "article");
    EXPECT_EQ(entry.id(), "Smith2020");
    EXPECT_TRUE(entry.Has("ENTRYTYPE"));
    EXPECT_TRUE(entry.Has("ID"));
    EXPECT_EQ(entry.size(), 2u);
}

TEST(EntryTest, SetReplacesInPlaceAndKeepsOrder) {
    Entry entry("article", "a");
    entry.Set("title", "First");
    entry.Set("year", "2001");
    entry.Set("title", "Second");

    ASSERT_EQ(entry.size(), 4u);
    EXPECT_EQ(entry.fields()[2].first, "title");
    EXPECT_EQ(entry.fields()[2].second, "Second");
    EXPECT_EQ(entry.fields()[3].first, "year");
}

TEST(EntryTest, GetAndGetOr) {
    Entry entry("book", "b");
    entry.Set("year", "1999");
    EXPECT_EQ(entry.Get("year"), std::optional<std::string>("1999"));
    EXPECT_FALSE(entry.Get("doi").has_value());
    EXPECT_EQ(entry.GetOr("doi", "none"), "none");
}

TEST(EntryTest, WithLeavesOriginalUntouched) {
    Entry entry("misc", "m");
    entry.Set("doi", "10.1/A");
    Entry copy = entry.With("doi", "10.1/a");
    EXPECT_EQ(entry.GetOr("doi", ""), "10.1/A");
    EXPECT_EQ(copy.GetOr("doi", ""), "10.1/a");
    EXPECT_NE(entry, copy);
}

TEST(VerdictTest, DowngradeIsMonotone) {
    EXPECT_EQ(Downgrade(Verdict::UNCHANGED, Verdict::CHANGED), Verdict::CHANGED);
    EXPECT_EQ(Downgrade(Verdict::CHANGED, Verdict::BROKEN), Verdict::BROKEN);
    EXPECT_EQ(Downgrade(Verdict::BROKEN, Verdict::CHANGED), Verdict::BROKEN);
    EXPECT_EQ(Downgrade(Verdict::BROKEN, Verdict::UNCHANGED), Verdict::BROKEN);
}

TEST(VerdictTest, ExitCodes) {
    EXPECT_EQ(ExitCode(Verdict::UNCHANGED), 0);
    EXPECT_EQ(ExitCode(Verdict::CHANGED), 1);
    EXPECT_EQ(ExitCode(Verdict::BROKEN), 2);
    EXPECT_EQ(Worst(Verdict::CHANGED, Verdict::UNCHANGED), Verdict::CHANGED);
    EXPECT_STREQ(VerdictName(Verdict::BROKEN), "BROKEN");
}
