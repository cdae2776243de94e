#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/sanitizer/journal_abbreviator.h"

#include <cstdlib>
#include <filesystem>

using namespace BibSane;
using ::testing::_;
using ::testing::Return;

class MockAbbreviationLookup : public IAbbreviationLookup {
public:
    MOCK_METHOD(std::optional<std::string>, Lookup, (const std::string& journal), (override));
};

class JournalAbbreviatorTest : public ::testing::Test {
protected:
    MockAbbreviationLookup lookup_;
    AbbreviationCache cache_;
    IssueReport report_;
};

TEST_F(JournalAbbreviatorTest, DetectsAbbreviatedNames) {
    EXPECT_TRUE(LooksUnabbreviated("Journal of the ACM"));
    EXPECT_FALSE(LooksUnabbreviated("J. ACM"));
}

TEST_F(JournalAbbreviatorTest, LooksUpOnceAndCaches) {
    Entries entries = {
        Entry("article", "a").With("journal", "Journal of the ACM"),
        Entry("article", "b").With("journal", "Journal of the ACM"),
        Entry("article", "c").With("journal", "Phys. Rev. Lett."),
        Entry("book", "d"),
    };
    EXPECT_CALL(lookup_, Lookup("Journal of the ACM"))
        .Times(1)
        .WillOnce(Return(std::optional<std::string>("J. ACM")));

    Entries result = AbbreviateJournals(entries, cache_, lookup_, report_);
    ASSERT_EQ(result.size(), 4u);
    EXPECT_EQ(result[0].GetOr("journal", ""), "J. ACM");
    EXPECT_EQ(result[1].GetOr("journal", ""), "J. ACM");
    EXPECT_EQ(result[2].GetOr("journal", ""), "Phys. Rev. Lett.");
    EXPECT_FALSE(result[3].Has("journal"));
    EXPECT_EQ(cache_.Get("Journal of the ACM"), std::optional<std::string>("J. ACM"));
    EXPECT_TRUE(report_.issues().empty());
}

TEST_F(JournalAbbreviatorTest, CacheHitSkipsLookup) {
    cache_.Put("Nature Physics", "Nat. Phys.");
    EXPECT_CALL(lookup_, Lookup(_)).Times(0);

    Entries result = AbbreviateJournals({Entry("article", "a").With("journal", "Nature Physics")},
                                        cache_, lookup_, report_);
    EXPECT_EQ(result[0].GetOr("journal", ""), "Nat. Phys.");
}

TEST_F(JournalAbbreviatorTest, FailedLookupKeepsNameAndIsNotCached) {
    EXPECT_CALL(lookup_, Lookup("Some Obscure Journal")).WillOnce(Return(std::optional<std::string>()));

    Entries result = AbbreviateJournals({Entry("article", "a").With("journal", "Some Obscure Journal")},
                                        cache_, lookup_, report_);
    EXPECT_EQ(result[0].GetOr("journal", ""), "Some Obscure Journal");
    EXPECT_TRUE(cache_.empty());
    EXPECT_EQ(report_.Count(IssueKind::ABBREVIATION_UNAVAILABLE), 1u);
    EXPECT_FALSE(report_.HasViolations());
}

TEST_F(JournalAbbreviatorTest, CacheFileIsLoadedAndSaved) {
    char dir_template[] = "/tmp/bibsane_journal_XXXXXX";
    ASSERT_NE(mkdtemp(dir_template), nullptr);
    const std::filesystem::path dir(dir_template);
    const std::string cache_path = (dir / "abbreviations.json").string();

    EXPECT_CALL(lookup_, Lookup("Journal of the ACM"))
        .WillOnce(Return(std::optional<std::string>("J. ACM")));
    AbbreviateJournals({Entry("article", "a").With("journal", "Journal of the ACM")},
                       cache_path, lookup_, report_);

    AbbreviationCache saved = AbbreviationCache::Load(cache_path);
    EXPECT_EQ(saved.Get("Journal of the ACM"), std::optional<std::string>("J. ACM"));

    // Second run is served from the file.
    Entries again = AbbreviateJournals({Entry("article", "b").With("journal", "Journal of the ACM")},
                                       cache_path, lookup_, report_);
    EXPECT_EQ(again[0].GetOr("journal", ""), "J. ACM");
    std::filesystem::remove_all(dir);
}
