#include <gtest/gtest.h>
#include "../../src/common/issue_report.h"

using namespace BibSane;

TEST(IssueReportTest, SeparatesViolationsFromNotices) {
    IssueReport report;
    report.Add(IssueKind::UNUSED_ENTRY, "Dropping unused id: x");
    report.Add(IssueKind::MISSING_CITATION, "Missing reference: foo");
    report.Add(IssueKind::DISCARDED_FIELD, "x: @article discarding field note");

    EXPECT_EQ(report.issues().size(), 3u);
    EXPECT_EQ(report.ViolationCount(), 1u);
    EXPECT_TRUE(report.HasViolations());
    EXPECT_EQ(report.Count(IssueKind::UNUSED_ENTRY), 1u);

    auto missing = report.OfKind(IssueKind::MISSING_CITATION);
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].message, "Missing reference: foo");
}

TEST(IssueReportTest, NoticesOnlyIsNotBroken) {
    IssueReport report;
    report.Add(IssueKind::ABBREVIATION_UNAVAILABLE, "no answer");
    report.Add(IssueKind::MERGE_FIELD_MISSING, "no doi");
    EXPECT_FALSE(report.HasViolations());
    EXPECT_EQ(report.issues().size(), 2u);
}

TEST(IssueReportTest, KindClassification) {
    EXPECT_TRUE(IsViolation(IssueKind::CASE_COLLISION));
    EXPECT_TRUE(IsViolation(IssueKind::INVALID_DOI));
    EXPECT_TRUE(IsViolation(IssueKind::MERGE_CONFLICT));
    EXPECT_FALSE(IsViolation(IssueKind::DROPPED_ENTRY_TYPE));
    EXPECT_STREQ(IssueKindName(IssueKind::DUPLICATE_ID), "duplicate-id");
}
