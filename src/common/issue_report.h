#ifndef BIBSANE_SRC_COMMON_ISSUE_REPORT_H_
#define BIBSANE_SRC_COMMON_ISSUE_REPORT_H_

#include <cstddef>
#include <string>
#include <vector>

namespace BibSane {

enum class IssueKind {
    // Violations: each one makes the bibliography BROKEN.
    DUPLICATE_ID,
    DUPLICATE_DOI,
    PREAMBLE_NOT_ALLOWED,
    MISSING_CITATION,
    UNCONFIGURED_ENTRY_TYPE,
    MISSING_FIELD,
    CASE_COLLISION,
    INVALID_DOI,
    MERGE_CONFLICT,
    // Notices: reported, never fatal.
    UNUSED_ENTRY,
    DROPPED_ENTRY_TYPE,
    DISCARDED_FIELD,
    MERGE_FIELD_MISSING,
    ABBREVIATION_UNAVAILABLE
};

bool IsViolation(IssueKind kind);
const char* IssueKindName(IssueKind kind);

struct Issue {
    IssueKind kind;
    std::string message;
};

/**
 * Accumulates everything the stages find so a single run reports the complete
 * set of problems. Each issue is logged when it is added.
 */
class IssueReport {
public:
    IssueReport() = default;

    void Add(IssueKind kind, std::string message);

    const std::vector<Issue>& issues() const { return issues_; }
    size_t Count(IssueKind kind) const;
    size_t ViolationCount() const;
    bool HasViolations() const { return ViolationCount() > 0; }

    // Issues of one kind, for tests and summaries.
    std::vector<Issue> OfKind(IssueKind kind) const;

private:
    std::vector<Issue> issues_;
};

} // namespace BibSane

#endif // BIBSANE_SRC_COMMON_ISSUE_REPORT_H_
