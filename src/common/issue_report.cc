#include "issue_report.h"

#include <utility>

#include <glog/logging.h>

namespace BibSane {

bool IsViolation(IssueKind kind) {
    switch (kind) {
        case IssueKind::DUPLICATE_ID:
        case IssueKind::DUPLICATE_DOI:
        case IssueKind::PREAMBLE_NOT_ALLOWED:
        case IssueKind::MISSING_CITATION:
        case IssueKind::UNCONFIGURED_ENTRY_TYPE:
        case IssueKind::MISSING_FIELD:
        case IssueKind::CASE_COLLISION:
        case IssueKind::INVALID_DOI:
        case IssueKind::MERGE_CONFLICT:
            return true;
        case IssueKind::UNUSED_ENTRY:
        case IssueKind::DROPPED_ENTRY_TYPE:
        case IssueKind::DISCARDED_FIELD:
        case IssueKind::MERGE_FIELD_MISSING:
        case IssueKind::ABBREVIATION_UNAVAILABLE:
            return false;
    }
    return true;
}

const char* IssueKindName(IssueKind kind) {
    switch (kind) {
        case IssueKind::DUPLICATE_ID: return "duplicate-id";
        case IssueKind::DUPLICATE_DOI: return "duplicate-doi";
        case IssueKind::PREAMBLE_NOT_ALLOWED: return "preamble-not-allowed";
        case IssueKind::MISSING_CITATION: return "missing-citation";
        case IssueKind::UNCONFIGURED_ENTRY_TYPE: return "unconfigured-entry-type";
        case IssueKind::MISSING_FIELD: return "missing-field";
        case IssueKind::CASE_COLLISION: return "case-collision";
        case IssueKind::INVALID_DOI: return "invalid-doi";
        case IssueKind::MERGE_CONFLICT: return "merge-conflict";
        case IssueKind::UNUSED_ENTRY: return "unused-entry";
        case IssueKind::DROPPED_ENTRY_TYPE: return "dropped-entry-type";
        case IssueKind::DISCARDED_FIELD: return "discarded-field";
        case IssueKind::MERGE_FIELD_MISSING: return "merge-field-missing";
        case IssueKind::ABBREVIATION_UNAVAILABLE: return "abbreviation-unavailable";
    }
    return "unknown";
}

void IssueReport::Add(IssueKind kind, std::string message) {
    if (IsViolation(kind)) {
        LOG(ERROR) << "[" << IssueKindName(kind) << "] " << message;
    } else if (kind == IssueKind::UNUSED_ENTRY || kind == IssueKind::DROPPED_ENTRY_TYPE) {
        LOG(INFO) << "[" << IssueKindName(kind) << "] " << message;
    } else {
        LOG(WARNING) << "[" << IssueKindName(kind) << "] " << message;
    }
    issues_.push_back(Issue{kind, std::move(message)});
}

size_t IssueReport::Count(IssueKind kind) const {
    size_t n = 0;
    for (const auto& issue : issues_) {
        if (issue.kind == kind) ++n;
    }
    return n;
}

size_t IssueReport::ViolationCount() const {
    size_t n = 0;
    for (const auto& issue : issues_) {
        if (IsViolation(issue.kind)) ++n;
    }
    return n;
}

std::vector<Issue> IssueReport::OfKind(IssueKind kind) const {
    std::vector<Issue> out;
    for (const auto& issue : issues_) {
        if (issue.kind == kind) out.push_back(issue);
    }
    return out;
}

} // namespace BibSane
