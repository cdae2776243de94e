#ifndef BIBSANE_SRC_SANITIZER_MERGER_H_
#define BIBSANE_SRC_SANITIZER_MERGER_H_

#include <string_view>

#include "../common/entry.h"
#include "../common/issue_report.h"

namespace BibSane {

struct MergeResult {
    Entries entries;
    bool conflict = false;
};

/**
 * Collapses entries sharing the exact value of `field` (ID or doi) into one
 * entry holding the union of their fields. When members disagree on a field
 * the first value is kept and a conflict is reported.
 *
 * Output: merged groups in order of first appearance, then the entries that
 * lack `field`, in input order.
 */
MergeResult MergeEntries(const Entries& entries, std::string_view field, IssueReport& report);

} // namespace BibSane

#endif // BIBSANE_SRC_SANITIZER_MERGER_H_
