#ifndef BIBSANE_SRC_SANITIZER_CITATION_RECONCILER_H_
#define BIBSANE_SRC_SANITIZER_CITATION_RECONCILER_H_

#include <set>
#include <string>
#include <vector>

#include "../common/entry.h"
#include "../common/issue_report.h"

namespace BibSane {

// Citation keys used by a document. Ordered so missing keys are reported deterministically.
using CitationSet = std::set<std::string>;

CitationSet MakeCitationSet(const std::vector<std::string>& citations);

struct ReconcileResult {
    Entries entries;
    // False when a citation has no entry.
    bool complete = true;
};

/**
 * Keeps the entries that are cited and whose type is not in `drop_types`.
 * Dropped entries are notices; every citation without an entry among the
 * input entries is a violation.
 */
ReconcileResult ReconcileCitations(const Entries& entries,
                                   const CitationSet& citations,
                                   const std::vector<std::string>& drop_types,
                                   IssueReport& report);

} // namespace BibSane

#endif // BIBSANE_SRC_SANITIZER_CITATION_RECONCILER_H_
