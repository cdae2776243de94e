#ifndef BIBSANE_SRC_SANITIZER_COLLECTOR_H_
#define BIBSANE_SRC_SANITIZER_COLLECTOR_H_

#include <vector>

#include "../bibtex/bib_parser.h"
#include "../common/entry.h"
#include "../common/issue_report.h"
#include "../common/policy.h"

namespace BibSane {

struct CollectOptions {
    DuplicatePolicy duplicate_id = DuplicatePolicy::IGNORE;
    DuplicatePolicy duplicate_doi = DuplicatePolicy::IGNORE;
    bool preambles_allowed = true;
};

struct CollectResult {
    Entries entries;
    bool valid = true;
};

/**
 * Concatenates the entries of all sources in order. Duplicate IDs and DOIs are
 * violations only under DuplicatePolicy::FAIL; duplicates are kept either way.
 */
CollectResult CollectEntries(const std::vector<BibDatabase>& sources,
                             const CollectOptions& options,
                             IssueReport& report);

} // namespace BibSane

#endif // BIBSANE_SRC_SANITIZER_COLLECTOR_H_
