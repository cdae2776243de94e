#ifndef BIBSANE_SRC_SANITIZER_JOURNAL_ABBREVIATOR_H_
#define BIBSANE_SRC_SANITIZER_JOURNAL_ABBREVIATOR_H_

#include <string>

#include "../common/entry.h"
#include "../common/issue_report.h"
#include "../journal/abbreviation_cache.h"
#include "../journal/abbreviation_lookup.h"

namespace BibSane {

// Journal names containing a '.' are taken to be abbreviated already.
bool LooksUnabbreviated(const std::string& journal);

/**
 * Replaces unabbreviated journal names using `cache`, asking `lookup` on a
 * miss and storing the answer. A failed lookup keeps the full name and is
 * reported as a notice; it is not cached so the next run retries.
 */
Entries AbbreviateJournals(const Entries& entries,
                           AbbreviationCache& cache,
                           IAbbreviationLookup& lookup,
                           IssueReport& report);

// Load cache from `cache_path`, abbreviate, save the cache back (even if unchanged).
Entries AbbreviateJournals(const Entries& entries,
                           const std::string& cache_path,
                           IAbbreviationLookup& lookup,
                           IssueReport& report);

} // namespace BibSane

#endif // BIBSANE_SRC_SANITIZER_JOURNAL_ABBREVIATOR_H_
