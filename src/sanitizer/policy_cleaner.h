#ifndef BIBSANE_SRC_SANITIZER_POLICY_CLEANER_H_
#define BIBSANE_SRC_SANITIZER_POLICY_CLEANER_H_

#include <string_view>

#include "../common/entry.h"
#include "../common/issue_report.h"
#include "../common/policy.h"

namespace BibSane {

// Optional per-entry annotation; when set, its value selects the policy instead of ENTRYTYPE.
inline constexpr std::string_view kAnnotationField = "bibsane";

struct CleanResult {
    Entries entries;
    bool valid = true;
};

/**
 * Rebuilds every entry with only the fields its type's policy names.
 * Entries of unconfigured types are dropped and make the result invalid, as
 * does every missing MUST field. Fields outside the policy are discarded with
 * a notice.
 */
CleanResult CleanEntries(const Entries& entries, const PolicyTable& policies, IssueReport& report);

} // namespace BibSane

#endif // BIBSANE_SRC_SANITIZER_POLICY_CLEANER_H_
