#ifndef BIBSANE_SRC_SANITIZER_HYGIENE_H_
#define BIBSANE_SRC_SANITIZER_HYGIENE_H_

#include "../common/entry.h"
#include "../common/issue_report.h"

namespace BibSane {

// Removes '{' and '}' from every value except author, editor and title,
// where braces protect capitalization.
Entries StripBraces(const Entries& entries);

// Reports IDs that differ only by case. Nothing is changed or dropped.
// Returns true when at least one collision was found.
bool DetectCaseCollisions(const Entries& entries, IssueReport& report);

} // namespace BibSane

#endif // BIBSANE_SRC_SANITIZER_HYGIENE_H_
