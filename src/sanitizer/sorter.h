#ifndef BIBSANE_SRC_SANITIZER_SORTER_H_
#define BIBSANE_SRC_SANITIZER_SORTER_H_

#include <string>
#include <string_view>
#include <vector>

#include "../common/entry.h"

namespace BibSane {

// Splits an author/editor list on " and " and formats each name as "Last, First".
std::vector<std::string> SplitNames(std::string_view names);
std::string FormatName(std::string_view name);

// year (default "0000") + lower-cased "last, first" of the first author
// (default "Aaaa Aaaa").
std::string SortKey(const Entry& entry);

// Stable sort by SortKey; the entries themselves are not modified.
Entries SortEntries(const Entries& entries);

} // namespace BibSane

#endif // BIBSANE_SRC_SANITIZER_SORTER_H_
