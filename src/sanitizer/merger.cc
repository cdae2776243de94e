#include "merger.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/str_cat.h"

namespace BibSane {

MergeResult MergeEntries(const Entries& entries, std::string_view field, IssueReport& report) {
    MergeResult result;
    // Merge key -> index into result.entries.
    absl::flat_hash_map<std::string, size_t> lookup;
    Entries missing_key;

    for (const auto& entry : entries) {
        auto identifier = entry.Get(field);
        if (!identifier.has_value()) {
            report.Add(IssueKind::MERGE_FIELD_MISSING,
                       absl::StrCat("Cannot merge entry without ", field, ": ", entry.id()));
            missing_key.push_back(entry);
            continue;
        }
        auto [it, inserted] = lookup.try_emplace(*identifier, result.entries.size());
        if (inserted) {
            result.entries.push_back(entry);
            continue;
        }
        Entry& merged = result.entries[it->second];
        for (const auto& [key, value] : entry.fields()) {
            auto existing = merged.Get(key);
            if (!existing.has_value()) {
                merged.Set(key, value);
            } else if (*existing != value) {
                report.Add(IssueKind::MERGE_CONFLICT,
                           absl::StrCat("Same ", field, "=", *identifier, ", different ", key, ": ",
                                        value, " ", *existing));
                result.conflict = true;
            }
        }
    }

    for (auto& entry : missing_key) {
        result.entries.push_back(std::move(entry));
    }
    return result;
}

} // namespace BibSane
