#include "collector.h"

#include "absl/container/flat_hash_set.h"

namespace BibSane {

namespace {

bool FailsOnDuplicate(DuplicatePolicy policy) {
    switch (policy) {
        case DuplicatePolicy::FAIL:
            return true;
        case DuplicatePolicy::MERGE:
        case DuplicatePolicy::IGNORE:
            return false;
    }
    return false;
}

} // namespace

CollectResult CollectEntries(const std::vector<BibDatabase>& sources,
                             const CollectOptions& options,
                             IssueReport& report) {
    CollectResult result;
    absl::flat_hash_set<std::string> seen_ids;
    absl::flat_hash_set<std::string> seen_dois;

    for (const auto& source : sources) {
        if (source.num_preambles > 0 && !options.preambles_allowed) {
            report.Add(IssueKind::PREAMBLE_NOT_ALLOWED, "@preamble is not allowed: " + source.source);
            result.valid = false;
        }
        for (const auto& entry : source.entries) {
            if (seen_ids.contains(entry.id()) && FailsOnDuplicate(options.duplicate_id)) {
                report.Add(IssueKind::DUPLICATE_ID, "Duplicate BibTeX entry: " + entry.id());
                result.valid = false;
            }
            auto doi = entry.Get("doi");
            if (doi.has_value()) {
                if (seen_dois.contains(*doi) && FailsOnDuplicate(options.duplicate_doi)) {
                    report.Add(IssueKind::DUPLICATE_DOI, "Duplicate DOI: " + *doi);
                    result.valid = false;
                }
                seen_dois.insert(*doi);
            }
            seen_ids.insert(entry.id());
            result.entries.push_back(entry);
        }
    }
    return result;
}

} // namespace BibSane
