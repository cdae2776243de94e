#include "citation_reconciler.h"

#include "absl/container/flat_hash_set.h"

namespace BibSane {

CitationSet MakeCitationSet(const std::vector<std::string>& citations) {
    return CitationSet(citations.begin(), citations.end());
}

ReconcileResult ReconcileCitations(const Entries& entries,
                                   const CitationSet& citations,
                                   const std::vector<std::string>& drop_types,
                                   IssueReport& report) {
    ReconcileResult result;
    const absl::flat_hash_set<std::string> drop(drop_types.begin(), drop_types.end());

    // Drop unused entries
    for (const auto& entry : entries) {
        if (citations.count(entry.id()) == 0) {
            report.Add(IssueKind::UNUSED_ENTRY, "Dropping unused id: " + entry.id());
            continue;
        }
        if (drop.contains(entry.type())) {
            report.Add(IssueKind::DROPPED_ENTRY_TYPE,
                       "Dropping irrelevant entry type: " + entry.type() + " (" + entry.id() + ")");
            continue;
        }
        result.entries.push_back(entry);
    }

    // Check for undefined references against all entries, dropped ones included.
    absl::flat_hash_set<std::string> defined;
    for (const auto& entry : entries) {
        defined.insert(entry.id());
    }
    for (const auto& citation : citations) {
        if (!defined.contains(citation)) {
            report.Add(IssueKind::MISSING_CITATION, "Missing reference: " + citation);
            result.complete = false;
        }
    }
    return result;
}

} // namespace BibSane
