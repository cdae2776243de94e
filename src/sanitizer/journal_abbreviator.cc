#include "journal_abbreviator.h"

#include <glog/logging.h>

namespace BibSane {

bool LooksUnabbreviated(const std::string& journal) {
    return journal.find('.') == std::string::npos;
}

Entries AbbreviateJournals(const Entries& entries,
                           AbbreviationCache& cache,
                           IAbbreviationLookup& lookup,
                           IssueReport& report) {
    Entries result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        auto journal = entry.Get("journal");
        if (!journal.has_value() || !LooksUnabbreviated(*journal)) {
            result.push_back(entry);
            continue;
        }
        auto abbreviation = cache.Get(*journal);
        if (!abbreviation.has_value()) {
            abbreviation = lookup.Lookup(*journal);
            if (!abbreviation.has_value()) {
                report.Add(IssueKind::ABBREVIATION_UNAVAILABLE,
                           "No abbreviation available for journal: " + *journal + " (" + entry.id() + ")");
                result.push_back(entry);
                continue;
            }
            VLOG(1) << "Abbreviation of " << *journal << ": " << *abbreviation;
            cache.Put(*journal, *abbreviation);
        }
        result.push_back(entry.With("journal", *abbreviation));
    }
    return result;
}

Entries AbbreviateJournals(const Entries& entries,
                           const std::string& cache_path,
                           IAbbreviationLookup& lookup,
                           IssueReport& report) {
    AbbreviationCache cache = AbbreviationCache::Load(cache_path);
    Entries result = AbbreviateJournals(entries, cache, lookup, report);
    cache.Save(cache_path);
    return result;
}

} // namespace BibSane
