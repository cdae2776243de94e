#include "hygiene.h"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_join.h"

namespace BibSane {

namespace {

bool KeepsBraces(const std::string& field) {
    return field == "author" || field == "editor" || field == "title";
}

} // namespace

Entries StripBraces(const Entries& entries) {
    Entries result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        Entry stripped = entry;
        for (const auto& [field, value] : entry.fields()) {
            if (KeepsBraces(field)) {
                continue;
            }
            std::string clean;
            clean.reserve(value.size());
            std::copy_if(value.begin(), value.end(), std::back_inserter(clean),
                         [](char c) { return c != '{' && c != '}'; });
            if (clean != value) {
                stripped.Set(field, std::move(clean));
            }
        }
        result.push_back(std::move(stripped));
    }
    return result;
}

bool DetectCaseCollisions(const Entries& entries, IssueReport& report) {
    // Lower-cased ID -> distinct spellings, in order of first appearance.
    absl::flat_hash_map<std::string, std::vector<std::string>> spellings;
    std::vector<std::string> order;
    for (const auto& entry : entries) {
        const std::string folded = absl::AsciiStrToLower(entry.id());
        auto [it, inserted] = spellings.try_emplace(folded);
        if (inserted) {
            order.push_back(folded);
        }
        auto& group = it->second;
        if (std::find(group.begin(), group.end(), entry.id()) == group.end()) {
            group.push_back(entry.id());
        }
    }

    bool mistakes = false;
    for (const auto& folded : order) {
        const auto& group = spellings[folded];
        if (group.size() > 1) {
            report.Add(IssueKind::CASE_COLLISION,
                       "BibTeX entry keys that only differ by case: " + absl::StrJoin(group, " "));
            mistakes = true;
        }
    }
    return mistakes;
}

} // namespace BibSane
