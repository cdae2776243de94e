#include "sorter.h"

#include <algorithm>
#include <utility>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"

namespace BibSane {

namespace {

bool IsSuffix(std::string_view word) {
    return word == "jnr" || word == "jr" || word == "junior";
}

bool IsParticle(std::string_view word) {
    static const absl::flat_hash_set<std::string_view> particles = {"ben", "van", "der", "de", "la", "le"};
    return particles.contains(word);
}

} // namespace

std::string FormatName(std::string_view name) {
    name = absl::StripAsciiWhitespace(name);
    std::string last;
    std::vector<std::string> firsts;

    size_t comma = name.find(',');
    if (comma != std::string_view::npos) {
        last = std::string(absl::StripAsciiWhitespace(name.substr(0, comma)));
        for (std::string_view part : absl::StrSplit(name.substr(comma + 1), absl::ByAnyChar(" \t\n"),
                                                    absl::SkipEmpty())) {
            firsts.emplace_back(part);
        }
    } else {
        std::vector<std::string> words = absl::StrSplit(name, absl::ByAnyChar(" \t\n"), absl::SkipEmpty());
        if (words.empty()) {
            return "";
        }
        last = words.back();
        words.pop_back();
        for (const auto& word : words) {
            // "J.R." -> "J. R."
            firsts.emplace_back(absl::StripAsciiWhitespace(absl::StrReplaceAll(word, {{".", ". "}})));
        }
    }

    if (IsSuffix(last) && !firsts.empty()) {
        last = firsts.back();
        firsts.pop_back();
    }
    while (!firsts.empty() && IsParticle(firsts.back())) {
        last = firsts.back() + " " + last;
        firsts.pop_back();
    }
    return last + ", " + absl::StrJoin(firsts, " ");
}

std::vector<std::string> SplitNames(std::string_view names) {
    std::string flat = absl::StrReplaceAll(names, {{"\n", " "}});
    std::vector<std::string> result;
    for (std::string_view name : absl::StrSplit(flat, " and ")) {
        name = absl::StripAsciiWhitespace(name);
        if (name.empty()) {
            continue;
        }
        result.push_back(FormatName(name));
    }
    return result;
}

std::string SortKey(const Entry& entry) {
    // Work on copies of the two values; the entry is left as it is.
    const std::string year = entry.GetOr("year", "0000");
    const std::string author = entry.GetOr("author", "Aaaa Aaaa");
    std::vector<std::string> names = SplitNames(author);
    std::string first_author = names.empty() ? std::string() : absl::AsciiStrToLower(names.front());
    return year + first_author;
}

Entries SortEntries(const Entries& entries) {
    std::vector<std::pair<std::string, size_t>> keyed;
    keyed.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        keyed.emplace_back(SortKey(entries[i]), i);
    }
    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    Entries result;
    result.reserve(entries.size());
    for (const auto& [key, index] : keyed) {
        result.push_back(entries[index]);
    }
    return result;
}

} // namespace BibSane
