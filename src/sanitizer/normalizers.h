#ifndef BIBSANE_SRC_SANITIZER_NORMALIZERS_H_
#define BIBSANE_SRC_SANITIZER_NORMALIZERS_H_

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

#include "../common/entry.h"
#include "../common/issue_report.h"

namespace BibSane {

// Thrown when the configuration asks for a feature that cannot be done reliably.
class UnsupportedFeatureError : public std::runtime_error {
public:
    explicit UnsupportedFeatureError(const std::string& msg) : std::runtime_error(msg) {}
};

// DOI resolver prefixes, tried in this order; only the first match is stripped.
inline constexpr std::array<std::string_view, 5> kDoiProxies = {
    "https://doi.org/",
    "http://doi.org/",
    "http://dx.doi.org/",
    "https://dx.doi.org/",
    "doi:",
};

struct DoiResult {
    std::string doi;
    bool valid = true;
};

// Lower-cases, strips one resolver prefix and checks the "10.<prefix>/<suffix>" shape.
DoiResult NormalizeDoiValue(std::string_view doi);

struct NormalizeResult {
    Entries entries;
    bool valid = true;
};

// Rewrites every doi field; invalid DOIs are still rewritten but reported.
NormalizeResult NormalizeDoi(const Entries& entries, IssueReport& report);

// Collapses every run of whitespace in every value to a single space.
Entries NormalizeWhitespace(const Entries& entries);
std::string CollapseWhitespace(std::string_view value);

// Always throws UnsupportedFeatureError: splitting and re-encoding author and
// editor names is not reliable enough to rewrite a bibliography with.
Entries NormalizeNames(const Entries& entries);

// "12-34" -> "12--34"; hyphen, dash and minus variants are all recognized.
Entries FixPageDoubleHyphen(const Entries& entries);
std::string PageDoubleHyphen(const std::string& pages);

} // namespace BibSane

#endif // BIBSANE_SRC_SANITIZER_NORMALIZERS_H_
