#include "normalizers.h"

#include <cctype>
#include <utility>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

namespace BibSane {

namespace {

// hyphen, non-breaking hyphen, en dash, em dash, hyphen-minus, minus sign
const std::array<std::string_view, 6> kPageSeparators = {
    "‐",
    "‑",
    "–",
    "—",
    "-",
    "−",
};

// Strips whitespace and any leading/trailing copies of `separator`.
std::string_view StripPagePart(std::string_view part, std::string_view separator) {
    part = absl::StripAsciiWhitespace(part);
    while (absl::ConsumePrefix(&part, separator)) {
    }
    while (absl::ConsumeSuffix(&part, separator)) {
    }
    return part;
}

// Byte length of the whitespace character starting at `pos`, 0 if none.
// Besides ASCII this covers the Unicode spaces in UTF-8: U+0085, U+00A0,
// U+1680, U+2000..U+200A, U+2028, U+2029, U+202F, U+205F and U+3000.
size_t WhitespaceWidth(std::string_view text, size_t pos) {
    const auto byte = [&](size_t i) { return static_cast<unsigned char>(text[pos + i]); };
    const size_t left = text.size() - pos;
    if (std::isspace(byte(0))) {
        return 1;
    }
    if (left >= 2 && byte(0) == 0xC2 && (byte(1) == 0x85 || byte(1) == 0xA0)) {
        return 2;
    }
    if (left < 3) {
        return 0;
    }
    if (byte(0) == 0xE1 && byte(1) == 0x9A && byte(2) == 0x80) {
        return 3;
    }
    if (byte(0) == 0xE2 && byte(1) == 0x80 &&
        (byte(2) <= 0x8A || byte(2) == 0xA8 || byte(2) == 0xA9 || byte(2) == 0xAF) && byte(2) >= 0x80) {
        return 3;
    }
    if (byte(0) == 0xE2 && byte(1) == 0x81 && byte(2) == 0x9F) {
        return 3;
    }
    if (byte(0) == 0xE3 && byte(1) == 0x80 && byte(2) == 0x80) {
        return 3;
    }
    return 0;
}

} // namespace

DoiResult NormalizeDoiValue(std::string_view doi) {
    DoiResult result;
    result.doi = absl::AsciiStrToLower(doi);
    for (std::string_view proxy : kDoiProxies) {
        if (absl::StartsWith(result.doi, proxy)) {
            result.doi.erase(0, proxy.size());
            break;
        }
    }
    result.valid = result.doi.find('/') != std::string::npos && absl::StartsWith(result.doi, "10.");
    return result;
}

NormalizeResult NormalizeDoi(const Entries& entries, IssueReport& report) {
    NormalizeResult result;
    result.entries.reserve(entries.size());
    for (const auto& entry : entries) {
        auto doi = entry.Get("doi");
        if (!doi.has_value()) {
            result.entries.push_back(entry);
            continue;
        }
        DoiResult normalized = NormalizeDoiValue(*doi);
        if (!normalized.valid) {
            report.Add(IssueKind::INVALID_DOI, "invalid DOI: " + normalized.doi + " (" + entry.id() + ")");
            result.valid = false;
        }
        result.entries.push_back(entry.With("doi", std::move(normalized.doi)));
    }
    return result;
}

std::string CollapseWhitespace(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    bool in_space = false;
    size_t i = 0;
    while (i < value.size()) {
        size_t width = WhitespaceWidth(value, i);
        if (width > 0) {
            if (!in_space) {
                out.push_back(' ');
            }
            in_space = true;
            i += width;
        } else {
            out.push_back(value[i]);
            in_space = false;
            ++i;
        }
    }
    return out;
}

Entries NormalizeWhitespace(const Entries& entries) {
    Entries result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        Entry normalized = entry;
        for (const auto& [field, value] : entry.fields()) {
            normalized.Set(field, CollapseWhitespace(value));
        }
        result.push_back(std::move(normalized));
    }
    return result;
}

Entries NormalizeNames(const Entries& entries) {
    (void)entries;
    throw UnsupportedFeatureError(
        "normalize_names is not supported: author and editor names cannot be split reliably");
}

std::string PageDoubleHyphen(const std::string& pages) {
    std::string value = pages;
    for (std::string_view separator : kPageSeparators) {
        if (value.find(separator) == std::string::npos) {
            continue;
        }
        std::vector<std::string_view> parts = absl::StrSplit(value, separator);
        std::string first(StripPagePart(parts.front(), separator));
        std::string last(StripPagePart(parts.back(), separator));
        value = first + "--" + last;
    }
    return value;
}

Entries FixPageDoubleHyphen(const Entries& entries) {
    Entries result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        auto pages = entry.Get("pages");
        if (pages.has_value()) {
            result.push_back(entry.With("pages", PageDoubleHyphen(*pages)));
        } else {
            result.push_back(entry);
        }
    }
    return result;
}

} // namespace BibSane
