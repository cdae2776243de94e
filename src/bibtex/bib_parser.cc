#include "bib_parser.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"

namespace BibSane {

namespace {

const absl::flat_hash_map<std::string, std::string>& FieldAliases() {
    static const absl::flat_hash_map<std::string, std::string> aliases = {
        {"keyw", "keyword"},
        {"keywords", "keyword"},
        {"authors", "author"},
        {"editors", "editor"},
        {"urls", "url"},
        {"link", "url"},
        {"links", "url"},
        {"subjects", "subject"},
        {"xref", "crossref"},
    };
    return aliases;
}

// Predefined month macros; an @string of the same name replaces them.
const absl::flat_hash_map<std::string, std::string>& MonthStrings() {
    static const absl::flat_hash_map<std::string, std::string> months = {
        {"jan", "January"},
        {"feb", "February"},
        {"mar", "March"},
        {"apr", "April"},
        {"may", "May"},
        {"jun", "June"},
        {"jul", "July"},
        {"aug", "August"},
        {"sep", "September"},
        {"oct", "October"},
        {"nov", "November"},
        {"dec", "December"},
    };
    return months;
}

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
}

class Parser {
public:
    Parser(std::string_view text, const std::string& source)
        : text_(text), source_(source), strings_(MonthStrings()) {
        db_.source = source;
    }

    BibDatabase Parse() {
        while (true) {
            size_t at = text_.find('@', pos_);
            if (at == std::string_view::npos) {
                break;
            }
            pos_ = at + 1;
            SkipSpace();
            std::string type = absl::AsciiStrToLower(ReadWhile(IsIdentifierChar));
            SkipSpace();
            if (type.empty() || AtEnd() || (Peek() != '{' && Peek() != '(')) {
                // A stray '@' in free text between entries.
                continue;
            }
            const char close = Peek() == '{' ? '}' : ')';
            ++pos_;
            if (type == "comment") {
                SkipBody(close);
            } else if (type == "preamble") {
                SkipBody(close);
                ++db_.num_preambles;
            } else if (type == "string") {
                ParseStringDefinition(close);
            } else {
                ParseEntry(std::move(type), close);
            }
        }
        return std::move(db_);
    }

private:
    bool AtEnd() const { return pos_ >= text_.size(); }
    char Peek() const { return text_[pos_]; }

    void SkipSpace() {
        while (!AtEnd() && IsSpace(Peek())) ++pos_;
    }

    template <typename Pred>
    std::string ReadWhile(Pred pred) {
        size_t start = pos_;
        while (!AtEnd() && pred(Peek())) ++pos_;
        return std::string(text_.substr(start, pos_ - start));
    }

    size_t LineAt(size_t pos) const {
        return 1 + std::count(text_.begin(), text_.begin() + std::min(pos, text_.size()), '\n');
    }

    [[noreturn]] void Fail(const std::string& what, size_t pos) const {
        throw BibParseError(absl::StrCat(source_, ":", LineAt(pos), ": ", what));
    }

    void Expect(char c, const std::string& context) {
        SkipSpace();
        if (AtEnd() || Peek() != c) {
            Fail(absl::StrCat("expected '", std::string(1, c), "' ", context), pos_);
        }
        ++pos_;
    }

    // Skips to just past the `close` that ends the current block.
    void SkipBody(char close) {
        const size_t start = pos_;
        int depth = 0;
        while (!AtEnd()) {
            char c = Peek();
            ++pos_;
            if (c == '{') {
                ++depth;
            } else if (c == '}') {
                if (depth == 0 && close == '}') return;
                --depth;
            } else if (c == close && depth == 0) {
                return;
            }
        }
        Fail("unterminated block", start);
    }

    // Content between a '{' (already consumed) and its matching '}'.
    std::string ReadBraced() {
        const size_t start = pos_;
        int depth = 0;
        while (!AtEnd()) {
            char c = Peek();
            if (c == '{') {
                ++depth;
            } else if (c == '}') {
                if (depth == 0) {
                    std::string value(text_.substr(start, pos_ - start));
                    ++pos_;
                    return value;
                }
                --depth;
            }
            ++pos_;
        }
        Fail("unterminated braced value", start);
    }

    // Content between a '"' (already consumed) and the next '"' outside braces.
    std::string ReadQuoted() {
        const size_t start = pos_;
        int depth = 0;
        while (!AtEnd()) {
            char c = Peek();
            if (c == '{') {
                ++depth;
            } else if (c == '}') {
                --depth;
            } else if (c == '"' && depth == 0) {
                std::string value(text_.substr(start, pos_ - start));
                ++pos_;
                return value;
            }
            ++pos_;
        }
        Fail("unterminated quoted value", start);
    }

    std::string ParseValuePart(char close) {
        SkipSpace();
        if (AtEnd()) {
            Fail("missing value", pos_);
        }
        if (Peek() == '{') {
            ++pos_;
            return ReadBraced();
        }
        if (Peek() == '"') {
            ++pos_;
            return ReadQuoted();
        }
        const size_t start = pos_;
        std::string token = ReadWhile([close](char c) {
            return !IsSpace(c) && c != ',' && c != '#' && c != close && c != '}' && c != '=';
        });
        if (token.empty()) {
            Fail("missing value", start);
        }
        auto macro = strings_.find(absl::AsciiStrToLower(token));
        if (macro != strings_.end()) {
            return macro->second;
        }
        return token;
    }

    // One or more parts joined by '#'.
    std::string ParseValue(char close) {
        std::string value = ParseValuePart(close);
        SkipSpace();
        while (!AtEnd() && Peek() == '#') {
            ++pos_;
            value += ParseValuePart(close);
            SkipSpace();
        }
        return value;
    }

    std::string ParseFieldName() {
        SkipSpace();
        const size_t start = pos_;
        std::string name = ReadWhile([](char c) {
            return !IsSpace(c) && c != '=' && c != ',' && c != '{' && c != '}' && c != '(' && c != ')';
        });
        if (name.empty()) {
            Fail("expected a field name", start);
        }
        return name;
    }

    void ParseStringDefinition(char close) {
        std::string name = absl::AsciiStrToLower(ParseFieldName());
        Expect('=', "after @string name");
        std::string value = ParseValue(close);
        Expect(close, "at the end of @string");
        strings_[name] = std::move(value);
    }

    void ParseEntry(std::string type, char close) {
        const size_t entry_start = pos_;
        SkipSpace();
        std::string key = ReadWhile([close](char c) { return c != ',' && c != close && c != '\n'; });
        key = std::string(absl::StripAsciiWhitespace(key));
        if (key.empty()) {
            Fail(absl::StrCat("@", type, " entry without a citation key"), entry_start);
        }
        Entry entry(std::move(type), std::move(key));

        SkipSpace();
        if (AtEnd()) {
            Fail("unterminated entry", entry_start);
        }
        if (Peek() == close) {
            ++pos_;
            db_.entries.push_back(std::move(entry));
            return;
        }
        Expect(',', "after the citation key");

        while (true) {
            SkipSpace();
            if (AtEnd()) {
                Fail(absl::StrCat("unterminated entry ", entry.id()), entry_start);
            }
            if (Peek() == close) {
                ++pos_;
                break;
            }
            std::string field = HomogenizeFieldName(ParseFieldName());
            Expect('=', absl::StrCat("after field ", field, " in ", entry.id()));
            std::string value = ParseValue(close);
            entry.Set(field, std::move(value));
            SkipSpace();
            if (AtEnd()) {
                Fail(absl::StrCat("unterminated entry ", entry.id()), entry_start);
            }
            if (Peek() == ',') {
                ++pos_;
            } else if (Peek() != close) {
                Fail(absl::StrCat("expected ',' or end of entry ", entry.id()), pos_);
            }
        }
        db_.entries.push_back(std::move(entry));
    }

    std::string_view text_;
    const std::string& source_;
    size_t pos_ = 0;
    BibDatabase db_;
    absl::flat_hash_map<std::string, std::string> strings_;
};

} // namespace

std::string HomogenizeFieldName(std::string_view name) {
    std::string lower = absl::AsciiStrToLower(name);
    auto alias = FieldAliases().find(lower);
    if (alias != FieldAliases().end()) {
        return alias->second;
    }
    return lower;
}

BibDatabase ParseBib(std::string_view text, const std::string& source_name) {
    Parser parser(text, source_name);
    return parser.Parse();
}

BibDatabase ParseBibFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::system_error(errno, std::generic_category(), "Failed to open BibTeX file " + path);
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::system_error(errno, std::generic_category(), "Failed to read BibTeX file " + path);
    }
    return ParseBib(text, path);
}

} // namespace BibSane
