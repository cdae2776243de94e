#ifndef BIBSANE_SRC_BIBTEX_BIB_PARSER_H_
#define BIBSANE_SRC_BIBTEX_BIB_PARSER_H_

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "../common/entry.h"

namespace BibSane {

class BibParseError : public std::runtime_error {
public:
    explicit BibParseError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Contents of one BibTeX file as the sanitizer needs them: entries in file
 * order and the number of @preamble blocks found.
 */
struct BibDatabase {
    std::string source;
    Entries entries;
    size_t num_preambles = 0;
};

/**
 * Parses the subset of BibTeX found in real bibliographies: regular entries
 * with braced, quoted, numeric or macro values joined by '#', @string
 * definitions, @preamble and @comment blocks. Entry types and field names are
 * lower-cased and common field aliases are homogenized (keywords -> keyword,
 * link -> url, ...). Text outside of entries is ignored.
 */
BibDatabase ParseBib(std::string_view text, const std::string& source_name);

// Throws std::system_error when the file cannot be read, BibParseError on bad syntax.
BibDatabase ParseBibFile(const std::string& path);

// Lower-cased, alias-resolved field name.
std::string HomogenizeFieldName(std::string_view name);

} // namespace BibSane

#endif // BIBSANE_SRC_BIBTEX_BIB_PARSER_H_
