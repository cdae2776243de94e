#ifndef BIBSANE_SRC_JOURNAL_ABBREVIATION_LOOKUP_H_
#define BIBSANE_SRC_JOURNAL_ABBREVIATION_LOOKUP_H_

#include <optional>
#include <string>

namespace BibSane {

/**
 * Interface for resolving a full journal name to its ISO abbreviation
 */
class IAbbreviationLookup {
public:
    virtual ~IAbbreviationLookup() = default;

    // nullopt when the abbreviation could not be obtained.
    virtual std::optional<std::string> Lookup(const std::string& journal) = 0;
};

} // namespace BibSane

#endif // BIBSANE_SRC_JOURNAL_ABBREVIATION_LOOKUP_H_
