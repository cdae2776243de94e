#ifndef BIBSANE_SRC_JOURNAL_CURL_ABBREVIATION_LOOKUP_H_
#define BIBSANE_SRC_JOURNAL_CURL_ABBREVIATION_LOOKUP_H_

#include <string>

#include "abbreviation_lookup.h"

namespace BibSane {

/**
 * Queries an abbreviso-style web service: GET <service_prefix><escaped name>
 * returns the abbreviation as the plain-text body.
 */
class CurlAbbreviationLookup : public IAbbreviationLookup {
public:
    CurlAbbreviationLookup(std::string service_prefix, long timeout_ms);
    ~CurlAbbreviationLookup() override;

    CurlAbbreviationLookup(const CurlAbbreviationLookup&) = delete;
    CurlAbbreviationLookup& operator=(const CurlAbbreviationLookup&) = delete;

    std::optional<std::string> Lookup(const std::string& journal) override;

private:
    std::string service_prefix_;
    long timeout_ms_;
};

} // namespace BibSane

#endif // BIBSANE_SRC_JOURNAL_CURL_ABBREVIATION_LOOKUP_H_
