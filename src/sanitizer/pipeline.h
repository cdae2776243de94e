#ifndef BIBSANE_SRC_SANITIZER_PIPELINE_H_
#define BIBSANE_SRC_SANITIZER_PIPELINE_H_

#include <optional>
#include <string>
#include <vector>

#include "../bibtex/bib_parser.h"
#include "../common/configuration.h"
#include "../common/entry.h"
#include "../common/issue_report.h"
#include "../common/verdict.h"
#include "../journal/abbreviation_lookup.h"
#include "citation_reconciler.h"

namespace BibSane {

struct SanitizeResult {
    Entries entries;
    // CHANGED or BROKEN; UNCHANGED is only decided when writing.
    Verdict verdict = Verdict::CHANGED;
};

/**
 * Runs the sanitization stages over one document's bibliography.
 *
 * Stages run in a fixed order and each may only downgrade the verdict. All
 * stages run even after a violation so that one invocation reports every
 * problem; a BROKEN verdict only suppresses the final write.
 */
class Sanitizer {
public:
    // `lookup` may be null when journal abbreviation is not configured.
    Sanitizer(const Configuration& config, IAbbreviationLookup* lookup, bool verbose);

    // Pure part of the pipeline: everything between parsing and writing.
    // Throws UnsupportedFeatureError when name normalization is requested.
    SanitizeResult Sanitize(const std::vector<BibDatabase>& sources,
                            const CitationSet& citations,
                            IssueReport& report) const;

    // Parses the aux file and its bibliographies, sanitizes and writes
    // <aux dir>/<bibtex_out>. Structural errors propagate as exceptions.
    Verdict ProcessAux(const std::string& aux_path, IssueReport& report) const;

    // ProcessAux with structural errors logged and turned into BROKEN.
    Verdict RunUnit(const std::string& aux_path) const;

    std::string OutputPathFor(const std::string& aux_path) const;

private:
    const Configuration& config_;
    IAbbreviationLookup* lookup_;
    bool verbose_;
};

} // namespace BibSane

#endif // BIBSANE_SRC_SANITIZER_PIPELINE_H_
