#ifndef BIBSANE_SRC_BIBTEX_AUX_PARSER_H_
#define BIBSANE_SRC_BIBTEX_AUX_PARSER_H_

#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace BibSane {

class AuxParseError : public std::runtime_error {
public:
    explicit AuxParseError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * What a LaTeX aux file tells us: the citation keys in document order
 * (duplicates included) and the bibliography files, already resolved
 * relative to the aux file's directory and carrying the .bib suffix.
 */
struct AuxData {
    std::vector<std::string> citations;
    std::vector<std::string> bib_files;
};

// Parses \citation{...} and \bibdata{...} lines. `aux_dir` is prepended to
// bibliography names. Throws AuxParseError on malformed lines.
AuxData ParseAux(std::istream& in, const std::string& aux_dir, const std::string& source_name);

// Opens and parses an aux file. Throws std::system_error when it cannot be read.
AuxData ParseAuxFile(const std::string& path);

// Aux files below `root` that have a .tex file with the same stem, sorted.
// Hidden files and directories (name starting with '.') are skipped.
std::vector<std::string> FindAuxFiles(const std::string& root);

} // namespace BibSane

#endif // BIBSANE_SRC_BIBTEX_AUX_PARSER_H_
