#ifndef BIBSANE_SRC_JOURNAL_ABBREVIATION_CACHE_H_
#define BIBSANE_SRC_JOURNAL_ABBREVIATION_CACHE_H_

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace BibSane {

class CacheFormatError : public std::runtime_error {
public:
    explicit CacheFormatError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Journal name -> abbreviation, persisted as a flat JSON object between runs.
 * Keys are exact (case-sensitive) journal names.
 *
 * The cache is owned by the journal abbreviation stage: loaded when the stage
 * starts and saved once when it ends.
 */
class AbbreviationCache {
public:
    AbbreviationCache() = default;

    // Empty cache when `path` does not exist. Throws CacheFormatError when the
    // file is not a JSON object of strings, std::system_error when unreadable.
    static AbbreviationCache Load(const std::string& path);

    // Writes pretty-printed JSON with a trailing newline, also when empty.
    void Save(const std::string& path) const;

    std::optional<std::string> Get(const std::string& journal) const;
    void Put(const std::string& journal, const std::string& abbreviation);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::map<std::string, std::string> entries_;
};

} // namespace BibSane

#endif // BIBSANE_SRC_JOURNAL_ABBREVIATION_CACHE_H_
