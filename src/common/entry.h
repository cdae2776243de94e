#ifndef BIBSANE_SRC_COMMON_ENTRY_H_
#define BIBSANE_SRC_COMMON_ENTRY_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace BibSane {

// Reserved field names carried by every entry.
inline constexpr std::string_view kEntryTypeField = "ENTRYTYPE";
inline constexpr std::string_view kIdField = "ID";

/**
 * One bibliographic record: an ordered mapping from field name to value.
 *
 * ENTRYTYPE and ID are stored as ordinary fields so that stages which operate
 * on "every field" (brace stripping, whitespace collapsing, merging) see them
 * too. Both are always present. Entries are plain values; a stage that
 * rewrites an entry works on its own copy.
 */
class Entry {
public:
    using Field = std::pair<std::string, std::string>;
    using Fields = std::vector<Field>;

    Entry(std::string entry_type, std::string id);

    const std::string& type() const { return *Find(kEntryTypeField); }
    const std::string& id() const { return *Find(kIdField); }

    bool Has(std::string_view name) const { return Find(name) != nullptr; }

    // Returns nullopt when the field is absent.
    std::optional<std::string> Get(std::string_view name) const;

    // Value of the field, or `fallback` when absent.
    std::string GetOr(std::string_view name, std::string_view fallback) const;

    // Replaces the value in place when the field exists, appends otherwise.
    void Set(std::string_view name, std::string value);

    // Copy of this entry with one field overridden.
    Entry With(std::string_view name, std::string value) const;

    const Fields& fields() const { return fields_; }
    size_t size() const { return fields_.size(); }

    bool operator==(const Entry& other) const { return fields_ == other.fields_; }
    bool operator!=(const Entry& other) const { return !(*this == other); }

private:
    const std::string* Find(std::string_view name) const;
    std::string* Find(std::string_view name);

    Fields fields_;
};

using Entries = std::vector<Entry>;

bool IsReservedField(std::string_view name);

} // namespace BibSane

#endif // BIBSANE_SRC_COMMON_ENTRY_H_
