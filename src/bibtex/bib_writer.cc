#include "bib_writer.h"

#include <algorithm>
#include <vector>

namespace BibSane {

std::string WriteBibEntry(const Entry& entry) {
    std::vector<const Entry::Field*> fields;
    fields.reserve(entry.size());
    for (const auto& field : entry.fields()) {
        if (!IsReservedField(field.first)) {
            fields.push_back(&field);
        }
    }
    std::sort(fields.begin(), fields.end(),
              [](const Entry::Field* a, const Entry::Field* b) { return a->first < b->first; });

    std::string out;
    out += "@" + entry.type() + "{" + entry.id();
    for (const Entry::Field* field : fields) {
        out += ",\n " + field->first + " = {" + field->second + "}";
    }
    out += "\n}\n";
    return out;
}

std::string WriteBib(const Entries& entries) {
    std::string out;
    bool first = true;
    for (const auto& entry : entries) {
        if (!first) {
            out += "\n";
        }
        first = false;
        out += WriteBibEntry(entry);
    }
    return out;
}

} // namespace BibSane
