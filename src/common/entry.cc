#include "entry.h"

namespace BibSane {

bool IsReservedField(std::string_view name) {
    return name == kEntryTypeField || name == kIdField;
}

Entry::Entry(std::string entry_type, std::string id) {
    fields_.reserve(8);
    fields_.emplace_back(std::string(kEntryTypeField), std::move(entry_type));
    fields_.emplace_back(std::string(kIdField), std::move(id));
}

const std::string* Entry::Find(std::string_view name) const {
    for (const auto& field : fields_) {
        if (field.first == name) {
            return &field.second;
        }
    }
    return nullptr;
}

std::string* Entry::Find(std::string_view name) {
    for (auto& field : fields_) {
        if (field.first == name) {
            return &field.second;
        }
    }
    return nullptr;
}

std::optional<std::string> Entry::Get(std::string_view name) const {
    const std::string* value = Find(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return *value;
}

std::string Entry::GetOr(std::string_view name, std::string_view fallback) const {
    const std::string* value = Find(name);
    return value != nullptr ? *value : std::string(fallback);
}

void Entry::Set(std::string_view name, std::string value) {
    std::string* existing = Find(name);
    if (existing != nullptr) {
        *existing = std::move(value);
        return;
    }
    fields_.emplace_back(std::string(name), std::move(value));
}

Entry Entry::With(std::string_view name, std::string value) const {
    Entry copy = *this;
    copy.Set(name, std::move(value));
    return copy;
}

} // namespace BibSane
