#include "policy_cleaner.h"

#include <utility>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"

namespace BibSane {

CleanResult CleanEntries(const Entries& entries, const PolicyTable& policies, IssueReport& report) {
    CleanResult result;
    for (const auto& old_entry : entries) {
        const std::string& eid = old_entry.id();
        Entry new_entry(old_entry.type(), eid);
        std::string etype = old_entry.type();
        auto annotation = old_entry.Get(kAnnotationField);
        if (annotation.has_value()) {
            etype = *annotation;
            new_entry.Set(kAnnotationField, *annotation);
        }

        auto policy = policies.find(etype);
        if (policy == policies.end()) {
            report.Add(IssueKind::UNCONFIGURED_ENTRY_TYPE, absl::StrCat(eid, ": @", etype, " is not configured"));
            result.valid = false;
            continue;
        }

        absl::flat_hash_set<std::string> sanctioned;
        for (const auto& [field, field_policy] : policy->second) {
            sanctioned.insert(field);
            auto value = old_entry.Get(field);
            switch (field_policy) {
                case FieldPolicy::MUST:
                    if (!value.has_value()) {
                        report.Add(IssueKind::MISSING_FIELD, absl::StrCat(eid, ": @", etype, " missing field ", field));
                        result.valid = false;
                    } else {
                        new_entry.Set(field, *value);
                    }
                    break;
                case FieldPolicy::MAY:
                    if (value.has_value()) {
                        new_entry.Set(field, *value);
                    }
                    break;
            }
        }

        for (const auto& [field, value] : old_entry.fields()) {
            if (IsReservedField(field) || field == kAnnotationField || sanctioned.contains(field)) {
                continue;
            }
            report.Add(IssueKind::DISCARDED_FIELD, absl::StrCat(eid, ": @", etype, " discarding field ", field));
        }
        result.entries.push_back(std::move(new_entry));
    }
    return result;
}

} // namespace BibSane
