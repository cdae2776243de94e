#include "policy.h"

namespace BibSane {

std::optional<DuplicatePolicy> ParseDuplicatePolicy(std::string_view value) {
    if (value == "fail") return DuplicatePolicy::FAIL;
    if (value == "merge") return DuplicatePolicy::MERGE;
    if (value == "ignore") return DuplicatePolicy::IGNORE;
    return std::nullopt;
}

std::optional<FieldPolicy> ParseFieldPolicy(std::string_view value) {
    if (value == "must") return FieldPolicy::MUST;
    if (value == "may") return FieldPolicy::MAY;
    return std::nullopt;
}

const char* DuplicatePolicyName(DuplicatePolicy policy) {
    switch (policy) {
        case DuplicatePolicy::FAIL:
            return "fail";
        case DuplicatePolicy::MERGE:
            return "merge";
        case DuplicatePolicy::IGNORE:
            return "ignore";
    }
    return "unknown";
}

const char* FieldPolicyName(FieldPolicy policy) {
    switch (policy) {
        case FieldPolicy::MUST:
            return "must";
        case FieldPolicy::MAY:
            return "may";
    }
    return "unknown";
}

} // namespace BibSane
