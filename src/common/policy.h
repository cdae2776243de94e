#ifndef BIBSANE_SRC_COMMON_POLICY_H_
#define BIBSANE_SRC_COMMON_POLICY_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"

namespace BibSane {

/**
 * What to do when two entries share an ID (or a DOI).
 * MERGE only takes effect in the merger stage; the collector treats it like IGNORE.
 */
enum class DuplicatePolicy {
    FAIL,
    MERGE,
    IGNORE
};

enum class FieldPolicy {
    MUST,
    MAY
};

std::optional<DuplicatePolicy> ParseDuplicatePolicy(std::string_view value);
std::optional<FieldPolicy> ParseFieldPolicy(std::string_view value);

const char* DuplicatePolicyName(DuplicatePolicy policy);
const char* FieldPolicyName(FieldPolicy policy);

// Field policies of one entry type, in configuration order.
using TypePolicy = std::vector<std::pair<std::string, FieldPolicy>>;

// Entry type (or bibsane annotation) -> sanctioned fields.
using PolicyTable = absl::flat_hash_map<std::string, TypePolicy>;

} // namespace BibSane

#endif // BIBSANE_SRC_COMMON_POLICY_H_
