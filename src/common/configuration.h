#ifndef BIBSANE_SRC_COMMON_CONFIGURATION_H_
#define BIBSANE_SRC_COMMON_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>

#include "policy.h"

namespace YAML {
class Node;
}

namespace BibSane {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure.
 * Defaults are the most permissive and least invasive settings; stricter
 * behavior has to be switched on knowingly in the config file.
 */
struct BibSaneConfig {
    // Directory that relative paths in the config (abbreviate_journal) refer to.
    std::string root;

    // Output file name, relative to the directory of each aux file.
    ConfigValue<std::string> bibtex_out{"references.bib", "BIBSANE_BIBTEX_OUT"};

    std::vector<std::string> drop_entry_types;

    ConfigValue<bool> normalize_doi{false, "BIBSANE_NORMALIZE_DOI"};
    ConfigValue<bool> normalize_whitespace{false, "BIBSANE_NORMALIZE_WHITESPACE"};
    ConfigValue<bool> normalize_names{false, "BIBSANE_NORMALIZE_NAMES"};
    ConfigValue<bool> fix_page_double_hyphen{false, "BIBSANE_FIX_PAGE_DOUBLE_HYPHEN"};
    // Sort key = year + first author "last, first" in lower case.
    ConfigValue<bool> sort{false, "BIBSANE_SORT"};
    ConfigValue<bool> preambles_allowed{true, "BIBSANE_PREAMBLES_ALLOWED"};

    DuplicatePolicy duplicate_id = DuplicatePolicy::IGNORE;
    DuplicatePolicy duplicate_doi = DuplicatePolicy::IGNORE;

    // Journal abbreviation
    struct Abbreviation {
        // Cache file, relative to root. Unset disables the stage.
        std::optional<std::string> cache;
        ConfigValue<std::string> service{"https://abbreviso.toolforge.org/abbreviso/a/",
                                         "BIBSANE_ABBREVIATION_SERVICE"};
        ConfigValue<int> timeout_ms{10000, "BIBSANE_ABBREVIATION_TIMEOUT_MS"};
    } abbreviation;

    PolicyTable citation_policies;
};

/**
 * Loads and validates the YAML configuration. Read once before any aux file is
 * processed and treated as read-only afterwards.
 */
class Configuration {
public:
    // Defaults with the current working directory as root.
    Configuration();

    // Load configuration from file; root becomes the file's directory.
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content, const std::string& root = ".");

    // Get the configuration
    const BibSaneConfig& config() const { return config_; }
    BibSaneConfig& config() { return config_; }

    // Cache file path resolved against root, if abbreviation is enabled.
    std::optional<std::string> getAbbreviationCachePath() const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    BibSaneConfig config_;
    mutable std::vector<std::string> validation_errors_;
    std::vector<std::string> parse_errors_;

    // Helper methods for parsing
    void parseYAMLNode(const YAML::Node& root);
    void parseCitationPolicies(const YAML::Node& node);
    bool validateConfig();
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace BibSane

#endif // BIBSANE_SRC_COMMON_CONFIGURATION_H_
