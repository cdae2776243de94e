#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <utility>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "absl/container/flat_hash_set.h"

namespace fs = std::filesystem;

namespace BibSane {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

namespace {

const absl::flat_hash_set<std::string>& KnownKeys() {
    static const absl::flat_hash_set<std::string> keys = {
        "bibtex_out",
        "drop_entry_types",
        "normalize_doi",
        "duplicate_id",
        "duplicate_doi",
        "preambles_allowed",
        "normalize_whitespace",
        "normalize_names",
        "fix_page_double_hyphen",
        "abbreviate_journal",
        "abbreviation_service",
        "abbreviation_timeout_ms",
        "sort",
        "citation_policies",
    };
    return keys;
}

} // namespace

Configuration::Configuration() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    config_.root = ec ? std::string(".") : cwd.string();
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        config_.root = fs::path(filename).parent_path().string();
        parseYAMLNode(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content, const std::string& root) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        config_.root = root;
        parseYAMLNode(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::parseYAMLNode(const YAML::Node& root) {
    parse_errors_.clear();
    // An empty file is a valid, all-defaults configuration.
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        parse_errors_.push_back("Configuration must be a mapping at the top level");
        return;
    }

    for (const auto& item : root) {
        const std::string key = item.first.as<std::string>();
        if (!KnownKeys().contains(key)) {
            parse_errors_.push_back("Unknown configuration key: " + key);
        }
    }

    if (root["bibtex_out"]) config_.bibtex_out.set(root["bibtex_out"].as<std::string>());
    if (root["normalize_doi"]) config_.normalize_doi.set(root["normalize_doi"].as<bool>());
    if (root["normalize_whitespace"]) config_.normalize_whitespace.set(root["normalize_whitespace"].as<bool>());
    if (root["normalize_names"]) config_.normalize_names.set(root["normalize_names"].as<bool>());
    if (root["fix_page_double_hyphen"]) config_.fix_page_double_hyphen.set(root["fix_page_double_hyphen"].as<bool>());
    if (root["sort"]) config_.sort.set(root["sort"].as<bool>());
    if (root["preambles_allowed"]) config_.preambles_allowed.set(root["preambles_allowed"].as<bool>());

    if (root["drop_entry_types"]) {
        config_.drop_entry_types.clear();
        for (const auto& entry_type : root["drop_entry_types"]) {
            config_.drop_entry_types.push_back(entry_type.as<std::string>());
        }
    }

    // Duplicate policies
    if (root["duplicate_id"]) {
        const std::string value = root["duplicate_id"].as<std::string>();
        auto policy = ParseDuplicatePolicy(value);
        if (policy.has_value()) {
            config_.duplicate_id = *policy;
        } else {
            parse_errors_.push_back("duplicate_id must be fail, merge or ignore, got: " + value);
        }
    }
    if (root["duplicate_doi"]) {
        const std::string value = root["duplicate_doi"].as<std::string>();
        auto policy = ParseDuplicatePolicy(value);
        if (policy.has_value()) {
            config_.duplicate_doi = *policy;
        } else {
            parse_errors_.push_back("duplicate_doi must be fail, merge or ignore, got: " + value);
        }
    }

    // Journal abbreviation
    if (root["abbreviate_journal"] && !root["abbreviate_journal"].IsNull()) {
        config_.abbreviation.cache = root["abbreviate_journal"].as<std::string>();
    }
    if (root["abbreviation_service"]) config_.abbreviation.service.set(root["abbreviation_service"].as<std::string>());
    if (root["abbreviation_timeout_ms"]) config_.abbreviation.timeout_ms.set(root["abbreviation_timeout_ms"].as<int>());

    if (root["citation_policies"]) {
        parseCitationPolicies(root["citation_policies"]);
    }
}

void Configuration::parseCitationPolicies(const YAML::Node& node) {
    config_.citation_policies.clear();
    if (node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        parse_errors_.push_back("citation_policies must map entry types to field policies");
        return;
    }
    for (const auto& type_item : node) {
        const std::string entry_type = type_item.first.as<std::string>();
        TypePolicy fields;
        if (!type_item.second.IsNull()) {
            if (!type_item.second.IsMap()) {
                parse_errors_.push_back("citation_policies." + entry_type + " must map fields to must/may");
                continue;
            }
            for (const auto& field_item : type_item.second) {
                const std::string field = field_item.first.as<std::string>();
                const std::string value = field_item.second.as<std::string>();
                auto policy = ParseFieldPolicy(value);
                if (!policy.has_value()) {
                    parse_errors_.push_back("citation_policies." + entry_type + "." + field +
                                            " must be must or may, got: " + value);
                    continue;
                }
                fields.emplace_back(field, *policy);
            }
        }
        config_.citation_policies[entry_type] = std::move(fields);
    }
}

std::optional<std::string> Configuration::getAbbreviationCachePath() const {
    if (!config_.abbreviation.cache.has_value()) {
        return std::nullopt;
    }
    return (fs::path(config_.root) / *config_.abbreviation.cache).string();
}

bool Configuration::validate() const {
    validation_errors_ = parse_errors_;

    if (config_.bibtex_out.get().empty()) {
        validation_errors_.push_back("bibtex_out must not be empty");
    }

    if (config_.abbreviation.timeout_ms.get() <= 0) {
        validation_errors_.push_back("abbreviation_timeout_ms must be positive");
    }

    if (config_.abbreviation.cache.has_value() && config_.abbreviation.cache->empty()) {
        validation_errors_.push_back("abbreviate_journal must name a cache file");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

bool Configuration::validateConfig() {
    bool ok = validate();
    for (const auto& error : validation_errors_) {
        LOG(ERROR) << "Invalid configuration: " << error;
    }
    return ok;
}

} // namespace BibSane
