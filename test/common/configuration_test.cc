#include <gtest/gtest.h>
#include "../../src/common/configuration.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace BibSane;

class ConfigurationTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("BIBSANE_SORT");
        unsetenv("BIBSANE_BIBTEX_OUT");
        unsetenv("BIBSANE_ABBREVIATION_TIMEOUT_MS");
    }

    Configuration config_;
};

TEST_F(ConfigurationTest, DefaultsArePermissive) {
    const BibSaneConfig& cfg = config_.config();
    EXPECT_EQ(cfg.bibtex_out.get(), "references.bib");
    EXPECT_FALSE(cfg.normalize_doi.get());
    EXPECT_FALSE(cfg.normalize_whitespace.get());
    EXPECT_FALSE(cfg.normalize_names.get());
    EXPECT_FALSE(cfg.fix_page_double_hyphen.get());
    EXPECT_FALSE(cfg.sort.get());
    EXPECT_TRUE(cfg.preambles_allowed.get());
    EXPECT_EQ(cfg.duplicate_id, DuplicatePolicy::IGNORE);
    EXPECT_EQ(cfg.duplicate_doi, DuplicatePolicy::IGNORE);
    EXPECT_TRUE(cfg.drop_entry_types.empty());
    EXPECT_TRUE(cfg.citation_policies.empty());
    EXPECT_FALSE(config_.getAbbreviationCachePath().has_value());
    EXPECT_TRUE(config_.validate());
}

TEST_F(ConfigurationTest, EmptyDocumentKeepsDefaults) {
    EXPECT_TRUE(config_.loadFromString(""));
    EXPECT_EQ(config_.config().bibtex_out.get(), "references.bib");
}

TEST_F(ConfigurationTest, LoadsAllKeys) {
    const std::string yaml = R"(
bibtex_out: clean.bib
drop_entry_types: [misc, online]
normalize_doi: true
normalize_whitespace: true
fix_page_double_hyphen: true
sort: true
duplicate_id: merge
duplicate_doi: fail
preambles_allowed: false
abbreviate_journal: abbreviations.json
abbreviation_timeout_ms: 2500
citation_policies:
  article:
    author: must
    title: must
    doi: may
  software:
)";
    ASSERT_TRUE(config_.loadFromString(yaml, "/tmp/project"));
    const BibSaneConfig& cfg = config_.config();
    EXPECT_EQ(cfg.bibtex_out.get(), "clean.bib");
    ASSERT_EQ(cfg.drop_entry_types.size(), 2u);
    EXPECT_EQ(cfg.drop_entry_types[1], "online");
    EXPECT_TRUE(cfg.normalize_doi.get());
    EXPECT_TRUE(cfg.sort.get());
    EXPECT_FALSE(cfg.preambles_allowed.get());
    EXPECT_EQ(cfg.duplicate_id, DuplicatePolicy::MERGE);
    EXPECT_EQ(cfg.duplicate_doi, DuplicatePolicy::FAIL);
    EXPECT_EQ(cfg.abbreviation.timeout_ms.get(), 2500);
    EXPECT_EQ(config_.getAbbreviationCachePath(),
              std::optional<std::string>("/tmp/project/abbreviations.json"));

    ASSERT_EQ(cfg.citation_policies.size(), 2u);
    const TypePolicy& article = cfg.citation_policies.at("article");
    ASSERT_EQ(article.size(), 3u);
    EXPECT_EQ(article[0].first, "author");
    EXPECT_EQ(article[0].second, FieldPolicy::MUST);
    EXPECT_EQ(article[2].second, FieldPolicy::MAY);
    EXPECT_TRUE(cfg.citation_policies.at("software").empty());
}

TEST_F(ConfigurationTest, RejectsUnknownKey) {
    EXPECT_FALSE(config_.loadFromString("sort: true\nsrot: false\n"));
    auto errors = config_.getValidationErrors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("srot"), std::string::npos);
}

TEST_F(ConfigurationTest, RejectsBadPolicies) {
    EXPECT_FALSE(config_.loadFromString("duplicate_id: sometimes\n"));
    EXPECT_FALSE(config_.loadFromString("citation_policies:\n  article:\n    title: should\n"));
}

TEST_F(ConfigurationTest, RejectsMalformedYaml) {
    EXPECT_FALSE(config_.loadFromString("sort: [true\n"));
    EXPECT_FALSE(config_.loadFromString("- just\n- a list\n"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFile) {
    ASSERT_TRUE(config_.loadFromString("sort: false\nbibtex_out: a.bib\n"));
    setenv("BIBSANE_SORT", "yes", 1);
    setenv("BIBSANE_BIBTEX_OUT", "b.bib", 1);
    EXPECT_TRUE(config_.config().sort.get());
    EXPECT_EQ(config_.config().bibtex_out.get(), "b.bib");

    setenv("BIBSANE_ABBREVIATION_TIMEOUT_MS", "not-a-number", 1);
    EXPECT_EQ(config_.config().abbreviation.timeout_ms.get(), 10000);
}

TEST_F(ConfigurationTest, LoadFromFileUsesFileDirectoryAsRoot) {
    char dir_template[] = "/tmp/bibsane_config_XXXXXX";
    ASSERT_NE(mkdtemp(dir_template), nullptr);
    const std::filesystem::path dir(dir_template);
    const std::string path = (dir / "bibsane.yaml").string();
    {
        std::ofstream out(path);
        out << "abbreviate_journal: cache.json\n";
    }
    ASSERT_TRUE(config_.loadFromFile(path));
    EXPECT_EQ(config_.getAbbreviationCachePath(),
              std::optional<std::string>((dir / "cache.json").string()));

    EXPECT_FALSE(config_.loadFromFile((dir / "missing.yaml").string()));
    std::filesystem::remove_all(dir);
}
