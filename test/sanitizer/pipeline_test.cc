#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/sanitizer/pipeline.h"
#include "../../src/bibtex/bib_parser.h"
#include "../../src/sanitizer/normalizers.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace BibSane;
using ::testing::Return;

namespace {

class FakeAbbreviationLookup : public IAbbreviationLookup {
public:
    MOCK_METHOD(std::optional<std::string>, Lookup, (const std::string& journal), (override));
};

const char* kReferences = R"(
@article{Smith2001,
  author = {John Smith},
  title = {Later {Work}},
  journal = {Journal of the ACM},
  year = {2001},
  pages = {10-20},
  doi = {https://doi.org/10.1000/ABC},
}

@book{Jones1999,
  author = {Ann Jones},
  title = {Earlier   Book},
  publisher = {{ACM} Press},
  year = {1999},
}

@misc{Unused,
  title = {Never cited},
}
)";

} // namespace

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        char dir_template[] = "/tmp/bibsane_pipeline_XXXXXX";
        ASSERT_NE(mkdtemp(dir_template), nullptr);
        dir_ = dir_template;
        aux_path_ = (dir_ / "paper.aux").string();
        WriteFile("refs.bib", kReferences);
        WriteFile("paper.aux",
                  "\\relax\n"
                  "\\citation{Smith2001}\n"
                  "\\citation{Jones1999}\n"
                  "\\bibdata{refs}\n");
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    void WriteFile(const std::string& name, const std::string& content) {
        std::ofstream out(dir_ / name);
        out << content;
    }

    std::string ReadFile(const std::string& name) {
        std::ifstream in(dir_ / name);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    bool Exists(const std::string& name) {
        return std::filesystem::exists(dir_ / name);
    }

    void Configure(const std::string& yaml) {
        ASSERT_TRUE(config_.loadFromString(yaml, dir_.string()));
    }

    std::filesystem::path dir_;
    std::string aux_path_;
    Configuration config_;
};

TEST_F(PipelineTest, SecondRunIsUnchanged) {
    Configure("sort: true\nnormalize_doi: true\nnormalize_whitespace: true\nfix_page_double_hyphen: true\n");
    Sanitizer sanitizer(config_, nullptr, false);

    EXPECT_EQ(sanitizer.RunUnit(aux_path_), Verdict::CHANGED);
    const std::string first = ReadFile("references.bib");

    EXPECT_EQ(sanitizer.RunUnit(aux_path_), Verdict::UNCHANGED);
    EXPECT_EQ(ReadFile("references.bib"), first);

    BibDatabase db = ParseBib(first, "references.bib");
    ASSERT_EQ(db.entries.size(), 2u);
    EXPECT_EQ(db.entries[0].id(), "Jones1999");
    EXPECT_EQ(db.entries[0].GetOr("publisher", ""), "ACM Press");
    EXPECT_EQ(db.entries[0].GetOr("title", ""), "Earlier Book");
    EXPECT_EQ(db.entries[1].id(), "Smith2001");
    EXPECT_EQ(db.entries[1].GetOr("doi", ""), "10.1000/abc");
    EXPECT_EQ(db.entries[1].GetOr("pages", ""), "10--20");
    EXPECT_EQ(db.entries[1].GetOr("title", ""), "Later {Work}");
}

TEST_F(PipelineTest, MissingCitationIsBrokenAndNothingIsWritten) {
    WriteFile("paper.aux", "\\citation{Smith2001,Nowhere}\n\\bibdata{refs}\n");
    Sanitizer sanitizer(config_, nullptr, false);
    IssueReport report;
    EXPECT_EQ(sanitizer.ProcessAux(aux_path_, report), Verdict::BROKEN);
    EXPECT_EQ(report.Count(IssueKind::MISSING_CITATION), 1u);
    EXPECT_FALSE(Exists("references.bib"));
}

TEST_F(PipelineTest, AllViolationsAreReportedInOneRun) {
    WriteFile("paper.aux", "\\citation{Smith2001,smith2001,Nowhere}\n\\bibdata{refs}\n");
    WriteFile("refs.bib",
              "@article{Smith2001, doi = {bogus}}\n"
              "@article{smith2001, title = {Case}}\n");
    Configure("normalize_doi: true\n");
    Sanitizer sanitizer(config_, nullptr, false);
    IssueReport report;
    EXPECT_EQ(sanitizer.ProcessAux(aux_path_, report), Verdict::BROKEN);
    EXPECT_EQ(report.Count(IssueKind::MISSING_CITATION), 1u);
    EXPECT_EQ(report.Count(IssueKind::CASE_COLLISION), 1u);
    EXPECT_EQ(report.Count(IssueKind::INVALID_DOI), 1u);
    EXPECT_FALSE(Exists("references.bib"));
}

TEST_F(PipelineTest, CustomOutputName) {
    Configure("bibtex_out: clean.bib\n");
    Sanitizer sanitizer(config_, nullptr, false);
    EXPECT_EQ(sanitizer.OutputPathFor(aux_path_), (dir_ / "clean.bib").string());
    EXPECT_EQ(sanitizer.RunUnit(aux_path_), Verdict::CHANGED);
    EXPECT_TRUE(Exists("clean.bib"));
}

TEST_F(PipelineTest, NothingToDoIsUnchanged) {
    WriteFile("paper.aux", "\\relax\n\\bibdata{refs}\n");
    Sanitizer sanitizer(config_, nullptr, false);
    EXPECT_EQ(sanitizer.RunUnit(aux_path_), Verdict::UNCHANGED);

    WriteFile("paper.aux", "\\citation{Smith2001}\n");
    EXPECT_EQ(sanitizer.RunUnit(aux_path_), Verdict::UNCHANGED);
    EXPECT_FALSE(Exists("references.bib"));
}

TEST_F(PipelineTest, StructuralErrorsAreBroken) {
    Sanitizer sanitizer(config_, nullptr, false);
    EXPECT_EQ(sanitizer.RunUnit((dir_ / "paper.tex").string()), Verdict::BROKEN);
    EXPECT_EQ(sanitizer.RunUnit((dir_ / "missing.aux").string()), Verdict::BROKEN);

    WriteFile("paper.aux", "\\citation{Smith2001} trailing\n\\bibdata{refs}\n");
    EXPECT_EQ(sanitizer.RunUnit(aux_path_), Verdict::BROKEN);

    WriteFile("paper.aux", "\\citation{Smith2001}\n\\bibdata{absent}\n");
    EXPECT_EQ(sanitizer.RunUnit(aux_path_), Verdict::BROKEN);
    EXPECT_FALSE(Exists("references.bib"));
}

TEST_F(PipelineTest, NameNormalizationIsRejected) {
    Configure("normalize_names: true\n");
    Sanitizer sanitizer(config_, nullptr, false);
    IssueReport report;
    EXPECT_THROW(sanitizer.ProcessAux(aux_path_, report), UnsupportedFeatureError);
    EXPECT_EQ(sanitizer.RunUnit(aux_path_), Verdict::BROKEN);
}

TEST_F(PipelineTest, PolicyViolationsBreakTheBibliography) {
    Configure(
        "citation_policies:\n"
        "  article:\n"
        "    author: must\n"
        "    title: must\n"
        "    volume: must\n");
    Sanitizer sanitizer(config_, nullptr, false);
    IssueReport report;
    EXPECT_EQ(sanitizer.ProcessAux(aux_path_, report), Verdict::BROKEN);
    EXPECT_EQ(report.Count(IssueKind::MISSING_FIELD), 1u);
    EXPECT_EQ(report.Count(IssueKind::UNCONFIGURED_ENTRY_TYPE), 1u);
}

TEST_F(PipelineTest, MergesDuplicateIds) {
    WriteFile("extra.bib", "@article{Smith2001, volume = {7}}\n");
    WriteFile("paper.aux", "\\citation{Smith2001}\n\\bibdata{refs,extra}\n");
    Configure("duplicate_id: merge\n");
    Sanitizer sanitizer(config_, nullptr, false);
    EXPECT_EQ(sanitizer.RunUnit(aux_path_), Verdict::CHANGED);

    BibDatabase db = ParseBib(ReadFile("references.bib"), "references.bib");
    ASSERT_EQ(db.entries.size(), 1u);
    EXPECT_EQ(db.entries[0].GetOr("volume", ""), "7");
    EXPECT_EQ(db.entries[0].GetOr("year", ""), "2001");
}

TEST_F(PipelineTest, DuplicateIdFailPolicy) {
    WriteFile("extra.bib", "@article{Smith2001, volume = {7}}\n");
    WriteFile("paper.aux", "\\citation{Smith2001}\n\\bibdata{refs,extra}\n");
    Configure("duplicate_id: fail\n");
    Sanitizer sanitizer(config_, nullptr, false);
    IssueReport report;
    EXPECT_EQ(sanitizer.ProcessAux(aux_path_, report), Verdict::BROKEN);
    EXPECT_EQ(report.Count(IssueKind::DUPLICATE_ID), 1u);
}

TEST_F(PipelineTest, AbbreviatesJournalsThroughLookup) {
    Configure("abbreviate_journal: abbreviations.json\n");
    FakeAbbreviationLookup lookup;
    EXPECT_CALL(lookup, Lookup("Journal of the ACM"))
        .WillOnce(Return(std::optional<std::string>("J. ACM")));
    Sanitizer sanitizer(config_, &lookup, false);

    EXPECT_EQ(sanitizer.RunUnit(aux_path_), Verdict::CHANGED);
    EXPECT_TRUE(Exists("abbreviations.json"));
    BibDatabase db = ParseBib(ReadFile("references.bib"), "references.bib");
    ASSERT_EQ(db.entries.size(), 2u);
    EXPECT_EQ(db.entries[0].GetOr("journal", ""), "J. ACM");

    // Served from the cache file on the second run.
    EXPECT_EQ(sanitizer.RunUnit(aux_path_), Verdict::UNCHANGED);
}

TEST_F(PipelineTest, AbbreviationWithoutLookupIsAnError) {
    Configure("abbreviate_journal: abbreviations.json\n");
    Sanitizer sanitizer(config_, nullptr, false);
    EXPECT_EQ(sanitizer.RunUnit(aux_path_), Verdict::BROKEN);
}
