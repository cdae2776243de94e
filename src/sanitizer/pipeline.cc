#include "pipeline.h"

#include <filesystem>
#include <stdexcept>
#include <utility>

#include <glog/logging.h>

#include "absl/strings/match.h"
#include "absl/strings/str_join.h"

#include "../bibtex/aux_parser.h"
#include "collector.h"
#include "hygiene.h"
#include "journal_abbreviator.h"
#include "merger.h"
#include "normalizers.h"
#include "output_writer.h"
#include "policy_cleaner.h"
#include "sorter.h"

namespace fs = std::filesystem;

namespace BibSane {

namespace {

bool MergesDuplicates(DuplicatePolicy policy) {
    switch (policy) {
        case DuplicatePolicy::MERGE:
            return true;
        case DuplicatePolicy::FAIL:
        case DuplicatePolicy::IGNORE:
            return false;
    }
    return false;
}

} // namespace

Sanitizer::Sanitizer(const Configuration& config, IAbbreviationLookup* lookup, bool verbose)
    : config_(config),
      lookup_(lookup),
      verbose_(verbose) {}

SanitizeResult Sanitizer::Sanitize(const std::vector<BibDatabase>& sources,
                                   const CitationSet& citations,
                                   IssueReport& report) const {
    const BibSaneConfig& cfg = config_.config();
    SanitizeResult result;

    // Collect entries
    CollectOptions options;
    options.duplicate_id = cfg.duplicate_id;
    options.duplicate_doi = cfg.duplicate_doi;
    options.preambles_allowed = cfg.preambles_allowed.get();
    CollectResult collected = CollectEntries(sources, options, report);
    if (verbose_) LOG(INFO) << "Found " << collected.entries.size() << " BibTeX entries";
    result.verdict = collected.valid ? Verdict::CHANGED : Verdict::BROKEN;

    // Drop unused and check for missing
    if (verbose_) LOG(INFO) << "Checking unused and missing citations";
    ReconcileResult reconciled = ReconcileCitations(collected.entries, citations, cfg.drop_entry_types, report);
    if (!reconciled.complete) {
        result.verdict = Downgrade(result.verdict, Verdict::BROKEN);
    }
    Entries entries = std::move(reconciled.entries);
    if (verbose_) LOG(INFO) << "Found " << entries.size() << " used BibTeX entries";

    // Clean entries
    if (!cfg.citation_policies.empty()) {
        if (verbose_) LOG(INFO) << "Validating citation policies";
        CleanResult cleaned = CleanEntries(entries, cfg.citation_policies, report);
        if (!cleaned.valid) {
            result.verdict = Downgrade(result.verdict, Verdict::BROKEN);
        }
        entries = std::move(cleaned.entries);
    }

    // Clean up things that should never be there, not optional
    if (verbose_) LOG(INFO) << "Fixing bad practices";
    entries = StripBraces(entries);

    // Problems that cannot be fixed automatically, not optional
    if (verbose_) LOG(INFO) << "Checking for potential mistakes in BibTeX keys";
    if (DetectCaseCollisions(entries, report)) {
        result.verdict = Downgrade(result.verdict, Verdict::BROKEN);
    }

    if (cfg.normalize_doi.get()) {
        if (verbose_) LOG(INFO) << "Normalizing DOIs";
        NormalizeResult normalized = NormalizeDoi(entries, report);
        if (!normalized.valid) {
            result.verdict = Downgrade(result.verdict, Verdict::BROKEN);
        }
        entries = std::move(normalized.entries);
    }

    if (cfg.normalize_whitespace.get()) {
        if (verbose_) LOG(INFO) << "Normalizing whitespace";
        entries = NormalizeWhitespace(entries);
    }

    if (cfg.normalize_names.get()) {
        if (verbose_) LOG(INFO) << "Normalizing author and editor names";
        entries = NormalizeNames(entries);
    }

    if (cfg.fix_page_double_hyphen.get()) {
        if (verbose_) LOG(INFO) << "Fixing double hyphen in page ranges";
        entries = FixPageDoubleHyphen(entries);
    }

    auto cache_path = config_.getAbbreviationCachePath();
    if (cache_path.has_value()) {
        if (verbose_) LOG(INFO) << "Abbreviating journal names";
        if (lookup_ == nullptr) {
            throw std::logic_error("Journal abbreviation is configured but no lookup service was provided");
        }
        entries = AbbreviateJournals(entries, *cache_path, *lookup_, report);
    }

    if (MergesDuplicates(cfg.duplicate_id)) {
        if (verbose_) LOG(INFO) << "Merging references by BibTeX ID";
        MergeResult merged = MergeEntries(entries, kIdField, report);
        if (merged.conflict) {
            result.verdict = Downgrade(result.verdict, Verdict::BROKEN);
        }
        entries = std::move(merged.entries);
        if (verbose_) LOG(INFO) << "Reduced to " << entries.size() << " BibTeX entries by merging duplicate BibTeX IDs";
    }
    if (MergesDuplicates(cfg.duplicate_doi)) {
        if (verbose_) LOG(INFO) << "Merging references by DOI";
        MergeResult merged = MergeEntries(entries, "doi", report);
        if (merged.conflict) {
            result.verdict = Downgrade(result.verdict, Verdict::BROKEN);
        }
        entries = std::move(merged.entries);
        if (verbose_) LOG(INFO) << "Reduced to " << entries.size() << " BibTeX entries by merging duplicate DOIs";
    }

    if (cfg.sort.get()) {
        if (verbose_) LOG(INFO) << "Sorting by year and first author";
        entries = SortEntries(entries);
    }

    result.entries = std::move(entries);
    return result;
}

std::string Sanitizer::OutputPathFor(const std::string& aux_path) const {
    return (fs::path(aux_path).parent_path() / config_.config().bibtex_out.get()).string();
}

Verdict Sanitizer::ProcessAux(const std::string& aux_path, IssueReport& report) const {
    if (!absl::EndsWith(aux_path, ".aux")) {
        LOG(ERROR) << "Please, give an aux file as command-line argument, got: " << aux_path;
        return Verdict::BROKEN;
    }
    if (verbose_) LOG(INFO) << "Loading " << aux_path;
    AuxData aux = ParseAuxFile(aux_path);

    CitationSet citations = MakeCitationSet(aux.citations);
    if (verbose_) {
        LOG(INFO) << "Found " << aux.citations.size() << " citations";
        LOG(INFO) << "Found " << citations.size() << " unique citations";
    }
    if (citations.empty()) {
        if (verbose_) LOG(INFO) << "Ignoring aux file because there are no citations.";
        return Verdict::UNCHANGED;
    }
    if (aux.bib_files.empty()) {
        if (verbose_) LOG(INFO) << "Ignoring aux file because it does not refer to any BibTeX files.";
        return Verdict::UNCHANGED;
    }

    if (verbose_) LOG(INFO) << "Loading " << absl::StrJoin(aux.bib_files, " ");
    std::vector<BibDatabase> sources;
    sources.reserve(aux.bib_files.size());
    for (const auto& bib_file : aux.bib_files) {
        sources.push_back(ParseBibFile(bib_file));
    }

    SanitizeResult result = Sanitize(sources, citations, report);
    return WriteOutput(result.entries, OutputPathFor(aux_path), result.verdict, verbose_);
}

Verdict Sanitizer::RunUnit(const std::string& aux_path) const {
    IssueReport report;
    try {
        Verdict verdict = ProcessAux(aux_path, report);
        if (report.HasViolations()) {
            LOG(ERROR) << aux_path << ": " << report.ViolationCount() << " problem(s) found";
        }
        return verdict;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Failed to process " << aux_path << ": " << e.what();
        return Verdict::BROKEN;
    }
}

} // namespace BibSane
