#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "../bibtex/aux_parser.h"
#include "../common/configuration.h"
#include "../common/verdict.h"
#include "../journal/curl_abbreviation_lookup.h"
#include "../sanitizer/pipeline.h"

namespace {

void LogConfiguration(const BibSane::BibSaneConfig& cfg) {
    VLOG(1) << "Configuration root: " << cfg.root;
    VLOG(1) << "duplicate_id: " << BibSane::DuplicatePolicyName(cfg.duplicate_id)
            << ", duplicate_doi: " << BibSane::DuplicatePolicyName(cfg.duplicate_doi);
    for (const auto& [entry_type, fields] : cfg.citation_policies) {
        for (const auto& [field, policy] : fields) {
            VLOG(2) << "citation_policies." << entry_type << "." << field << ": "
                    << BibSane::FieldPolicyName(policy);
        }
    }
}

int Run(const cxxopts::Options& options, const cxxopts::ParseResult& result) {
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    FLAGS_v = result["log_level"].as<int>();
    const bool verbose = result.count("quiet") == 0;

    BibSane::Configuration configuration;
    if (result.count("config")) {
        const std::string config_file = result["config"].as<std::string>();
        if (!configuration.loadFromFile(config_file)) {
            LOG(ERROR) << "Invalid configuration file: " << config_file;
            return BibSane::ExitCode(BibSane::Verdict::BROKEN);
        }
    }

    LogConfiguration(configuration.config());

    std::vector<std::string> aux_files;
    if (result.count("aux")) {
        aux_files = result["aux"].as<std::vector<std::string>>();
    } else {
        aux_files = BibSane::FindAuxFiles(".");
        if (verbose) LOG(INFO) << "Found " << aux_files.size() << " aux file(s) with a matching tex file";
    }

    std::unique_ptr<BibSane::CurlAbbreviationLookup> lookup;
    if (configuration.getAbbreviationCachePath().has_value()) {
        const auto& abbreviation = configuration.config().abbreviation;
        lookup = std::make_unique<BibSane::CurlAbbreviationLookup>(abbreviation.service.get(),
                                                                   abbreviation.timeout_ms.get());
    }

    // Units are independent; the exit status is the worst verdict.
    BibSane::Sanitizer sanitizer(configuration, lookup.get(), verbose);
    BibSane::Verdict worst = BibSane::Verdict::UNCHANGED;
    for (const auto& aux_file : aux_files) {
        BibSane::Verdict verdict = sanitizer.RunUnit(aux_file);
        VLOG(1) << aux_file << ": " << verdict;
        worst = BibSane::Worst(worst, verdict);
    }
    return BibSane::ExitCode(worst);
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    // Setup command line options
    cxxopts::Options options("bibsane", "Sanitize BibTeX files without going insane");

    options.add_options()
        ("q,quiet", "Only report problems")
        ("c,config", "An optional configuration file", cxxopts::value<std::string>())
        ("l,log_level", "Verbose log level", cxxopts::value<int>()->default_value("0"))
        ("h,help", "Print usage")
        ("aux", "The LaTeX aux files of your documents", cxxopts::value<std::vector<std::string>>());
    options.parse_positional({"aux"});
    options.positional_help("[aux ...]");

    try {
        auto result = options.parse(argc, argv);
        return Run(options, result);
    } catch (const std::exception& e) {
        LOG(ERROR) << e.what();
        return BibSane::ExitCode(BibSane::Verdict::BROKEN);
    }
}
