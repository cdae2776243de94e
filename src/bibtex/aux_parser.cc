#include "aux_parser.h"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <system_error>

#include <glog/logging.h>

#include "absl/strings/str_split.h"
#include "absl/strings/match.h"

namespace fs = std::filesystem;

namespace BibSane {

namespace {

// Appends the comma separated payload of `\prefix{...}` to `words`.
// Returns false when the line is not a `\prefix{` line at all.
bool ParseAuxLine(std::string_view prefix, std::string_view line, std::vector<std::string>& words,
                  const std::string& source_name, size_t line_no) {
    const std::string opener = "\\" + std::string(prefix) + "{";
    if (!absl::StartsWith(line, opener)) {
        return false;
    }
    if (line.empty() || line.back() != '}' ||
        std::count(line.begin(), line.end(), '{') != 1 ||
        std::count(line.begin(), line.end(), '}') != 1) {
        throw AuxParseError(source_name + ":" + std::to_string(line_no) +
                            ": malformed \\" + std::string(prefix) + " line: " + std::string(line));
    }
    std::string_view payload = line.substr(opener.size(), line.size() - opener.size() - 1);
    for (std::string_view word : absl::StrSplit(payload, ',')) {
        words.emplace_back(word);
    }
    return true;
}

} // namespace

AuxData ParseAux(std::istream& in, const std::string& aux_dir, const std::string& source_name) {
    AuxData data;
    std::vector<std::string> bibdata;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::string_view view(line);
        if (!view.empty() && view.back() == '\r') {
            view.remove_suffix(1);
        }
        if (ParseAuxLine("citation", view, data.citations, source_name, line_no)) {
            continue;
        }
        ParseAuxLine("bibdata", view, bibdata, source_name, line_no);
    }

    for (std::string& bib : bibdata) {
        if (!absl::EndsWith(bib, ".bib")) {
            bib += ".bib";
        }
        data.bib_files.push_back((fs::path(aux_dir) / bib).string());
    }
    return data;
}

AuxData ParseAuxFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::system_error(errno, std::generic_category(), "Failed to open aux file " + path);
    }
    return ParseAux(in, fs::path(path).parent_path().string(), path);
}

std::vector<std::string> FindAuxFiles(const std::string& root) {
    std::vector<std::string> found;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            LOG(WARNING) << "Skipping unreadable directory entry: " << ec.message();
            ec.clear();
            continue;
        }
        const fs::path& path = it->path();
        std::error_code status_ec;
        if (absl::StartsWith(path.filename().string(), ".")) {
            if (it->is_directory(status_ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(status_ec) || path.extension() != ".aux") {
            continue;
        }
        fs::path tex = path;
        tex.replace_extension(".tex");
        if (fs::is_regular_file(tex, status_ec)) {
            found.push_back(path.lexically_normal().string());
        }
    }
    if (ec) {
        LOG(WARNING) << "Cannot search " << root << " for aux files: " << ec.message();
    }
    std::sort(found.begin(), found.end());
    return found;
}

} // namespace BibSane
