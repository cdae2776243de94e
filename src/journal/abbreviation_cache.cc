#include "abbreviation_cache.h"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>

#include <glog/logging.h>
#include <json/json.h>

namespace BibSane {

AbbreviationCache AbbreviationCache::Load(const std::string& path) {
    AbbreviationCache cache;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        VLOG(1) << "No abbreviation cache at " << path << ", starting empty";
        return cache;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::system_error(errno, std::generic_category(), "Failed to open abbreviation cache " + path);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw CacheFormatError("Malformed abbreviation cache " + path + ": " + errors);
    }
    if (!root.isObject()) {
        throw CacheFormatError("Abbreviation cache " + path + " must contain a JSON object");
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
        if (!it->isString()) {
            throw CacheFormatError("Abbreviation cache " + path + ": value for '" + it.name() +
                                   "' is not a string");
        }
        cache.entries_[it.name()] = it->asString();
    }
    VLOG(1) << "Loaded " << cache.size() << " journal abbreviations from " << path;
    return cache;
}

void AbbreviationCache::Save(const std::string& path) const {
    Json::Value root(Json::objectValue);
    for (const auto& [journal, abbreviation] : entries_) {
        root[journal] = abbreviation;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::system_error(errno, std::generic_category(), "Failed to write abbreviation cache " + path);
    }
    writer->write(root, &out);
    out << "\n";
    out.flush();
    if (!out) {
        throw std::system_error(errno, std::generic_category(), "Failed to write abbreviation cache " + path);
    }
}

std::optional<std::string> AbbreviationCache::Get(const std::string& journal) const {
    auto it = entries_.find(journal);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void AbbreviationCache::Put(const std::string& journal, const std::string& abbreviation) {
    entries_[journal] = abbreviation;
}

} // namespace BibSane
