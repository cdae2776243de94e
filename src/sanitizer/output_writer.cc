#include "output_writer.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <glog/logging.h>

#include "../bibtex/bib_writer.h"
#include "../common/checksum.h"
#include "../common/scoped_fd.h"

namespace fs = std::filesystem;

namespace BibSane {

void AtomicWriteFile(const std::string& path, std::string_view content) {
    fs::path target(path);
    fs::path dir = target.parent_path();
    std::string tmpl = ((dir.empty() ? fs::path(".") : dir) / ("." + target.filename().string() + ".XXXXXX")).string();
    std::vector<char> tmp_name(tmpl.begin(), tmpl.end());
    tmp_name.push_back('\0');

    ScopedFd fd(::mkstemp(tmp_name.data()));
    if (fd.get() < 0) {
        throw std::system_error(errno, std::generic_category(), "Failed to create temporary file for " + path);
    }
    const std::string tmp_path(tmp_name.data());
    ScopedUnlink cleanup(tmp_path);

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd.get(), content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "write failed for " + tmp_path);
        }
        written += static_cast<size_t>(n);
    }
    // mkstemp creates 0600; output files are ordinary documents.
    if (::fchmod(fd.get(), 0644) != 0) {
        LOG(WARNING) << "Failed to set permissions on " << tmp_path << ": " << std::strerror(errno);
    }
    if (::fsync(fd.get()) != 0) {
        throw std::system_error(errno, std::generic_category(), "fsync failed for " + tmp_path);
    }
    if (fd.Close() != 0) {
        throw std::system_error(errno, std::generic_category(), "close failed for " + tmp_path);
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        throw std::system_error(errno, std::generic_category(), "Failed to move " + tmp_path + " to " + path);
    }
    cleanup.Release();
}

Verdict WriteOutput(const Entries& entries, const std::string& path, Verdict verdict, bool verbose) {
    if (verdict == Verdict::BROKEN) {
        LOG(ERROR) << "Broken bibliography. Not writing: " << path;
        return verdict;
    }

    const std::string content = WriteBib(entries);
    const Sha256Digest new_hash = Sha256(content);
    auto old_hash = Sha256OfFile(path);
    VLOG(1) << "SHA-256 of " << path << ": "
            << (old_hash.has_value() ? DigestToHex(*old_hash) : std::string("(none)"))
            << " -> " << DigestToHex(new_hash);
    if (old_hash.has_value() && *old_hash == new_hash) {
        if (verbose) {
            LOG(INFO) << "No changes to " << path;
        }
        return Verdict::UNCHANGED;
    }

    AtomicWriteFile(path, content);
    LOG(INFO) << "Please check the new or corrected file: " << path;
    return Verdict::CHANGED;
}

} // namespace BibSane
