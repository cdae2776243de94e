#ifndef BIBSANE_SRC_SANITIZER_OUTPUT_WRITER_H_
#define BIBSANE_SRC_SANITIZER_OUTPUT_WRITER_H_

#include <string>
#include <string_view>

#include "../common/entry.h"
#include "../common/verdict.h"

namespace BibSane {

/**
 * Final stage. A BROKEN verdict is returned as is and nothing is written.
 * Otherwise the entries are serialized; when the bytes match the existing
 * file (SHA-256) the verdict becomes UNCHANGED and the file is not touched,
 * else the file is replaced atomically and the verdict stays CHANGED.
 */
Verdict WriteOutput(const Entries& entries, const std::string& path, Verdict verdict, bool verbose);

// Writes `content` to a temporary file next to `path`, syncs it and renames
// it over `path`. Throws std::system_error on failure; `path` is then untouched.
void AtomicWriteFile(const std::string& path, std::string_view content);

} // namespace BibSane

#endif // BIBSANE_SRC_SANITIZER_OUTPUT_WRITER_H_
