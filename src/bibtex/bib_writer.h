#ifndef BIBSANE_SRC_BIBTEX_BIB_WRITER_H_
#define BIBSANE_SRC_BIBTEX_BIB_WRITER_H_

#include <string>

#include "../common/entry.h"

namespace BibSane {

/**
 * Serializes entries in the given order. The output only depends on the
 * entries: fields are written in byte order, one per line, with braced values.
 *
 *   @article{key,
 *    author = {...},
 *    year = {2001}
 *   }
 */
std::string WriteBib(const Entries& entries);

std::string WriteBibEntry(const Entry& entry);

} // namespace BibSane

#endif // BIBSANE_SRC_BIBTEX_BIB_WRITER_H_
