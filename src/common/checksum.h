#ifndef BIBSANE_SRC_COMMON_CHECKSUM_H_
#define BIBSANE_SRC_COMMON_CHECKSUM_H_

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace BibSane {

using Sha256Digest = std::array<uint8_t, 32>;

// SHA-256 of an in-memory buffer.
Sha256Digest Sha256(std::string_view data);

// SHA-256 of a file's contents, nullopt when the file does not exist.
// Throws std::system_error when an existing file cannot be read.
std::optional<Sha256Digest> Sha256OfFile(const std::string& path);

std::string DigestToHex(const Sha256Digest& digest);

} // namespace BibSane

#endif // BIBSANE_SRC_COMMON_CHECKSUM_H_
