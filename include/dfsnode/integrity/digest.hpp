#ifndef DFSNODE_INTEGRITY_DIGEST_HPP
#define DFSNODE_INTEGRITY_DIGEST_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include "dfsnode/common/error.hpp"

namespace dfsnode::integrity {

// Block size used when streaming a file through the hash
constexpr std::size_t DIGEST_BLOCK_SIZE = 4096;

// Streams the file through MD5 and returns the lowercase hex digest.
// Throws IOFailure if the file cannot be read.
std::string digest(const std::filesystem::path& filepath);

// MD5 of an in-memory buffer, lowercase hex
std::string digest_bytes(const std::string& data);

// Returns true when the file's digest equals expected_hash (hex, any case).
// Throws IntegrityMismatch otherwise so the caller decides what to do with
// the file.
bool verify(const std::filesystem::path& filepath, const std::string& expected_hash);

} // namespace dfsnode::integrity

#endif // DFSNODE_INTEGRITY_DIGEST_HPP
