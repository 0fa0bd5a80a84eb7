#include "dfsnode/integrity/digest.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace dfsnode::integrity {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

namespace {

class DigestContext {
public:
  DigestContext() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
      throw NodeError(ErrorKind::IO_FAILURE, "Digest: Failed to create hash context");
    }
    if (!EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr)) {
      EVP_MD_CTX_free(ctx_);
      throw NodeError(ErrorKind::IO_FAILURE, "Digest: Failed to initialize hash context");
    }
  }

  ~DigestContext() {
    EVP_MD_CTX_free(ctx_);
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  void update(const void* data, std::size_t length) {
    if (!EVP_DigestUpdate(ctx_, data, length)) {
      throw NodeError(ErrorKind::IO_FAILURE, "Digest: Failed to update hash");
    }
  }

  // Finalizes the digest and converts the raw bytes to lowercase hex
  std::string hex_digest() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (!EVP_DigestFinal_ex(ctx_, hash, &hash_len)) {
      throw NodeError(ErrorKind::IO_FAILURE, "Digest: Failed to finalize hash");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; i++) {
      ss << std::hex << std::setw(2) << std::setfill('0')
         << static_cast<int>(hash[i]);
    }
    return ss.str();
  }

private:
  EVP_MD_CTX* ctx_;
};

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace


//==============================================
// DIGEST COMPUTATION
//==============================================

std::string digest(const std::filesystem::path& filepath) {
  std::ifstream file(filepath, std::ios::binary);
  if (!file) {
    throw IOFailure("cannot open " + filepath.string() + " for hashing");
  }

  DigestContext context;
  std::array<char, DIGEST_BLOCK_SIZE> block;

  // Read and update hash one block at a time
  while (file.read(block.data(), block.size()) || file.gcount() > 0) {
    context.update(block.data(), static_cast<std::size_t>(file.gcount()));
  }

  if (file.bad()) {
    throw IOFailure("error while reading " + filepath.string());
  }

  return context.hex_digest();
}

std::string digest_bytes(const std::string& data) {
  DigestContext context;
  context.update(data.data(), data.size());
  return context.hex_digest();
}


//==============================================
// VERIFICATION
//==============================================

bool verify(const std::filesystem::path& filepath, const std::string& expected_hash) {
  std::string actual_hash = digest(filepath);
  if (actual_hash != to_lower(expected_hash)) {
    throw IntegrityMismatch("expected " + expected_hash + ", got " + actual_hash +
                            " for " + filepath.filename().string());
  }
  return true;
}

} // namespace dfsnode::integrity
