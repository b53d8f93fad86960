#ifndef VAULT_STORAGE_SHA256_DIGEST_HPP
#define VAULT_STORAGE_SHA256_DIGEST_HPP

#include <cstddef>
#include <memory>
#include <string>

namespace vault {
namespace storage {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256 over a byte stream
class Sha256Digest {
public:
  static constexpr std::size_t DIGEST_SIZE = 32;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256Digest();
  ~Sha256Digest();

  Sha256Digest(const Sha256Digest&) = delete;
  Sha256Digest& operator=(const Sha256Digest&) = delete;


  // ---- DIGEST OPERATIONS ----
  // Feeds the next run of bytes into the running digest
  void update(const void* data, std::size_t size);
  // Finalizes the digest and returns it as lowercase hex. The digest cannot
  // be updated afterwards.
  std::string finalize_hex();

  // One-shot helper
  static std::string hex_of(const std::string& data);

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};

} // namespace storage
} // namespace vault

#endif // VAULT_STORAGE_SHA256_DIGEST_HPP
