#include "storage/sha256_digest.hpp"
#include "storage/storage_error.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace vault {
namespace storage {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw StorageError("SHA-256: Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256Digest::Sha256Digest()
  : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw StorageError("SHA-256: Failed to initialize digest context");
  }
}

Sha256Digest::~Sha256Digest() = default;


//==============================================
// DIGEST OPERATIONS
//==============================================

void Sha256Digest::update(const void* data, std::size_t size) {
  if (finalized_) {
    throw StorageError("SHA-256: Digest already finalized");
  }
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw StorageError("SHA-256: Failed to update digest");
  }
}

std::string Sha256Digest::finalize_hex() {
  if (finalized_) {
    throw StorageError("SHA-256: Digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw StorageError("SHA-256: Failed to finalize digest");
  }
  finalized_ = true;

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string Sha256Digest::hex_of(const std::string& data) {
  Sha256Digest digest;
  digest.update(data.data(), data.size());
  return digest.finalize_hex();
}

} // namespace storage
} // namespace vault
