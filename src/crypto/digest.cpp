#include "crypto/digest.hpp"
#include <boost/log/trivial.hpp>
#include <openssl/evp.h>

namespace mvault::crypto {

// RAII wrapper for the OpenSSL message digest context
struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() : ctx(EVP_MD_CTX_new()) {
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

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

Sha256::Sha256() : context_(std::make_unique<DigestContext>()) {
  reset();
}

Sha256::~Sha256() = default;

//==============================================
// HASHING OPERATIONS
//==============================================

void Sha256::update(const void* data, size_t length) {
  if (length == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, length)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to update hash with " << length << " bytes";
    throw DigestError("Failed to update hash");
  }
}

std::string Sha256::hex_digest() {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to finalize hash";
    throw DigestError("Failed to finalize hash");
  }

  std::string result = to_hex(hash, hash_len);
  reset();
  return result;
}

void Sha256::reset() {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to initialize SHA-256 context";
    throw DigestError("Failed to initialize hash context");
  }
}

//==============================================
// UTILITY METHODS
//==============================================

std::string sha256_hex(const std::vector<uint8_t>& data) {
  Sha256 hasher;
  hasher.update(data);
  return hasher.hex_digest();
}

std::string sha256_hex(const std::string& data) {
  Sha256 hasher;
  hasher.update(data);
  return hasher.hex_digest();
}

std::string to_hex(const uint8_t* data, size_t length) {
  static const char hex[] = "0123456789abcdef";
  std::string result(length * 2, '0');
  for (size_t i = 0; i < length; ++i) {
    result[2 * i] = hex[data[i] >> 4];
    result[2 * i + 1] = hex[data[i] & 0x0f];
  }
  return result;
}

} // namespace mvault::crypto
