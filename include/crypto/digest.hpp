#ifndef MVAULT_CRYPTO_DIGEST_HPP
#define MVAULT_CRYPTO_DIGEST_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace mvault::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256 over arbitrary byte ranges. Output is lowercase hex.
class Sha256 {
public:
  static constexpr size_t DIGEST_SIZE = 32;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;


  // ---- HASHING OPERATIONS ----
  void update(const void* data, size_t length);
  void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }
  void update(const std::string& data) { update(data.data(), data.size()); }
  // Finishes the digest and resets the context for reuse
  std::string hex_digest();

private:
  std::unique_ptr<DigestContext> context_;

  void reset();
};

// One-shot helpers
std::string sha256_hex(const std::vector<uint8_t>& data);
std::string sha256_hex(const std::string& data);

// Lowercase hex encoding of raw bytes
std::string to_hex(const uint8_t* data, size_t length);

} // namespace mvault::crypto

#endif // MVAULT_CRYPTO_DIGEST_HPP
