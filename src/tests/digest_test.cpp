#include <gtest/gtest.h>
#include "crypto/digest.hpp"
#include <type_traits>

using namespace mvault::crypto;

TEST(DigestTest, KnownVectors) {
  EXPECT_EQ(sha256_hex(std::string()),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(sha256_hex(std::string("abc")),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, IncrementalMatchesOneShot) {
  const std::string message = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";

  Sha256 hasher;
  hasher.update(message.substr(0, 10));
  hasher.update(message.substr(10));
  EXPECT_EQ(hasher.hex_digest(), sha256_hex(message));
  EXPECT_EQ(sha256_hex(message), "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(DigestTest, ContextResetsAfterDigest) {
  Sha256 hasher;
  hasher.update(std::string("first"));
  hasher.hex_digest();

  hasher.update(std::string("abc"));
  EXPECT_EQ(hasher.hex_digest(), sha256_hex(std::string("abc")));
}

TEST(DigestTest, ByteVectorAndStringAgree) {
  const std::string text = "model weights";
  const std::vector<uint8_t> bytes(text.begin(), text.end());
  EXPECT_EQ(sha256_hex(bytes), sha256_hex(text));
  EXPECT_EQ(sha256_hex(bytes).size(), Sha256::DIGEST_SIZE * 2);
}

TEST(DigestTest, HexEncoding) {
  const uint8_t raw[] = {0x00, 0x0f, 0xa5, 0xff};
  EXPECT_EQ(to_hex(raw, sizeof(raw)), "000fa5ff");
  EXPECT_EQ(to_hex(raw, 0), "");
}

TEST(DigestTest, HashersOwnSeparateContexts) {
  static_assert(!std::is_copy_constructible_v<Sha256>, "hash context must not be shared by copies");
  static_assert(!std::is_copy_assignable_v<Sha256>, "hash context must not be shared by copies");

  Sha256 first;
  Sha256 second;
  first.update(std::string("abc"));
  second.update(std::string("xyz"));
  EXPECT_EQ(first.hex_digest(), sha256_hex(std::string("abc")));
  EXPECT_EQ(second.hex_digest(), sha256_hex(std::string("xyz")));
}
