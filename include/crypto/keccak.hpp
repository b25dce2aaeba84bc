#pragma once
#include <memory>
#include <string>
#include "utils/hex.hpp"

namespace Crypto {
  // Keccak-256 with the original Keccak padding (Ethereum), not FIPS-202 SHA3-256.
  Bytes Keccak256(const Bytes& data);
  Bytes Keccak256(const unsigned char* data, size_t len);
  // Returns 0x-prefixed hex keccak256 hash of the input interpreted as raw bytes
  std::string Keccak256Raw(const std::string& raw);
  // Returns 0x-prefixed hex keccak256 of hex-encoded input (0x-hex or hex)
  std::string Keccak256Hex(const std::string& hex_input);

  // Incremental form, for preimages assembled from a prefix and a body
  // (typed envelopes, signed-message digests) without concatenating them first.
  class Keccak256Hasher {
  public:
    Keccak256Hasher();
    ~Keccak256Hasher();
    Keccak256Hasher(const Keccak256Hasher&) = delete;
    Keccak256Hasher& operator=(const Keccak256Hasher&) = delete;
    Keccak256Hasher& Update(const unsigned char* data, size_t len);
    Keccak256Hasher& Update(const Bytes& data) { return Update(data.data(), data.size()); }
    Keccak256Hasher& Update(unsigned char byte) { return Update(&byte, 1); }
    // Returns the digest and resets the hasher for reuse.
    Bytes Final();
  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
  };
}
