#include "crypto/keccak.hpp"
#include <cryptopp/keccak.h>

namespace Crypto {
  struct Keccak256Hasher::Impl {
    CryptoPP::Keccak_256 hash;
  };

  Keccak256Hasher::Keccak256Hasher() : impl_(new Impl()) {}
  Keccak256Hasher::~Keccak256Hasher() = default;

  Keccak256Hasher& Keccak256Hasher::Update(const unsigned char* data, size_t len) {
    impl_->hash.Update(data, len);
    return *this;
  }

  Bytes Keccak256Hasher::Final() {
    Bytes digest(CryptoPP::Keccak_256::DIGESTSIZE);
    impl_->hash.Final(digest.data());
    return digest;
  }

  Bytes Keccak256(const unsigned char* data, size_t len) {
    return Keccak256Hasher().Update(data, len).Final();
  }

  Bytes Keccak256(const Bytes& data) { return Keccak256(data.data(), data.size()); }

  std::string Keccak256Raw(const std::string& raw) {
    return Hex::FromBytes(Keccak256(reinterpret_cast<const unsigned char*>(raw.data()), raw.size()));
  }

  std::string Keccak256Hex(const std::string& hex_input) {
    return Hex::FromBytes(Keccak256(Hex::ToBytes(hex_input)));
  }
}
