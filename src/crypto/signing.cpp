#include "crypto/signing.hpp"
#include "crypto/keccak.hpp"
#include <stdexcept>

namespace Signing {
  static const char kMessagePrefix[] = "\x19" "Ethereum Signed Message:\n32";

  Bytes PrefixedDigest(const Bytes& digest32) {
    if (digest32.size() != 32) throw std::invalid_argument("digest must be 32 bytes");
    return Crypto::Keccak256Hasher()
      .Update(reinterpret_cast<const unsigned char*>(kMessagePrefix), sizeof(kMessagePrefix) - 1)
      .Update(digest32)
      .Final();
  }

  Crypto::Signature SignAuthorizationDigest(const Bytes& priv32, const Bytes& digest32) {
    return Crypto::SignDigest(priv32, digest32);
  }

  std::string RecoverAuthorizationSigner(const Bytes& digest32, const Crypto::Signature& sig) {
    return Crypto::RecoverAddress(digest32, sig);
  }

  Crypto::Signature SignPrefixedDigest(const Bytes& priv32, const Bytes& digest32) {
    return Crypto::SignDigest(priv32, PrefixedDigest(digest32));
  }

  std::string RecoverPrefixedDigestSigner(const Bytes& digest32, const Crypto::Signature& sig) {
    return Crypto::RecoverAddress(PrefixedDigest(digest32), sig);
  }
}
