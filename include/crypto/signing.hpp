#pragma once
#include <string>
#include "crypto/secp256k1.hpp"

// The two signing schemes used by this project. They are not interchangeable:
// authorizations and transactions sign the raw digest, executor requests sign the
// digest wrapped in the Ethereum signed-message envelope.
namespace Signing {
  // keccak256("\x19Ethereum Signed Message:\n32" || digest32)
  Bytes PrefixedDigest(const Bytes& digest32);

  Crypto::Signature SignAuthorizationDigest(const Bytes& priv32, const Bytes& digest32);
  std::string RecoverAuthorizationSigner(const Bytes& digest32, const Crypto::Signature& sig);

  Crypto::Signature SignPrefixedDigest(const Bytes& priv32, const Bytes& digest32);
  std::string RecoverPrefixedDigestSigner(const Bytes& digest32, const Crypto::Signature& sig);
}
