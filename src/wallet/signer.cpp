#include "wallet/signer.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/signing.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>
#include <string>

Signer::Signer(const std::string& private_key_hex) {
  if (private_key_hex.empty()) throw InvalidKeyError("empty private key");
  try {
    priv_ = Hex::ToBytes(private_key_hex);
  } catch (const EncodingError&) {
    throw InvalidKeyError("private key is not valid hex");
  }
  if (priv_.size() != 32) throw InvalidKeyError("invalid private key length");
  address_ = Crypto::AddressFromPublicKey(Crypto::PublicKeyFromPrivate(priv_));
}

Signer::~Signer() { std::fill(priv_.begin(), priv_.end(), 0); }

Eip7702::AuthorizationEntry Signer::SignAuthorization(unsigned long long chain_id,
                                                      const std::string& delegate_address,
                                                      unsigned long long nonce) const {
  auto entry = Eip7702::SignAuthorization(priv_, chain_id, delegate_address, nonce);
  Logger::Debug("signed authorization " + Eip7702::Describe(entry) + " by " + address_);
  return entry;
}

std::string Signer::SignSetCodeTransaction(const Eip7702::SetCodeTransaction& tx) const {
  auto digest = Eip7702::SigningHash(tx);
  auto sig = Crypto::SignDigest(priv_, digest);
  return Hex::FromBytes(Eip7702::EncodeSigned(tx, sig));
}

Crypto::Signature Signer::SignExecutorDigest(const Bytes& digest32) const {
  return Signing::SignPrefixedDigest(priv_, digest32);
}
