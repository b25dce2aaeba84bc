#pragma once
#include <string>
#include <vector>
#include "crypto/secp256k1.hpp"
#include "eip7702/authorization.hpp"
#include "eip7702/set_code_transaction.hpp"

// Holds one private key in memory and exposes the signing operations this
// project needs. The key is never logged or serialized.
class Signer {
public:
  // Throws InvalidKeyError for an empty, malformed or out-of-range key.
  explicit Signer(const std::string& private_key_hex);
  ~Signer();
  Signer(const Signer&) = delete;
  Signer& operator=(const Signer&) = delete;

  // EIP-7702 authorization over keccak256(0x05 || rlp([chain_id, delegate, nonce])).
  Eip7702::AuthorizationEntry SignAuthorization(unsigned long long chain_id,
                                                const std::string& delegate_address,
                                                unsigned long long nonce) const;
  // Returns the 0x-prefixed raw type-4 envelope ready for eth_sendRawTransaction.
  std::string SignSetCodeTransaction(const Eip7702::SetCodeTransaction& tx) const;
  // Executor requests: digest wrapped in the signed-message envelope.
  Crypto::Signature SignExecutorDigest(const Bytes& digest32) const;
  const std::string& Address() const { return address_; }
private:
  Bytes priv_;
  std::string address_;
};
