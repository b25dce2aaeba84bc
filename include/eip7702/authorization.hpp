#pragma once
#include <string>
#include <vector>
#include "crypto/secp256k1.hpp"
#include "encoding/rlp.hpp"

namespace Eip7702 {
  // Domain separator prepended (outside the RLP list) to authorization preimages.
  constexpr unsigned char kAuthorizationMagic = 0x05;

  // One element of a set-code transaction's authorization_list.
  // chain_id 0 means valid on any chain and is encoded as the empty string.
  struct AuthorizationEntry {
    unsigned long long chain_id = 0;
    std::string address;           // delegate, lowercase 0x hex; zero address revokes
    unsigned long long nonce = 0;
    unsigned char y_parity = 0;
    Bytes r;                       // 32 bytes
    Bytes s;                       // 32 bytes

    Crypto::Signature GetSignature() const { return Crypto::Signature::FromParts(r, s, y_parity); }
    bool operator==(const AuthorizationEntry& o) const {
      return chain_id == o.chain_id && address == o.address && nonce == o.nonce &&
             y_parity == o.y_parity && r == o.r && s == o.s;
    }
  };

  // 0x05 || rlp([chain_id, address, nonce])
  Bytes AuthorizationPreimage(unsigned long long chain_id, const std::string& delegate_address, unsigned long long nonce);
  // keccak256 of AuthorizationPreimage. The zero address is hashed like any other.
  Bytes AuthorizationHash(unsigned long long chain_id, const std::string& delegate_address, unsigned long long nonce);

  // Throws ValidationError if the address is not 20 bytes or the signature is malformed.
  AuthorizationEntry AssembleAuthorization(unsigned long long chain_id,
                                           const std::string& delegate_address,
                                           unsigned long long nonce,
                                           const Crypto::Signature& signature);

  // Signs AuthorizationHash with the authority's key (raw digest scheme) and assembles the entry.
  AuthorizationEntry SignAuthorization(const Bytes& authority_priv32,
                                       unsigned long long chain_id,
                                       const std::string& delegate_address,
                                       unsigned long long nonce);

  // Address of the EOA that signed the entry.
  std::string RecoverAuthority(const AuthorizationEntry& entry);

  // [chain_id, address, nonce, y_parity, r, s]
  RLP::Item ToRlpItem(const AuthorizationEntry& entry);
  AuthorizationEntry FromRlpItem(const RLP::Item& item);
  Bytes EncodeAuthorization(const AuthorizationEntry& entry);
  AuthorizationEntry DecodeAuthorization(const Bytes& rlp);

  // Human readable single line, for logs and CLI output. Never includes key material.
  std::string Describe(const AuthorizationEntry& entry);
}
