#pragma once
#include <string>
#include <vector>
#include "utils/hex.hpp"

namespace Crypto {
  // Recoverable ECDSA signature. v is 27 or 28; YParity() gives the 0/1 form.
  struct Signature {
    Bytes r;
    Bytes s;
    unsigned char v = 27;

    unsigned char YParity() const { return static_cast<unsigned char>(v >= 27 ? v - 27 : v); }
    // r || s || v, the 65-byte form passed to contracts as `bytes signature`
    Bytes ToBytes() const;
    // Accepts r || s || v with v in {0, 1, 27, 28}. Throws RecoveryError otherwise.
    static Signature FromBytes(const Bytes& sig65);
    static Signature FromParts(const Bytes& r, const Bytes& s, unsigned char y_parity);
  };

  // Signs a 32-byte digest with RFC 6979 nonces. Output is always low-S.
  // Throws InvalidKeyError if priv32 is not a valid secp256k1 scalar.
  Signature SignDigest(const Bytes& priv32, const Bytes& digest32);
  // Derive uncompressed public key (65 bytes, 0x04 || X(32) || Y(32)) from private key
  Bytes PublicKeyFromPrivate(const Bytes& priv32);
  // Recovers the uncompressed public key. Throws RecoveryError for high-S, zero or
  // out-of-range r/s, bad v, or when no point can be recovered.
  Bytes RecoverPublicKey(const Bytes& digest32, const Signature& sig);
  // keccak256(pub[1:])[12:] as lowercase 0x hex
  std::string AddressFromPublicKey(const Bytes& pub65);
  std::string RecoverAddress(const Bytes& digest32, const Signature& sig);
  bool IsValidPrivateKey(const Bytes& priv32);
}
