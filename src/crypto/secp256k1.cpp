#include "crypto/secp256k1.hpp"
#include "crypto/keccak.hpp"
#include "common/errors.hpp"
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <algorithm>

namespace Crypto {
  // n / 2, the largest s accepted by Ethereum after Homestead
  static const unsigned char kHalfOrder[32] = {
    0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0x5d, 0x57, 0x6e, 0x73, 0x57, 0xa4, 0x50, 0x1d, 0xdf, 0xe9, 0x2f, 0x46, 0x68, 0x1b, 0x20, 0xa0
  };

  static secp256k1_context* GetCtx() {
    static secp256k1_context* ctx = []{
      return secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    }();
    return ctx;
  }

  static bool IsZero(const Bytes& b) {
    return std::all_of(b.begin(), b.end(), [](unsigned char c){ return c == 0; });
  }

  static Bytes LeftPad32(const Bytes& in) {
    Bytes out(32, 0);
    std::copy(in.begin(), in.end(), out.begin() + static_cast<std::ptrdiff_t>(32 - in.size()));
    return out;
  }

  Bytes Signature::ToBytes() const {
    Bytes out;
    out.reserve(65);
    out.insert(out.end(), r.begin(), r.end());
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(v);
    return out;
  }

  Signature Signature::FromBytes(const Bytes& sig65) {
    if (sig65.size() != 65) throw RecoveryError("signature must be 65 bytes, got " + std::to_string(sig65.size()));
    Signature sig;
    sig.r.assign(sig65.begin(), sig65.begin() + 32);
    sig.s.assign(sig65.begin() + 32, sig65.begin() + 64);
    unsigned char v = sig65[64];
    if (v == 0 || v == 1) v = static_cast<unsigned char>(v + 27);
    if (v != 27 && v != 28) throw RecoveryError("invalid signature v: " + std::to_string(sig65[64]));
    sig.v = v;
    return sig;
  }

  Signature Signature::FromParts(const Bytes& r, const Bytes& s, unsigned char y_parity) {
    if (r.size() > 32 || s.size() > 32) throw RecoveryError("signature component exceeds 32 bytes");
    if (y_parity > 1) throw RecoveryError("invalid y parity: " + std::to_string(y_parity));
    Signature sig;
    sig.r = LeftPad32(r);
    sig.s = LeftPad32(s);
    sig.v = static_cast<unsigned char>(27 + y_parity);
    return sig;
  }

  bool IsValidPrivateKey(const Bytes& priv32) {
    return priv32.size() == 32 && secp256k1_ec_seckey_verify(GetCtx(), priv32.data()) == 1;
  }

  Signature SignDigest(const Bytes& priv32, const Bytes& digest32) {
    if (digest32.size() != 32) throw std::invalid_argument("digest must be 32 bytes");
    if (!IsValidPrivateKey(priv32)) throw InvalidKeyError("private key is not a valid secp256k1 scalar");
    secp256k1_ecdsa_recoverable_signature sig_raw;
    // nullptr nonce function selects the library's RFC 6979 default
    if (!secp256k1_ecdsa_sign_recoverable(GetCtx(), &sig_raw, digest32.data(), priv32.data(), nullptr, nullptr))
      throw InvalidKeyError("secp256k1 signing failed");
    unsigned char out64[64]; int recid = 0;
    secp256k1_ecdsa_recoverable_signature_serialize_compact(GetCtx(), out64, &recid, &sig_raw);
    Signature sig; sig.r.assign(out64, out64 + 32); sig.s.assign(out64 + 32, out64 + 64); sig.v = static_cast<unsigned char>(27 + recid);
    return sig;
  }

  Bytes PublicKeyFromPrivate(const Bytes& priv32) {
    if (!IsValidPrivateKey(priv32)) throw InvalidKeyError("private key is not a valid secp256k1 scalar");
    secp256k1_pubkey pub;
    if (!secp256k1_ec_pubkey_create(GetCtx(), &pub, priv32.data()))
      throw InvalidKeyError("pubkey create failed");
    unsigned char out[65]; size_t outlen = sizeof(out);
    secp256k1_ec_pubkey_serialize(GetCtx(), out, &outlen, &pub, SECP256K1_EC_UNCOMPRESSED);
    return Bytes(out, out + outlen);
  }

  Bytes RecoverPublicKey(const Bytes& digest32, const Signature& sig) {
    if (digest32.size() != 32) throw RecoveryError("digest must be 32 bytes");
    if (sig.r.size() != 32 || sig.s.size() != 32) throw RecoveryError("r and s must be 32 bytes");
    if (sig.v != 27 && sig.v != 28 && sig.v != 0 && sig.v != 1)
      throw RecoveryError("invalid signature v: " + std::to_string(sig.v));
    if (IsZero(sig.r) || IsZero(sig.s)) throw RecoveryError("signature r or s is zero");
    if (std::lexicographical_compare(kHalfOrder, kHalfOrder + 32, sig.s.begin(), sig.s.end()))
      throw RecoveryError("signature s is not canonical (high-S)");

    unsigned char in64[64];
    std::copy(sig.r.begin(), sig.r.end(), in64);
    std::copy(sig.s.begin(), sig.s.end(), in64 + 32);
    secp256k1_ecdsa_recoverable_signature sig_raw;
    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(GetCtx(), &sig_raw, in64, sig.YParity()))
      throw RecoveryError("signature r or s out of range");
    secp256k1_pubkey pub;
    if (!secp256k1_ecdsa_recover(GetCtx(), &pub, &sig_raw, digest32.data()))
      throw RecoveryError("public key recovery failed");
    unsigned char out[65]; size_t outlen = sizeof(out);
    secp256k1_ec_pubkey_serialize(GetCtx(), out, &outlen, &pub, SECP256K1_EC_UNCOMPRESSED);
    return Bytes(out, out + outlen);
  }

  std::string AddressFromPublicKey(const Bytes& pub65) {
    if (pub65.size() != 65 || pub65[0] != 0x04) throw std::invalid_argument("expected uncompressed public key");
    auto hash = Keccak256(pub65.data() + 1, pub65.size() - 1);
    return Hex::FromBytes(hash.data() + 12, 20);
  }

  std::string RecoverAddress(const Bytes& digest32, const Signature& sig) {
    return AddressFromPublicKey(RecoverPublicKey(digest32, sig));
  }
}
