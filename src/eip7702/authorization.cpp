#include "eip7702/authorization.hpp"
#include "crypto/keccak.hpp"
#include "crypto/signing.hpp"
#include "common/errors.hpp"
#include <sstream>

namespace Eip7702 {
  Bytes AuthorizationPreimage(unsigned long long chain_id, const std::string& delegate_address, unsigned long long nonce) {
    std::vector<Bytes> fields{
      RLP::EncodeUint(chain_id),
      RLP::EncodeAddress(delegate_address),
      RLP::EncodeUint(nonce)
    };
    Bytes out{kAuthorizationMagic};
    Bytes list = RLP::EncodeList(fields);
    out.insert(out.end(), list.begin(), list.end());
    return out;
  }

  Bytes AuthorizationHash(unsigned long long chain_id, const std::string& delegate_address, unsigned long long nonce) {
    return Crypto::Keccak256(AuthorizationPreimage(chain_id, delegate_address, nonce));
  }

  AuthorizationEntry AssembleAuthorization(unsigned long long chain_id,
                                           const std::string& delegate_address,
                                           unsigned long long nonce,
                                           const Crypto::Signature& signature) {
    if (!Hex::IsAddress(delegate_address))
      throw ValidationError("delegate address must be exactly 20 bytes: " + delegate_address);
    if (signature.r.size() != 32 || signature.s.size() != 32)
      throw ValidationError("signature r and s must be 32 bytes");
    if (signature.v != 27 && signature.v != 28 && signature.v != 0 && signature.v != 1)
      throw ValidationError("signature v must be 0, 1, 27 or 28");
    AuthorizationEntry e;
    e.chain_id = chain_id;
    e.address = Hex::NormalizeAddress(delegate_address);
    e.nonce = nonce;
    e.y_parity = signature.YParity();
    e.r = signature.r;
    e.s = signature.s;
    return e;
  }

  AuthorizationEntry SignAuthorization(const Bytes& authority_priv32,
                                       unsigned long long chain_id,
                                       const std::string& delegate_address,
                                       unsigned long long nonce) {
    auto digest = AuthorizationHash(chain_id, delegate_address, nonce);
    auto sig = Signing::SignAuthorizationDigest(authority_priv32, digest);
    return AssembleAuthorization(chain_id, delegate_address, nonce, sig);
  }

  std::string RecoverAuthority(const AuthorizationEntry& entry) {
    auto digest = AuthorizationHash(entry.chain_id, entry.address, entry.nonce);
    return Signing::RecoverAuthorizationSigner(digest, entry.GetSignature());
  }

  RLP::Item ToRlpItem(const AuthorizationEntry& entry) {
    return RLP::Item::List({
      RLP::Item::Uint(entry.chain_id),
      RLP::Item::Address(entry.address),
      RLP::Item::Uint(entry.nonce),
      RLP::Item::Uint(entry.y_parity),
      RLP::Item::UintBytes(entry.r),
      RLP::Item::UintBytes(entry.s)
    });
  }

  AuthorizationEntry FromRlpItem(const RLP::Item& item) {
    if (!item.is_list || item.items.size() != 6) throw EncodingError("authorization must be a 6-element list");
    const auto& f = item.items;
    if (f[1].is_list || f[1].bytes.size() != 20) throw EncodingError("authorization address must be 20 bytes");
    auto leftPad = [](const RLP::Item& it) {
      if (it.is_list || it.bytes.size() > 32) throw EncodingError("authorization r/s must be at most 32 bytes");
      if (!it.bytes.empty() && it.bytes[0] == 0) throw EncodingError("authorization r/s has leading zero");
      Bytes out(32 - it.bytes.size(), 0);
      out.insert(out.end(), it.bytes.begin(), it.bytes.end());
      return out;
    };
    AuthorizationEntry e;
    e.chain_id = RLP::DecodeUint(f[0]);
    e.address = Hex::FromBytes(f[1].bytes);
    e.nonce = RLP::DecodeUint(f[2]);
    auto parity = RLP::DecodeUint(f[3]);
    if (parity > 1) throw EncodingError("authorization y_parity must be 0 or 1");
    e.y_parity = static_cast<unsigned char>(parity);
    e.r = leftPad(f[4]);
    e.s = leftPad(f[5]);
    return e;
  }

  Bytes EncodeAuthorization(const AuthorizationEntry& entry) { return RLP::Encode(ToRlpItem(entry)); }

  AuthorizationEntry DecodeAuthorization(const Bytes& rlp) { return FromRlpItem(RLP::Decode(rlp)); }

  std::string Describe(const AuthorizationEntry& entry) {
    std::ostringstream oss;
    oss << "{chainId: " << entry.chain_id
        << ", address: " << entry.address
        << ", nonce: " << entry.nonce
        << ", yParity: " << static_cast<int>(entry.y_parity)
        << ", r: " << Hex::FromBytes(entry.r)
        << ", s: " << Hex::FromBytes(entry.s) << "}";
    return oss.str();
  }
}
