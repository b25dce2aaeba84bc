#include "eip7702/set_code_transaction.hpp"
#include "crypto/keccak.hpp"
#include "common/errors.hpp"

namespace Eip7702 {
  static Bytes Typed(const RLP::Item& list) {
    Bytes out{kSetCodeTxType};
    Bytes body = RLP::Encode(list);
    out.insert(out.end(), body.begin(), body.end());
    return out;
  }

  void ValidateTransaction(const SetCodeTransaction& tx) {
    if (!Hex::IsAddress(tx.to)) throw ValidationError("set-code transaction requires a 20-byte `to`: " + tx.to);
    if (tx.authorization_list.empty()) throw ValidationError("authorization list must not be empty");
    if (tx.max_priority_fee_per_gas > tx.max_fee_per_gas)
      throw ValidationError("maxPriorityFeePerGas exceeds maxFeePerGas");
  }

  std::vector<RLP::Item> UnsignedFields(const SetCodeTransaction& tx) {
    ValidateTransaction(tx);
    std::vector<RLP::Item> auths;
    auths.reserve(tx.authorization_list.size());
    for (const auto& a : tx.authorization_list) auths.push_back(ToRlpItem(a));
    return {
      RLP::Item::Uint(tx.chain_id),
      RLP::Item::Uint(tx.nonce),
      RLP::Item::Uint(tx.max_priority_fee_per_gas),
      RLP::Item::Uint(tx.max_fee_per_gas),
      RLP::Item::Uint(tx.gas_limit),
      RLP::Item::Address(tx.to),
      RLP::Item::Uint(tx.value),
      RLP::Item::String(tx.data),
      RLP::Item::List({}),
      RLP::Item::List(auths)
    };
  }

  Bytes SigningHash(const SetCodeTransaction& tx) {
    return Crypto::Keccak256Hasher()
      .Update(kSetCodeTxType)
      .Update(RLP::Encode(RLP::Item::List(UnsignedFields(tx))))
      .Final();
  }

  Bytes EncodeSigned(const SetCodeTransaction& tx, const Crypto::Signature& sig) {
    auto fields = UnsignedFields(tx);
    fields.push_back(RLP::Item::Uint(sig.YParity()));
    fields.push_back(RLP::Item::UintBytes(sig.r));
    fields.push_back(RLP::Item::UintBytes(sig.s));
    return Typed(RLP::Item::List(fields));
  }

  Bytes TransactionHash(const Bytes& signed_envelope) { return Crypto::Keccak256(signed_envelope); }

  DecodedTransaction DecodeSigned(const Bytes& signed_envelope) {
    if (signed_envelope.empty() || signed_envelope[0] != kSetCodeTxType)
      throw EncodingError("not a type-4 transaction envelope");
    auto item = RLP::Decode(Bytes(signed_envelope.begin() + 1, signed_envelope.end()));
    if (!item.is_list || item.items.size() != 13) throw EncodingError("type-4 transaction must have 13 fields");
    const auto& f = item.items;
    DecodedTransaction out;
    out.tx.chain_id = RLP::DecodeUint(f[0]);
    out.tx.nonce = RLP::DecodeUint(f[1]);
    out.tx.max_priority_fee_per_gas = RLP::DecodeUint(f[2]);
    out.tx.max_fee_per_gas = RLP::DecodeUint(f[3]);
    out.tx.gas_limit = RLP::DecodeUint(f[4]);
    if (f[5].is_list || f[5].bytes.size() != 20) throw EncodingError("transaction `to` must be 20 bytes");
    out.tx.to = Hex::FromBytes(f[5].bytes);
    out.tx.value = RLP::DecodeUint(f[6]);
    if (f[7].is_list) throw EncodingError("transaction data must be a string");
    out.tx.data = f[7].bytes;
    if (!f[8].is_list) throw EncodingError("access list must be a list");
    if (!f[8].items.empty()) throw EncodingError("access list entries are not supported");
    if (!f[9].is_list) throw EncodingError("authorization list must be a list");
    for (const auto& a : f[9].items) out.tx.authorization_list.push_back(FromRlpItem(a));
    auto parity = RLP::DecodeUint(f[10]);
    if (parity > 1) throw EncodingError("transaction y_parity must be 0 or 1");
    if (f[11].is_list || f[12].is_list || f[11].bytes.size() > 32 || f[12].bytes.size() > 32)
      throw EncodingError("transaction r/s must be at most 32 bytes");
    out.signature = Crypto::Signature::FromParts(f[11].bytes, f[12].bytes, static_cast<unsigned char>(parity));
    return out;
  }
}
