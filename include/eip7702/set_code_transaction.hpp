#pragma once
#include <string>
#include <vector>
#include "eip7702/authorization.hpp"

namespace Eip7702 {
  constexpr unsigned char kSetCodeTxType = 0x04;

  struct SetCodeTransaction {
    unsigned long long chain_id = 0;
    unsigned long long nonce = 0;
    unsigned long long max_priority_fee_per_gas = 0; // wei
    unsigned long long max_fee_per_gas = 0; // wei
    unsigned long long gas_limit = 0;
    std::string to; // 0x..., set-code transactions cannot create contracts
    unsigned long long value = 0; // wei
    Bytes data;
    std::vector<AuthorizationEntry> authorization_list;
  };

  // Throws ValidationError for a missing/malformed `to` or an empty authorization list.
  void ValidateTransaction(const SetCodeTransaction& tx);
  // rlp([chainId, nonce, maxPriorityFeePerGas, maxFeePerGas, gasLimit, to, value, data, accessList, authorizationList])
  std::vector<RLP::Item> UnsignedFields(const SetCodeTransaction& tx);
  // keccak256(0x04 || rlp(UnsignedFields))
  Bytes SigningHash(const SetCodeTransaction& tx);
  // 0x04 || rlp(UnsignedFields ++ [yParity, r, s])
  Bytes EncodeSigned(const SetCodeTransaction& tx, const Crypto::Signature& sig);
  // keccak256 of the signed envelope; equals the hash the node returns on submission.
  Bytes TransactionHash(const Bytes& signed_envelope);

  struct DecodedTransaction {
    SetCodeTransaction tx;
    Crypto::Signature signature;
  };
  DecodedTransaction DecodeSigned(const Bytes& signed_envelope);
}
