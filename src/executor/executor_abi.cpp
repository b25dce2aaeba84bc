#include "executor/executor_abi.hpp"
#include "abi/abi_encoder.hpp"
#include "crypto/keccak.hpp"
#include "common/errors.hpp"

namespace ExecutorABI {
  const char* const kExecuteBatchSignature = "executeBatch((address,uint256,bytes)[],uint256,uint256,bytes)";
  const char* const kExecuteBatchUnsignedSignature = "executeBatch((address,uint256,bytes)[])";
  const char* const kSetAdminSignature = "setAdmin(address,uint256,uint256,bytes)";
  const char* const kUpdateCallersSignature = "updateCallers(address[],bool[],uint256,uint256,bytes)";
  const char* const kInitializeSignature = "initialize(address)";

  Bytes EncodeCalls(const Batch& calls) {
    std::vector<Bytes> elements;
    elements.reserve(calls.size());
    for (const auto& c : calls) {
      // tuple(address target, uint256 value, bytes data): head is three words, data offset = 0x60
      elements.push_back(Abi::TupleEncoder()
        .Static(Abi::EncodeAddress(c.target))
        .Static(Abi::EncodeUint256(c.value))
        .Dynamic(Abi::EncodeBytesTail(c.data))
        .Finish());
    }
    return Abi::EncodeArray(elements, true);
  }

  static Bytes EncodeAddresses(const std::vector<std::string>& addrs) {
    std::vector<Bytes> words;
    words.reserve(addrs.size());
    for (const auto& a : addrs) words.push_back(Abi::EncodeAddress(a));
    return Abi::EncodeArray(words, false);
  }

  static Bytes EncodeBools(const std::vector<bool>& flags) {
    std::vector<Bytes> words;
    words.reserve(flags.size());
    for (bool f : flags) words.push_back(Abi::EncodeBool(f));
    return Abi::EncodeArray(words, false);
  }

  Bytes BatchHash(const Batch& calls, unsigned long long nonce, unsigned long long deadline) {
    return Crypto::Keccak256(Abi::TupleEncoder()
      .Dynamic(EncodeCalls(calls))
      .Static(Abi::EncodeUint256(nonce))
      .Static(Abi::EncodeUint256(deadline))
      .Finish());
  }

  Bytes AdminChangeHash(const std::string& new_admin, unsigned long long nonce, unsigned long long deadline) {
    return Crypto::Keccak256(Abi::TupleEncoder()
      .Static(Abi::EncodeAddress(new_admin))
      .Static(Abi::EncodeUint256(nonce))
      .Static(Abi::EncodeUint256(deadline))
      .Finish());
  }

  Bytes CallerUpdateHash(const std::vector<std::string>& callers, const std::vector<bool>& is_adding,
                         unsigned long long nonce, unsigned long long deadline) {
    return Crypto::Keccak256(Abi::TupleEncoder()
      .Dynamic(EncodeAddresses(callers))
      .Dynamic(EncodeBools(is_adding))
      .Static(Abi::EncodeUint256(nonce))
      .Static(Abi::EncodeUint256(deadline))
      .Finish());
  }

  Bytes BuildExecuteBatchCalldata(const SignedBatch& batch) {
    Bytes args = Abi::TupleEncoder()
      .Dynamic(EncodeCalls(batch.calls))
      .Static(Abi::EncodeUint256(batch.nonce))
      .Static(Abi::EncodeUint256(batch.deadline))
      .Dynamic(Abi::EncodeBytesTail(batch.signature.ToBytes()))
      .Finish();
    return Abi::Calldata(Abi::Selector(kExecuteBatchSignature), args);
  }

  Bytes BuildExecuteBatchUnsignedCalldata(const Batch& calls) {
    Bytes args = Abi::TupleEncoder().Dynamic(EncodeCalls(calls)).Finish();
    return Abi::Calldata(Abi::Selector(kExecuteBatchUnsignedSignature), args);
  }

  Bytes BuildSetAdminCalldata(const AdminChange& change) {
    Bytes args = Abi::TupleEncoder()
      .Static(Abi::EncodeAddress(change.new_admin))
      .Static(Abi::EncodeUint256(change.nonce))
      .Static(Abi::EncodeUint256(change.deadline))
      .Dynamic(Abi::EncodeBytesTail(change.signature.ToBytes()))
      .Finish();
    return Abi::Calldata(Abi::Selector(kSetAdminSignature), args);
  }

  Bytes BuildUpdateCallersCalldata(const CallerUpdate& update) {
    if (update.callers.size() != update.is_adding.size())
      throw ValidationError("callers and isAdding must have the same length");
    Bytes args = Abi::TupleEncoder()
      .Dynamic(EncodeAddresses(update.callers))
      .Dynamic(EncodeBools(update.is_adding))
      .Static(Abi::EncodeUint256(update.nonce))
      .Static(Abi::EncodeUint256(update.deadline))
      .Dynamic(Abi::EncodeBytesTail(update.signature.ToBytes()))
      .Finish();
    return Abi::Calldata(Abi::Selector(kUpdateCallersSignature), args);
  }

  Bytes BuildInitializeCalldata(const std::string& admin) {
    return Abi::Calldata(Abi::Selector(kInitializeSignature), Abi::EncodeAddress(admin));
  }
}
