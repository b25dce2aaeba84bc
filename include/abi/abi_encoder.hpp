#pragma once
#include <string>
#include <vector>
#include "utils/hex.hpp"

// Solidity ABI encoding for the static and dynamic types the executor uses.
namespace Abi {
  Bytes EncodeUint256(unsigned long long v);
  Bytes EncodeAddress(const std::string& addr);
  Bytes EncodeBool(bool v);
  // Tail of a `bytes` value: length word then data right padded to 32.
  Bytes EncodeBytesTail(const Bytes& data);
  // First 4 bytes of keccak256(signature), e.g. "transfer(address,uint256)".
  Bytes Selector(const std::string& signature);

  // Builds the head/tail layout of a tuple. Dynamic members get an offset word in
  // the head pointing at their encoding in the tail.
  class TupleEncoder {
  public:
    TupleEncoder& Static(const Bytes& word32);
    TupleEncoder& Dynamic(const Bytes& encoding);
    Bytes Finish() const;
  private:
    struct Member { bool dynamic; Bytes data; };
    std::vector<Member> members_;
  };

  // Dynamic array: length word followed by the elements laid out as a tuple.
  // `dynamic_elements` selects offset layout for element types such as tuples with bytes.
  Bytes EncodeArray(const std::vector<Bytes>& element_encodings, bool dynamic_elements);

  // abi.decode(data, (bool)). Throws EncodingError unless data is one word holding 0 or 1.
  bool DecodeBool(const Bytes& data);
  // abi.decode(data, (uint256)) truncated to 64 bits; throws EncodingError if it does not fit.
  unsigned long long DecodeUint64(const Bytes& word32);

  // selector || encoded arguments
  Bytes Calldata(const Bytes& selector4, const Bytes& encoded_args);
}
