#include "abi/abi_encoder.hpp"
#include "common/errors.hpp"
#include "crypto/keccak.hpp"
#include <algorithm>

namespace {
  void append(Bytes& buf, const Bytes& more) {
    buf.insert(buf.end(), more.begin(), more.end());
  }

  Bytes pad32(const Bytes& in) {
    Bytes out(32, 0);
    std::copy(in.begin(), in.end(), out.begin() + static_cast<std::ptrdiff_t>(32 - in.size()));
    return out;
  }
}

namespace Abi {
  Bytes EncodeUint256(unsigned long long v) {
    Bytes out(32, 0);
    for (int i = 0; i < 8; ++i) out[31 - i] = static_cast<unsigned char>((v >> (i * 8)) & 0xFFULL);
    return out;
  }

  Bytes EncodeAddress(const std::string& addr) {
    return pad32(Hex::AddressToBytes(addr));
  }

  Bytes EncodeBool(bool v) { return EncodeUint256(v ? 1 : 0); }

  Bytes EncodeBytesTail(const Bytes& data) {
    Bytes out = EncodeUint256(static_cast<unsigned long long>(data.size()));
    Bytes padded = data;
    size_t pad = (32 - (padded.size() % 32)) % 32;
    padded.insert(padded.end(), pad, 0);
    append(out, padded);
    return out;
  }

  Bytes Selector(const std::string& signature) {
    auto hash = Crypto::Keccak256(reinterpret_cast<const unsigned char*>(signature.data()), signature.size());
    return Bytes(hash.begin(), hash.begin() + 4);
  }

  TupleEncoder& TupleEncoder::Static(const Bytes& word32) {
    if (word32.size() != 32) throw EncodingError("abi: static member must be one word");
    members_.push_back(Member{false, word32});
    return *this;
  }

  TupleEncoder& TupleEncoder::Dynamic(const Bytes& encoding) {
    members_.push_back(Member{true, encoding});
    return *this;
  }

  Bytes TupleEncoder::Finish() const {
    Bytes head;
    Bytes tail;
    unsigned long long head_size = 32ULL * members_.size();
    for (const auto& m : members_) {
      if (m.dynamic) {
        append(head, EncodeUint256(head_size + tail.size()));
        append(tail, m.data);
      } else {
        append(head, m.data);
      }
    }
    append(head, tail);
    return head;
  }

  Bytes EncodeArray(const std::vector<Bytes>& element_encodings, bool dynamic_elements) {
    TupleEncoder elements;
    for (const auto& e : element_encodings) {
      if (dynamic_elements) elements.Dynamic(e); else elements.Static(e);
    }
    Bytes out = EncodeUint256(static_cast<unsigned long long>(element_encodings.size()));
    append(out, elements.Finish());
    return out;
  }

  bool DecodeBool(const Bytes& data) {
    if (data.size() != 32) throw EncodingError("abi: bool must be exactly one word");
    if (!std::all_of(data.begin(), data.end() - 1, [](unsigned char c){ return c == 0; }) || data[31] > 1)
      throw EncodingError("abi: word is not a bool");
    return data[31] == 1;
  }

  unsigned long long DecodeUint64(const Bytes& word32) {
    if (word32.size() != 32) throw EncodingError("abi: uint256 must be exactly one word");
    if (!std::all_of(word32.begin(), word32.begin() + 24, [](unsigned char c){ return c == 0; }))
      throw EncodingError("abi: uint256 does not fit in 64 bits");
    unsigned long long v = 0;
    for (size_t i = 24; i < 32; ++i) v = (v << 8) | word32[i];
    return v;
  }

  Bytes Calldata(const Bytes& selector4, const Bytes& encoded_args) {
    Bytes out = selector4;
    append(out, encoded_args);
    return out;
  }
}
