#include "protocols/erc20.hpp"
#include "abi/abi_encoder.hpp"
#include <algorithm>

static const unsigned char kTransferSelector[4] = {0xa9, 0x05, 0x9c, 0xbb};
static const unsigned char kBalanceOfSelector[4] = {0x70, 0xa0, 0x82, 0x31};

static bool HasSelector(const Bytes& data, const unsigned char* sel) {
  return data.size() >= 4 && std::equal(sel, sel + 4, data.begin());
}

// Address words must have 12 zero bytes of padding.
static std::optional<std::string> AddressWord(const Bytes& data, size_t offset) {
  if (!std::all_of(data.begin() + static_cast<std::ptrdiff_t>(offset),
                   data.begin() + static_cast<std::ptrdiff_t>(offset + 12),
                   [](unsigned char c){ return c == 0; })) return std::nullopt;
  return Hex::FromBytes(data.data() + offset + 12, 20);
}

namespace ERC20 {
  Bytes TransferCalldata(const std::string& to, unsigned long long amount) {
    Bytes args = Abi::TupleEncoder().Static(Abi::EncodeAddress(to)).Static(Abi::EncodeUint256(amount)).Finish();
    return Abi::Calldata(Bytes(kTransferSelector, kTransferSelector + 4), args);
  }

  Bytes BalanceOfCalldata(const std::string& owner) {
    return Abi::Calldata(Bytes(kBalanceOfSelector, kBalanceOfSelector + 4), Abi::EncodeAddress(owner));
  }

  std::optional<Transfer> DecodeTransfer(const Bytes& data) {
    if (!HasSelector(data, kTransferSelector) || data.size() != 4 + 64) return std::nullopt;
    auto to = AddressWord(data, 4);
    if (!to) return std::nullopt;
    Bytes amount_word(data.begin() + 36, data.end());
    // amounts above 64 bits are outside what this toolkit models
    if (!std::all_of(amount_word.begin(), amount_word.begin() + 24, [](unsigned char c){ return c == 0; }))
      return std::nullopt;
    Transfer t;
    t.to = *to;
    t.amount = Abi::DecodeUint64(amount_word);
    return t;
  }

  std::optional<std::string> DecodeBalanceOf(const Bytes& data) {
    if (!HasSelector(data, kBalanceOfSelector) || data.size() != 4 + 32) return std::nullopt;
    return AddressWord(data, 4);
  }
}
