#pragma once
#include <string>
#include <vector>
#include "utils/hex.hpp"

namespace RLP {
  // A decoded or to-be-encoded RLP item: either a byte string or a list of items.
  struct Item {
    bool is_list = false;
    Bytes bytes;
    std::vector<Item> items;

    static Item String(const Bytes& data);
    static Item Uint(unsigned long long value);
    // Big-endian unsigned integer of any width (signature r/s); leading zero bytes are dropped.
    static Item UintBytes(const Bytes& big_endian);
    // Throws EncodingError unless `address` is exactly 20 bytes of hex.
    static Item Address(const std::string& address);
    static Item List(const std::vector<Item>& items);
    bool operator==(const Item& other) const;
    bool operator!=(const Item& other) const { return !(*this == other); }
  };

  Bytes EncodeBytes(const Bytes& data);
  // Hex input (0x-prefixed or bare) encoded as a byte string.
  Bytes EncodeString(const std::string& hex0x);
  Bytes EncodeUint(unsigned long long value);
  Bytes EncodeAddress(const std::string& address);
  // Wraps already-encoded elements in a list header.
  Bytes EncodeList(const std::vector<Bytes>& elements);
  Bytes Encode(const Item& item);

  // Decodes exactly one item spanning all of `data`. Throws EncodingError on
  // truncation, trailing bytes, non-canonical headers or lists nested deeper than 1024.
  Item Decode(const Bytes& data);
  // Interprets a string item as a canonical unsigned integer (no leading zeros, <= 8 bytes).
  unsigned long long DecodeUint(const Item& item);
}
