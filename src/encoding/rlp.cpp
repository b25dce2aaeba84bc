#include "encoding/rlp.hpp"
#include "common/errors.hpp"
#include <vector>
#include <string>

namespace {
  void append(Bytes& buf, const Bytes& more) {
    buf.insert(buf.end(), more.begin(), more.end());
  }

  Bytes encodeLength(size_t len, unsigned char offset) {
    if (len < 56) {
      return Bytes{ static_cast<unsigned char>(offset + len) };
    }
    Bytes lenBytes;
    size_t tmp = len;
    while (tmp) { lenBytes.insert(lenBytes.begin(), static_cast<unsigned char>(tmp & 0xFF)); tmp >>= 8; }
    Bytes out;
    out.push_back(static_cast<unsigned char>(offset + 55 + lenBytes.size()));
    append(out, lenBytes);
    return out;
  }

  struct Header { bool list; size_t header_len; size_t payload_len; };

  constexpr size_t kMaxDepth = 1024;

  Header readHeader(const Bytes& data, size_t pos) {
    if (pos >= data.size()) throw EncodingError("rlp: unexpected end of input");
    unsigned char b = data[pos];
    if (b < 0x80) return Header{false, 0, 1};
    bool list = b >= 0xC0;
    unsigned char base = list ? 0xC0 : 0x80;
    size_t code = static_cast<size_t>(b - base);
    if (code < 56) {
      if (!list && code == 1) {
        if (pos + 1 >= data.size()) throw EncodingError("rlp: unexpected end of input");
        if (data[pos + 1] < 0x80) throw EncodingError("rlp: non-canonical single byte");
      }
      return Header{list, 1, code};
    }
    size_t len_of_len = code - 55;
    if (len_of_len > sizeof(size_t)) throw EncodingError("rlp: length too large");
    if (pos + 1 + len_of_len > data.size()) throw EncodingError("rlp: unexpected end of input");
    if (data[pos + 1] == 0) throw EncodingError("rlp: length has leading zero");
    size_t len = 0;
    for (size_t i = 0; i < len_of_len; ++i) len = (len << 8) | data[pos + 1 + i];
    if (len < 56) throw EncodingError("rlp: non-canonical long length");
    return Header{list, 1 + len_of_len, len};
  }

  RLP::Item decodeAt(const Bytes& data, size_t& pos, size_t depth) {
    Header h = readHeader(data, pos);
    if (h.list && depth >= kMaxDepth) throw EncodingError("rlp: nesting too deep");
    size_t start = pos + h.header_len;
    if (h.payload_len > data.size() - start) throw EncodingError("rlp: payload exceeds input");
    size_t end = start + h.payload_len;
    RLP::Item item;
    item.is_list = h.list;
    if (!h.list) {
      item.bytes.assign(data.begin() + static_cast<std::ptrdiff_t>(start), data.begin() + static_cast<std::ptrdiff_t>(end));
    } else {
      size_t cur = start;
      while (cur < end) {
        item.items.push_back(decodeAt(data, cur, depth + 1));
        if (cur > end) throw EncodingError("rlp: list element overruns list payload");
      }
    }
    pos = end;
    return item;
  }
}

namespace RLP {
  Item Item::String(const Bytes& data) { Item i; i.bytes = data; return i; }

  Item Item::Uint(unsigned long long value) {
    Item i;
    while (value) { i.bytes.insert(i.bytes.begin(), static_cast<unsigned char>(value & 0xFF)); value >>= 8; }
    return i;
  }

  Item Item::UintBytes(const Bytes& big_endian) {
    size_t first = 0;
    while (first < big_endian.size() && big_endian[first] == 0) ++first;
    return String(Bytes(big_endian.begin() + static_cast<std::ptrdiff_t>(first), big_endian.end()));
  }

  Item Item::Address(const std::string& address) { return String(Hex::AddressToBytes(address)); }

  Item Item::List(const std::vector<Item>& items) { Item i; i.is_list = true; i.items = items; return i; }

  bool Item::operator==(const Item& other) const {
    return is_list == other.is_list && bytes == other.bytes && items == other.items;
  }

  Bytes EncodeBytes(const Bytes& data) {
    Bytes out;
    if (data.size() == 1 && data[0] < 0x80) {
      out.push_back(data[0]);
    } else {
      out = encodeLength(data.size(), 0x80);
      append(out, data);
    }
    return out;
  }

  Bytes EncodeString(const std::string& hex0x) {
    return EncodeBytes(Hex::ToBytes(hex0x));
  }

  Bytes EncodeUint(unsigned long long value) {
    return EncodeBytes(Item::Uint(value).bytes);
  }

  Bytes EncodeAddress(const std::string& address) {
    return EncodeBytes(Hex::AddressToBytes(address));
  }

  Bytes EncodeList(const std::vector<Bytes>& elements) {
    Bytes payload;
    for (const auto& e : elements) append(payload, e);
    Bytes out = encodeLength(payload.size(), 0xC0);
    append(out, payload);
    return out;
  }

  Bytes Encode(const Item& item) {
    if (!item.is_list) {
      if (!item.items.empty()) throw EncodingError("rlp: string item carries list elements");
      return EncodeBytes(item.bytes);
    }
    if (!item.bytes.empty()) throw EncodingError("rlp: list item carries string payload");
    std::vector<Bytes> encoded;
    encoded.reserve(item.items.size());
    for (const auto& child : item.items) encoded.push_back(Encode(child));
    return EncodeList(encoded);
  }

  Item Decode(const Bytes& data) {
    size_t pos = 0;
    Item item = decodeAt(data, pos, 0);
    if (pos != data.size()) throw EncodingError("rlp: trailing bytes after item");
    return item;
  }

  unsigned long long DecodeUint(const Item& item) {
    if (item.is_list) throw EncodingError("rlp: expected integer, found list");
    if (item.bytes.size() > 8) throw EncodingError("rlp: integer exceeds 64 bits");
    if (!item.bytes.empty() && item.bytes[0] == 0) throw EncodingError("rlp: integer has leading zero");
    unsigned long long v = 0;
    for (unsigned char b : item.bytes) v = (v << 8) | b;
    return v;
  }
}
