#include "utils/hex.hpp"
#include "common/errors.hpp"

namespace {
  int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + c - 'a';
    if (c >= 'A' && c <= 'F') return 10 + c - 'A';
    return -1;
  }
}

namespace Hex {
  const char* const kZeroAddress = "0x0000000000000000000000000000000000000000";

  Bytes ToBytes(const std::string& hex) {
    std::string s = Strip0x(hex);
    if (s.size() % 2 != 0) throw EncodingError("odd-length hex string");
    Bytes out; out.reserve(s.size() / 2);
    for (size_t i = 0; i < s.size(); i += 2) {
      int hi = nibble(s[i]), lo = nibble(s[i + 1]);
      if (hi < 0 || lo < 0) throw EncodingError("invalid hex digit in: " + hex);
      out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return out;
  }

  std::string FromBytes(const unsigned char* data, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string out; out.reserve(len * 2 + 2); out += "0x";
    for (size_t i = 0; i < len; ++i) { unsigned char b = data[i]; out += hex[b >> 4]; out += hex[b & 0xF]; }
    return out;
  }

  std::string FromBytes(const Bytes& data) { return FromBytes(data.data(), data.size()); }

  std::string FromUint(unsigned long long value) {
    static const char* hex = "0123456789abcdef";
    if (value == 0) return "0x0";
    std::string digits;
    while (value) { digits.insert(digits.begin(), hex[value & 0xF]); value >>= 4; }
    return "0x" + digits;
  }

  unsigned long long ToUint(const std::string& quantity) {
    std::string s = Strip0x(quantity);
    if (s.empty()) throw EncodingError("empty hex quantity");
    if (s.size() > 16) throw EncodingError("hex quantity exceeds 64 bits: " + quantity);
    unsigned long long v = 0;
    for (char c : s) {
      int n = nibble(c);
      if (n < 0) throw EncodingError("invalid hex quantity: " + quantity);
      v = (v << 4) | static_cast<unsigned long long>(n);
    }
    return v;
  }

  Bytes AddressToBytes(const std::string& address) {
    if (Strip0x(address).size() != 40) throw EncodingError("address must be 20 bytes: " + address);
    return ToBytes(address);
  }

  std::string NormalizeAddress(const std::string& address) {
    return FromBytes(AddressToBytes(address));
  }

  bool IsAddress(const std::string& address) {
    std::string s = Strip0x(address);
    if (s.size() != 40) return false;
    return std::all_of(s.begin(), s.end(), [](char c){ return nibble(c) >= 0; });
  }
}
