#pragma once
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>

using Bytes = std::vector<unsigned char>;

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

namespace Hex {
  // Parses 0x-prefixed or bare hex. Throws EncodingError on odd length or non-hex digits.
  Bytes ToBytes(const std::string& hex);
  std::string FromBytes(const Bytes& data);   // "0x..." lowercase
  std::string FromBytes(const unsigned char* data, size_t len);
  // Minimal big-endian quantity form used by JSON-RPC ("0x0", "0x1a").
  std::string FromUint(unsigned long long value);
  unsigned long long ToUint(const std::string& quantity);
  // 20-byte address; throws EncodingError unless exactly 40 hex digits.
  Bytes AddressToBytes(const std::string& address);
  // Canonical lowercase 0x form of an address.
  std::string NormalizeAddress(const std::string& address);
  bool IsAddress(const std::string& address);
  extern const char* const kZeroAddress;
}
