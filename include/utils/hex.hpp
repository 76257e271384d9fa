#pragma once
#include <string>
#include <algorithm>
#include <cctype>

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

// Canonical form for ledger addresses: lower case, 0x prefixed.
inline std::string NormalizeAddress(const std::string& addr) {
  return "0x" + ToLowerHex(Strip0x(addr));
}

inline bool IsHexString(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isxdigit(c) != 0; });
}

inline bool IsAddress(const std::string& addr) {
  std::string body = Strip0x(addr);
  return body.size() == 40 && IsHexString(body);
}
