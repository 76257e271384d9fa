#include "crypto/keccak.hpp"
#include <string>
#include <cryptopp/keccak.h>

namespace Crypto {
  static std::string BytesToHex0x(const unsigned char* data, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string out; out.reserve(len * 2 + 2); out += "0x";
    for (size_t i = 0; i < len; ++i) { unsigned char b = data[i]; out += hex[b >> 4]; out += hex[b & 0xF]; }
    return out;
  }

  std::string Keccak256Raw(const std::string& raw) {
    CryptoPP::Keccak_256 hash;
    unsigned char digest[CryptoPP::Keccak_256::DIGESTSIZE];
    hash.CalculateDigest(digest, reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
    return BytesToHex0x(digest, sizeof(digest));
  }
}
