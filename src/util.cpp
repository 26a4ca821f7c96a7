#include "tpack/util.hpp"
#include "tpack/error.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace tpack {

void ensure(bool ok, const char* msg) {
  if (!ok) throw std::runtime_error(msg);
}

long parse_int(const std::string& s, long lo, long hi, const char* what) {
  long v = 0;
  std::size_t used = 0;
  try {
    v = std::stol(s, &used, 10);
  } catch (const std::logic_error&) {
    throw InvalidInput(std::string(what) + " is not a number: '" + s + "'");
  }
  ensure<InvalidInput>(used == s.size(), std::string(what) + " has trailing characters: '" + s + "'");
  ensure<InvalidInput>(v >= lo && v <= hi,
                       std::string(what) + " must be in [" + std::to_string(lo) + ", " +
                       std::to_string(hi) + "], got " + s);
  return v;
}

Bytes sha256(const Bytes& data) {
  Bytes out(32);
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  ensure(ctx != nullptr, "EVP_MD_CTX_new failed");
  unsigned int len = 0;
  const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                  EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
                  EVP_DigestFinal_ex(ctx, out.data(), &len) == 1;
  EVP_MD_CTX_free(ctx);
  ensure(ok, "sha256 digest failed");
  ensure(len == 32, "sha256 length mismatch");
  return out;
}

std::string to_hex(const Bytes& data) {
  static const char kDigits[] = "0123456789abcdef";
  std::string s;
  s.reserve(data.size() * 2);
  for (std::uint8_t b : data) {
    s.push_back(kDigits[b >> 4]);
    s.push_back(kDigits[b & 0x0F]);
  }
  return s;
}

} // namespace tpack
