#pragma once
#include "tpack.hpp"
#include <string>
#include <cstddef>

namespace tpack {

void ensure(bool ok, const char* msg);

template <class E>
void ensure(bool ok, const char* msg) {
  if (!ok) throw E(msg);
}

template <class E>
void ensure(bool ok, const std::string& msg) {
  if (!ok) throw E(msg);
}

// Whole-string decimal integer within [lo, hi]; InvalidInput otherwise.
long parse_int(const std::string& s, long lo, long hi, const char* what);

Bytes sha256(const Bytes& data);

std::string to_hex(const Bytes& data);

} // namespace tpack
