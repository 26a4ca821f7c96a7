#pragma once
#include "tpack.hpp"
#include <cstddef>
#include <cstdint>

namespace tpack {

// All numeric arrays travel as 4-byte little-endian elements.
static constexpr std::size_t kElemSize = 4;

// Big-endian integers for connection-level framing
void put_u16_be(std::uint8_t* out, std::uint16_t v);
void put_u32_be(std::uint8_t* out, std::uint32_t v);
std::uint16_t get_u16_be(const std::uint8_t* in);
std::uint32_t get_u32_be(const std::uint8_t* in);

Bytes encode_f32(const float* v, std::size_t n);
Bytes encode_i32(const std::int32_t* v, std::size_t n);

// Throws LengthMismatch if in.size() is not a multiple of kElemSize.
std::vector<float> decode_f32(const Bytes& in);
std::vector<std::int32_t> decode_i32(const Bytes& in);

} // namespace tpack
