#include "tpack/wire.hpp"
#include "tpack/error.hpp"
#include "tpack/util.hpp"
#include <cstring>

namespace tpack {

static void write_u32_le(std::uint8_t out[4], std::uint32_t v) {
  out[0] = (v) & 0xFF;
  out[1] = (v >> 8) & 0xFF;
  out[2] = (v >> 16) & 0xFF;
  out[3] = (v >> 24) & 0xFF;
}
static std::uint32_t read_u32_le(const std::uint8_t in[4]) {
  return ((std::uint32_t)in[3] << 24) |
         ((std::uint32_t)in[2] << 16) |
         ((std::uint32_t)in[1] << 8)  |
         ((std::uint32_t)in[0]);
}

void put_u16_be(std::uint8_t* out, std::uint16_t v) {
  out[0] = (v >> 8) & 0xFF;
  out[1] = v & 0xFF;
}

void put_u32_be(std::uint8_t* out, std::uint32_t v) {
  put_u16_be(out, (std::uint16_t)(v >> 16));
  put_u16_be(out + 2, (std::uint16_t)(v & 0xFFFF));
}

std::uint16_t get_u16_be(const std::uint8_t* in) {
  return (std::uint16_t)((in[0] << 8) | in[1]);
}

std::uint32_t get_u32_be(const std::uint8_t* in) {
  return ((std::uint32_t)get_u16_be(in) << 16) | get_u16_be(in + 2);
}

Bytes encode_f32(const float* v, std::size_t n) {
  static_assert(sizeof(float) == 4, "float32 required");
  Bytes out(n * kElemSize);
  for (std::size_t i = 0; i < n; ++i) {
    std::uint32_t bits;
    std::memcpy(&bits, &v[i], 4);
    write_u32_le(&out[i * kElemSize], bits);
  }
  return out;
}

Bytes encode_i32(const std::int32_t* v, std::size_t n) {
  Bytes out(n * kElemSize);
  for (std::size_t i = 0; i < n; ++i) write_u32_le(&out[i * kElemSize], (std::uint32_t)v[i]);
  return out;
}

std::vector<float> decode_f32(const Bytes& in) {
  ensure<LengthMismatch>(in.size() % kElemSize == 0, "float32 buffer not a multiple of 4 bytes");
  std::vector<float> out(in.size() / kElemSize);
  for (std::size_t i = 0; i < out.size(); ++i) {
    const std::uint32_t bits = read_u32_le(&in[i * kElemSize]);
    std::memcpy(&out[i], &bits, 4);
  }
  return out;
}

std::vector<std::int32_t> decode_i32(const Bytes& in) {
  ensure<LengthMismatch>(in.size() % kElemSize == 0, "int32 buffer not a multiple of 4 bytes");
  std::vector<std::int32_t> out(in.size() / kElemSize);
  for (std::size_t i = 0; i < out.size(); ++i) out[i] = (std::int32_t)read_u32_le(&in[i * kElemSize]);
  return out;
}

} // namespace tpack
