#include "tpack/package.hpp"
#include "tpack/error.hpp"
#include "tpack/util.hpp"
#include "tpack/wire.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace tpack {

static void check_header_value(std::int64_t v, const char* field) {
  ensure<InvalidInput>(v >= -kMaxHeaderValue && v <= kMaxHeaderValue,
                       std::string(field) + " not representable in the header");
}

static std::int32_t decode_field(float v, const char* field) {
  ensure<MalformedHeader>(std::isfinite(v) && std::floor(v) == v,
                          std::string("header ") + field + " is not an integer");
  ensure<MalformedHeader>(v >= -(float)kMaxHeaderValue && v <= (float)kMaxHeaderValue,
                          std::string("header ") + field + " out of range");
  return (std::int32_t)v;
}

HeaderBuffer Header::to_buffer() const {
  HeaderBuffer b{};
  b[kHeaderSenderRankIdx] = (float)sender_rank;
  b[kHeaderReceiverRankIdx] = (float)receiver_rank;
  b[kHeaderBoundaryCountIdx] = (float)boundary_count;
  b[kHeaderMessageCodeIdx] = (float)message_code;
  return b;
}

Package::Package(int sender_rank, int message_code, int receiver_rank) {
  // A negative sender would turn the receiver's pinned reads into wildcards.
  ensure<InvalidInput>(sender_rank >= 0, "sender_rank must be non-negative");
  check_header_value(sender_rank, "sender_rank");
  check_header_value(message_code, "message_code");
  check_header_value(receiver_rank, "receiver_rank");
  header_.sender_rank = sender_rank;
  header_.receiver_rank = receiver_rank;
  header_.message_code = message_code;
}

Package Package::build(const TensorList& buffers, int sender_rank, int message_code) {
  Package p(sender_rank, message_code);
  p.append_tensor_list(buffers);
  return p;
}

Package Package::assemble(const Header& header,
                          std::vector<std::int32_t> boundaries,
                          Tensor payload) {
  ensure<LengthMismatch>(header.boundary_count >= 0 &&
                         (std::size_t)header.boundary_count == boundaries.size(),
                         "boundary table length disagrees with header");
  ensure<MalformedHeader>(header.sender_rank >= 0, "negative sender_rank");
  std::size_t total = 0;
  for (std::int32_t b : boundaries) {
    ensure<LengthMismatch>(b > 0, "non-positive boundary");
    total += (std::size_t)b;
  }
  ensure<LengthMismatch>(total == payload.size(), "boundary sum disagrees with payload length");

  Package p;
  p.header_ = header;
  p.boundaries_ = std::move(boundaries);
  p.payload_ = std::move(payload);
  return p;
}

Header Package::parse_header(const float* raw, std::size_t n) {
  ensure<MalformedHeader>(n == kHeaderSize,
                          "header must have " + std::to_string(kHeaderSize) +
                          " fields, got " + std::to_string(n));
  Header h;
  h.sender_rank = decode_field(raw[kHeaderSenderRankIdx], "sender_rank");
  h.receiver_rank = decode_field(raw[kHeaderReceiverRankIdx], "receiver_rank");
  h.boundary_count = decode_field(raw[kHeaderBoundaryCountIdx], "boundary_count");
  h.message_code = decode_field(raw[kHeaderMessageCodeIdx], "message_code");
  ensure<MalformedHeader>(h.sender_rank >= 0, "negative sender_rank");
  ensure<MalformedHeader>(h.boundary_count >= 0, "negative boundary_count");
  ensure<MalformedHeader>(h.boundary_count <= kMaxBoundaryCount, "boundary_count too large");
  return h;
}

Header Package::parse_header(const Tensor& raw) {
  return parse_header(raw.data(), raw.size());
}

TensorList Package::parse_content(const std::vector<std::int32_t>& boundaries,
                                  const Tensor& flat) {
  std::size_t total = 0;
  for (std::int32_t b : boundaries) {
    ensure<LengthMismatch>(b > 0, "non-positive boundary");
    total += (std::size_t)b;
  }
  ensure<LengthMismatch>(total == flat.size(),
                         "boundary sum " + std::to_string(total) +
                         " != payload length " + std::to_string(flat.size()));

  TensorList out;
  out.reserve(boundaries.size());
  auto it = flat.begin();
  for (std::int32_t b : boundaries) {
    out.emplace_back(it, it + b);
    it += b;
  }
  return out;
}

void Package::append_tensor(const Tensor& t) {
  ensure<InvalidInput>(!t.empty(), "sub-buffer must have positive length");
  ensure<InvalidInput>(header_.boundary_count < kMaxBoundaryCount, "too many sub-buffers");
  ensure<InvalidInput>(t.size() <= kMaxPayloadElems - payload_.size(), "payload too large");

  boundaries_.push_back((std::int32_t)t.size());
  payload_.insert(payload_.end(), t.begin(), t.end());
  header_.boundary_count = (std::int32_t)boundaries_.size();
}

void Package::append_tensor_list(const TensorList& ts) {
  for (const auto& t : ts) append_tensor(t);
}

void Package::set_receiver_rank(int rank) {
  check_header_value(rank, "receiver_rank");
  header_.receiver_rank = rank;
}

TensorList Package::content() const {
  return parse_content(boundaries_, payload_);
}

Bytes content_fingerprint(const TensorList& buffers) {
  std::vector<std::int32_t> boundaries;
  boundaries.reserve(buffers.size());
  Bytes data;
  for (const auto& t : buffers) boundaries.push_back((std::int32_t)t.size());
  data = encode_i32(boundaries.data(), boundaries.size());
  for (const auto& t : buffers) {
    Bytes enc = encode_f32(t.data(), t.size());
    data.insert(data.end(), enc.begin(), enc.end());
  }
  return sha256(data);
}

} // namespace tpack
