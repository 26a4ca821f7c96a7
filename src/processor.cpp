#include "tpack/processor.hpp"
#include "tpack/error.hpp"
#include "tpack/util.hpp"
#include "tpack/wire.hpp"

#include <utility>

namespace tpack {

static void send_header(IChannel& ch, const Header& h, int dst) {
  const HeaderBuffer hb = h.to_buffer();
  const Bytes wire = encode_f32(hb.data(), hb.size());
  ch.send(wire.data(), wire.size(), dst);
}

static void send_boundaries(IChannel& ch, const std::vector<std::int32_t>& boundaries, int dst) {
  const Bytes wire = encode_i32(boundaries.data(), boundaries.size());
  ch.send(wire.data(), wire.size(), dst);
}

static void send_content(IChannel& ch, const Tensor& payload, int dst) {
  const Bytes wire = encode_f32(payload.data(), payload.size());
  ch.send(wire.data(), wire.size(), dst);
}

static Header recv_header(IChannel& ch, int src) {
  Bytes wire(kHeaderSize * kElemSize);
  ch.recv(wire.data(), wire.size(), src);
  return Package::parse_header(decode_f32(wire));
}

static std::vector<std::int32_t> recv_boundaries(IChannel& ch, std::int32_t count, int src) {
  Bytes wire((std::size_t)count * kElemSize);
  ch.recv(wire.data(), wire.size(), src);
  return decode_i32(wire);
}

static Tensor recv_content(IChannel& ch, const std::vector<std::int32_t>& boundaries, int src) {
  // Sized from the boundary table, so validate it before allocating.
  std::size_t total = 0;
  for (std::int32_t b : boundaries) {
    ensure<LengthMismatch>(b > 0, "non-positive boundary");
    total += (std::size_t)b;
    ensure<LengthMismatch>(total <= kMaxPayloadElems, "payload too large");
  }
  Bytes wire(total * kElemSize);
  ch.recv(wire.data(), wire.size(), src);
  return decode_f32(wire);
}

void PackageProcessor::send_package(IChannel& ch, Package& package, int dst) {
  ensure<InvalidInput>(dst >= 0, "destination rank must be non-negative");
  package.set_receiver_rank(dst);

  send_header(ch, package.header(), dst);

  if (package.header().boundary_count > 0) {
    send_boundaries(ch, package.boundaries(), dst);
    send_content(ch, package.payload(), dst);
  }
}

Package PackageProcessor::recv_package_into(IChannel& ch, int src) {
  const Header h = recv_header(ch, src);
  if (h.boundary_count == 0) return Package::assemble(h, {}, {});

  // The rest of the package is pinned to the sender named in the header,
  // not to `src`, which may be the wildcard.
  std::vector<std::int32_t> boundaries = recv_boundaries(ch, h.boundary_count, h.sender_rank);
  Tensor payload = recv_content(ch, boundaries, h.sender_rank);
  return Package::assemble(h, std::move(boundaries), std::move(payload));
}

Received PackageProcessor::recv_package(IChannel& ch, int src) {
  const Package p = recv_package_into(ch, src);

  Received r;
  r.sender_rank = p.header().sender_rank;
  r.message_code = p.header().message_code;
  if (!p.header_only()) r.content = p.content();
  return r;
}

} // namespace tpack
