#include "tpack/framing.hpp"
#include "tpack/error.hpp"
#include "tpack/transport.hpp"
#include "tpack/util.hpp"
#include "tpack/wire.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace tpack {

static std::uint32_t recv_length(ITransport& t) {
  std::uint8_t prefix[kFramePrefixSize];
  t.recv_all(prefix, sizeof(prefix));
  const std::uint32_t len = get_u32_be(prefix);
  // Past this bound the stream cannot be trusted to realign.
  ensure<ChannelFailure>(len <= kMaxFrameSize, "incoming frame too large");
  return len;
}

static void discard(ITransport& t, std::size_t n) {
  std::array<std::uint8_t, 64 * 1024> scratch;
  while (n > 0) {
    const std::size_t step = std::min(n, scratch.size());
    t.recv_all(scratch.data(), step);
    n -= step;
  }
}

void send_frame(ITransport& t, const std::uint8_t* data, std::size_t n) {
  ensure<ChannelFailure>(n <= kMaxFrameSize, "frame too large");
  std::uint8_t prefix[kFramePrefixSize];
  put_u32_be(prefix, (std::uint32_t)n);
  t.send_all(prefix, sizeof(prefix));
  if (n) t.send_all(data, n);
}

void recv_frame_exact(ITransport& t, std::uint8_t* out, std::size_t n) {
  const std::uint32_t len = recv_length(t);
  if (len != n) {
    discard(t, len);
    throw ChannelFailure("frame of " + std::to_string(len) +
                         " bytes, expected " + std::to_string(n));
  }
  if (n) t.recv_all(out, n);
}

Bytes recv_frame(ITransport& t, std::size_t max_len) {
  const std::uint32_t len = recv_length(t);
  ensure<ChannelFailure>(len <= max_len, "frame of " + std::to_string(len) +
                                         " bytes exceeds " + std::to_string(max_len));
  Bytes msg(len);
  if (len) t.recv_all(msg.data(), len);
  return msg;
}

} // namespace tpack
