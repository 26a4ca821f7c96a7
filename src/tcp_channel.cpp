#include "tpack/tcp_channel.hpp"
#include "tpack/error.hpp"
#include "tpack/framing.hpp"
#include "tpack/util.hpp"
#include "tpack/wire.hpp"

#include <poll.h>
#include <cerrno>
#include <string>

namespace tpack {

// Hello frame: [u16_be version][u32_be rank]
static constexpr std::size_t kHelloSize = 6;

static Bytes make_hello(int rank) {
  Bytes out(kHelloSize);
  put_u16_be(&out[0], kVersion);
  put_u32_be(&out[2], (std::uint32_t)rank);
  return out;
}

static int parse_hello(const Bytes& in) {
  ensure<ChannelFailure>(in.size() == kHelloSize, "bad hello length");
  ensure<ChannelFailure>(get_u16_be(&in[0]) == kVersion, "peer protocol version mismatch");
  return (int)get_u32_be(&in[2]);
}

TcpChannel::TcpChannel(int rank) : rank_(rank) {
  ensure<InvalidInput>(rank >= 0, "rank must be non-negative");
}

TcpChannel::~TcpChannel() { close(); }

int TcpChannel::add_peer(std::unique_ptr<TcpTransport> t) {
  const Bytes hello = make_hello(rank_);
  send_frame(*t, hello.data(), hello.size());
  const int peer_rank = parse_hello(recv_frame(*t, kHelloSize));
  ensure<ChannelFailure>(peer_rank >= 0 && peer_rank != rank_,
                         "peer announced invalid rank " + std::to_string(peer_rank));
  ensure<ChannelFailure>(peers_.find(peer_rank) == peers_.end(),
                         "rank " + std::to_string(peer_rank) + " already connected");
  peers_[peer_rank] = std::move(t);
  return peer_rank;
}

int TcpChannel::connect(const std::string& host, std::uint16_t port) {
  auto t = std::make_unique<TcpTransport>();
  t->connect(host, port);
  return add_peer(std::move(t));
}

std::uint16_t TcpChannel::listen(const std::string& bind_host, std::uint16_t port) {
  return listener_.listen(bind_host, port);
}

int TcpChannel::accept_one() {
  return add_peer(listener_.accept());
}

std::vector<int> TcpChannel::accept(const std::string& bind_host, std::uint16_t port,
                                    std::size_t count) {
  listen(bind_host, port);
  std::vector<int> ranks;
  ranks.reserve(count);
  while (ranks.size() < count) ranks.push_back(accept_one());
  return ranks;
}

std::vector<int> TcpChannel::peers() const {
  std::vector<int> out;
  for (const auto& kv : peers_) out.push_back(kv.first);
  return out;
}

TcpTransport& TcpChannel::peer(int rank) {
  auto it = peers_.find(rank);
  ensure<ChannelFailure>(it != peers_.end(), "no connection to rank " + std::to_string(rank));
  return *it->second;
}

void TcpChannel::send(const std::uint8_t* data, std::size_t n, int dst) {
  send_frame(peer(dst), data, n);
}

int TcpChannel::wait_readable() {
  ensure<ChannelFailure>(!peers_.empty(), "recv with no connected peers");

  std::vector<struct pollfd> fds;
  std::vector<int> ranks;
  for (const auto& kv : peers_) {
    struct pollfd p{};
    p.fd = kv.second->native_handle();
    p.events = POLLIN;
    fds.push_back(p);
    ranks.push_back(kv.first);
  }

  for (;;) {
    int rc = ::poll(fds.data(), (nfds_t)fds.size(), -1);
    if (rc < 0 && errno == EINTR) continue;
    ensure<ChannelFailure>(rc > 0, "poll failed");
    // Hang-ups are reported here too; the following read raises EOF.
    for (std::size_t i = 0; i < fds.size(); ++i)
      if (fds[i].revents != 0) return ranks[i];
  }
}

int TcpChannel::recv(std::uint8_t* out, std::size_t n, int src) {
  const int from = (src == kAnySource) ? wait_readable() : src;
  recv_frame_exact(peer(from), out, n);
  return from;
}

void TcpChannel::close() noexcept {
  for (auto& kv : peers_) kv.second->close();
  peers_.clear();
  listener_.close();
}

} // namespace tpack
