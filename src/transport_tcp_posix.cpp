#include "tpack/transport.hpp"
#include "tpack/error.hpp"
#include "tpack/util.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace tpack {

TcpTransport::TcpTransport() = default;
TcpTransport::TcpTransport(int fd) : fd_(fd) {}
TcpTransport::~TcpTransport() { close(); }

static constexpr int kListenBacklog = 64;

using AddrList = std::unique_ptr<struct addrinfo, decltype(&::freeaddrinfo)>;

static std::string sys_error(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

static void set_nodelay(int fd) {
  int yes = 1;
  ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
}

// Empty host with `passive` resolves the wildcard address.
static AddrList resolve(const std::string& host, std::uint16_t port, bool passive) {
  struct addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  if (passive) hints.ai_flags = AI_PASSIVE;

  const std::string service = std::to_string(port);
  const char* node = (passive && host.empty()) ? nullptr : host.c_str();
  struct addrinfo* res = nullptr;
  const int rc = ::getaddrinfo(node, service.c_str(), &hints, &res);
  ensure<ChannelFailure>(rc == 0 && res != nullptr,
                         "cannot resolve " + host + ":" + service + ": " + ::gai_strerror(rc));
  return AddrList(res, &::freeaddrinfo);
}

// Tries each resolved address in turn; `setup` returns false to move on.
template <typename Setup>
static int open_first(const AddrList& addrs, Setup setup) {
  for (const struct addrinfo* ai = addrs.get(); ai != nullptr; ai = ai->ai_next) {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) continue;
    if (setup(fd, *ai)) return fd;
    ::close(fd);
  }
  return -1;
}

static int connect_tcp(const std::string& host, std::uint16_t port) {
  const AddrList addrs = resolve(host, port, false);
  const int fd = open_first(addrs, [](int s, const struct addrinfo& ai) {
    return ::connect(s, ai.ai_addr, ai.ai_addrlen) == 0;
  });
  ensure<ChannelFailure>(fd >= 0, sys_error("connect to " + host + ":" + std::to_string(port)));
  set_nodelay(fd);
  return fd;
}

static int listen_tcp(const std::string& bind_host, std::uint16_t port) {
  const AddrList addrs = resolve(bind_host, port, true);
  const int fd = open_first(addrs, [](int s, const struct addrinfo& ai) {
    int yes = 1;
    ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    return ::bind(s, ai.ai_addr, ai.ai_addrlen) == 0 && ::listen(s, kListenBacklog) == 0;
  });
  ensure<ChannelFailure>(fd >= 0, sys_error("listen on port " + std::to_string(port)));
  return fd;
}

static std::uint16_t bound_port(int fd) {
  struct sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  ensure<ChannelFailure>(::getsockname(fd, (struct sockaddr*)&ss, &len) == 0,
                         sys_error("getsockname"));
  if (ss.ss_family == AF_INET6) return ntohs(((struct sockaddr_in6*)&ss)->sin6_port);
  return ntohs(((struct sockaddr_in*)&ss)->sin_port);
}

void TcpTransport::connect(const std::string& host, std::uint16_t port) {
  close();
  fd_ = connect_tcp(host, port);
}

void TcpTransport::send_all(const std::uint8_t* data, std::size_t n) {
  ensure<ChannelFailure>(fd_ >= 0, "send on closed socket");
  std::size_t off = 0;
  while (off < n) {
    ssize_t w = ::send(fd_, data + off, n - off, MSG_NOSIGNAL);
    if (w < 0 && errno == EINTR) continue;
    ensure<ChannelFailure>(w > 0, sys_error("send"));
    off += (std::size_t)w;
  }
}

void TcpTransport::recv_all(std::uint8_t* out, std::size_t n) {
  ensure<ChannelFailure>(fd_ >= 0, "recv on closed socket");
  std::size_t off = 0;
  while (off < n) {
    ssize_t r = ::recv(fd_, out + off, n - off, MSG_WAITALL);
    if (r < 0 && errno == EINTR) continue;
    ensure<ChannelFailure>(r != 0, "peer closed the connection");
    ensure<ChannelFailure>(r > 0, sys_error("recv"));
    off += (std::size_t)r;
  }
}

void TcpTransport::close() noexcept {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

TcpListener::~TcpListener() { close(); }

std::uint16_t TcpListener::listen(const std::string& bind_host, std::uint16_t port) {
  close();
  fd_ = listen_tcp(bind_host, port);
  return bound_port(fd_);
}

std::unique_ptr<TcpTransport> TcpListener::accept() {
  ensure<ChannelFailure>(fd_ >= 0, "accept on closed listener");
  int cfd = -1;
  do {
    cfd = ::accept(fd_, nullptr, nullptr);
  } while (cfd < 0 && errno == EINTR);
  ensure<ChannelFailure>(cfd >= 0, sys_error("accept"));
  set_nodelay(cfd);
  return std::make_unique<TcpTransport>(cfd);
}

void TcpListener::close() noexcept {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

} // namespace tpack
