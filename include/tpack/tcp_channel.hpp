#pragma once
#include "channel.hpp"
#include "transport.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tpack {

// IChannel over one TCP connection per peer rank. Peers identify each other
// with a hello frame [u16_be version][u32_be rank] sent by both sides.
class TcpChannel final : public IChannel {
public:
  explicit TcpChannel(int rank);
  ~TcpChannel() override;

  TcpChannel(const TcpChannel&) = delete;
  TcpChannel& operator=(const TcpChannel&) = delete;

  int rank() const override { return rank_; }

  // Dials a listening peer. Returns the peer's rank.
  int connect(const std::string& host, std::uint16_t port);

  // Returns the bound port (useful with port 0).
  std::uint16_t listen(const std::string& bind_host, std::uint16_t port);

  // Accepts one inbound peer on the listening socket. Returns its rank.
  int accept_one();

  // listen() followed by `count` accept_one() calls. Returns the peer ranks
  // in accept order.
  std::vector<int> accept(const std::string& bind_host, std::uint16_t port,
                          std::size_t count);

  std::vector<int> peers() const;

  void send(const std::uint8_t* data, std::size_t n, int dst) override;
  int recv(std::uint8_t* out, std::size_t n, int src) override;

  void close() noexcept;

private:
  int add_peer(std::unique_ptr<TcpTransport> t);
  TcpTransport& peer(int rank);
  int wait_readable();

  int rank_;
  TcpListener listener_;
  std::map<int, std::unique_ptr<TcpTransport>> peers_;
};

} // namespace tpack
