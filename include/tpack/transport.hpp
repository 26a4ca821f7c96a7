#pragma once
#include "tpack.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <cstddef>

namespace tpack {

// Byte stream underneath a TcpChannel peer.
class ITransport {
public:
  virtual ~ITransport() = default;

  // Blocking exact send/recv
  virtual void send_all(const std::uint8_t* data, std::size_t n) = 0;
  virtual void recv_all(std::uint8_t* out, std::size_t n) = 0;

  virtual void close() noexcept = 0;
};

// POSIX TCP transport (Linux/macOS)
class TcpTransport final : public ITransport {
public:
  TcpTransport();
  explicit TcpTransport(int fd);
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  void connect(const std::string& host, std::uint16_t port);

  void send_all(const std::uint8_t* data, std::size_t n) override;
  void recv_all(std::uint8_t* out, std::size_t n) override;

  void close() noexcept override;

  int native_handle() const { return fd_; }

private:
  int fd_{-1};
};

class TcpListener {
public:
  TcpListener() = default;
  ~TcpListener();

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  // Port 0 binds an ephemeral port; returns the bound port.
  std::uint16_t listen(const std::string& bind_host, std::uint16_t port);

  std::unique_ptr<TcpTransport> accept();

  bool is_open() const { return fd_ >= 0; }
  void close() noexcept;

private:
  int fd_{-1};
};

} // namespace tpack
