#include "tpack/package.hpp"
#include "tpack/processor.hpp"
#include "tpack/tcp_channel.hpp"
#include "tpack/util.hpp"

#include <climits>
#include <iostream>
#include <string>

using namespace tpack;

int main(int argc, char** argv) {
  if (argc != 4 && argc != 5) {
    std::cerr << "Usage: tpack-recv <bind_host> <port> <rank> [count]\n";
    std::cerr << "Accepts one peer and prints every package it sends.\n";
    std::cerr << "Without count, stops at the first Exit (code "
              << (int)MessageCode::Exit << ") package.\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  tpack-recv 0.0.0.0 4444 1\n";
    return 1;
  }

  try {
    const std::string bind_host = argv[1];
    // Port 0 picks an ephemeral port, reported below.
    const auto port = (std::uint16_t)parse_int(argv[2], 0, 65535, "port");
    const int rank = (int)parse_int(argv[3], 0, kMaxHeaderValue, "rank");
    const long count = (argc == 5) ? parse_int(argv[4], 1, LONG_MAX, "count") : -1;

    TcpChannel ch(rank);
    const std::uint16_t bound = ch.listen(bind_host, port);
    std::cerr << "[recv] rank " << rank << " listening on " << bind_host << ":" << bound << "\n";

    const int peer = ch.accept_one();
    std::cerr << "[recv] peer rank " << peer << " connected\n";

    for (long n = 0; count < 0 || n < count; ++n) {
      Received r = PackageProcessor::recv_package(ch, peer);

      std::cout << "sender=" << r.sender_rank << " code=" << r.message_code;
      if (r.content) {
        std::cout << " lengths=[";
        for (std::size_t i = 0; i < r.content->size(); ++i)
          std::cout << (i ? "," : "") << (*r.content)[i].size();
        std::cout << "] fingerprint=" << to_hex(content_fingerprint(*r.content));
      } else {
        std::cout << " header-only";
      }
      std::cout << std::endl;

      if (count < 0 && r.message_code == (int)MessageCode::Exit) break;
    }

    ch.close();
    return 0;

  } catch (const std::exception& e) {
    std::cerr << "[recv] error: " << e.what() << "\n";
    return 1;
  }
}
