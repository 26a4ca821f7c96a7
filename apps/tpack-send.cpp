#include "tpack/package.hpp"
#include "tpack/processor.hpp"
#include "tpack/tcp_channel.hpp"
#include "tpack/util.hpp"

#include <iostream>
#include <sstream>
#include <string>

using namespace tpack;

static void usage() {
  std::cerr << "Usage:\n";
  std::cerr << "  tpack-send <host> <port> <rank> <message_code> [v,v,...]...\n\n";
  std::cerr << "Each trailing argument is one sub-buffer of comma-separated floats.\n";
  std::cerr << "With none, a header-only package is sent. An Exit package follows.\n\n";
  std::cerr << "Example:\n";
  std::cerr << "  tpack-send 127.0.0.1 4444 0 7 1,2,3 4,5\n";
}

static Tensor parse_tensor(const std::string& arg) {
  Tensor t;
  std::stringstream ss(arg);
  std::string item;
  while (std::getline(ss, item, ',')) {
    ensure(!item.empty(), "empty value in buffer argument");
    t.push_back(std::stof(item));
  }
  return t;
}

int main(int argc, char** argv) {
  if (argc < 5) {
    usage();
    return 1;
  }

  try {
    const std::string host = argv[1];
    const auto port = (std::uint16_t)parse_int(argv[2], 1, 65535, "port");
    const int rank = (int)parse_int(argv[3], 0, kMaxHeaderValue, "rank");
    const int message_code =
      (int)parse_int(argv[4], -kMaxHeaderValue, kMaxHeaderValue, "message_code");

    TensorList buffers;
    for (int i = 5; i < argc; ++i) buffers.push_back(parse_tensor(argv[i]));

    Package pkg = Package::build(buffers, rank, message_code);

    TcpChannel ch(rank);
    const int peer = ch.connect(host, port);
    std::cerr << "[send] connected to rank " << peer << "\n";

    PackageProcessor::send_package(ch, pkg, peer);
    std::cerr << "[send] sent code=" << message_code
              << " boundaries=" << pkg.header().boundary_count
              << " elems=" << pkg.payload().size();
    if (!pkg.header_only())
      std::cerr << " fingerprint=" << to_hex(content_fingerprint(buffers));
    std::cerr << "\n";

    if (message_code != (int)MessageCode::Exit) {
      Package bye(rank, (int)MessageCode::Exit);
      PackageProcessor::send_package(ch, bye, peer);
    }

    ch.close();
    return 0;

  } catch (const std::exception& e) {
    std::cerr << "[send] error: " << e.what() << "\n";
    return 1;
  }
}
