#pragma once
#include "package.hpp"
#include "channel.hpp"
#include <optional>

namespace tpack {

struct Received {
  int sender_rank{kUnsetRank};
  int message_code{0};
  std::optional<TensorList> content; // empty for header-only packages
};

// Three-phase package protocol over an IChannel:
//   1. header, kHeaderSize float32
//   2. boundary table, boundary_count int32       (only if boundary_count > 0)
//   3. flat payload, sum(boundaries) float32      (only if boundary_count > 0)
// Phases of one package must not interleave with another package to the
// same destination; callers serialize sends per destination.
class PackageProcessor {
public:
  // Stamps `dst` into the package's receiver rank, then sends the phases.
  static void send_package(IChannel& ch, Package& package, int dst);

  // Header from `src`; boundary table and payload from the sender named in
  // the decoded header.
  static Received recv_package(IChannel& ch, int src = kAnySource);

  static Package recv_package_into(IChannel& ch, int src = kAnySource);
};

} // namespace tpack
