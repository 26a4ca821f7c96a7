#pragma once
#include <cstdint>
#include <vector>

namespace tpack {
using Bytes = std::vector<std::uint8_t>;
using Tensor = std::vector<float>;
using TensorList = std::vector<Tensor>;

static constexpr std::uint16_t kVersion = 1;

// Wildcard source for IChannel::recv
static constexpr int kAnySource = -1;
// Receiver rank placeholder until a package is sent
static constexpr int kUnsetRank = -1;
} // namespace tpack
