#pragma once
#include "tpack.hpp"
#include <cstddef>
#include <cstdint>

namespace tpack {

// Each channel message travels as one frame: [u32_be len][bytes...]
static constexpr std::size_t kFramePrefixSize = 4;
static constexpr std::uint32_t kMaxFrameSize = 1024u * 1024u * 1024u;

class ITransport;

void send_frame(ITransport& t, const std::uint8_t* data, std::size_t n);

// Receives a frame that must be exactly `n` bytes into `out`. A frame of any
// other length is drained without touching `out` and raises ChannelFailure; the
// stream stays aligned on the next frame.
void recv_frame_exact(ITransport& t, std::uint8_t* out, std::size_t n);

// Receives a frame of at most `max_len` bytes.
Bytes recv_frame(ITransport& t, std::size_t max_len);

} // namespace tpack
