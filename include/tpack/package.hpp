#pragma once
#include "tpack.hpp"
#include <array>
#include <cstddef>
#include <cstdint>

namespace tpack {

// Header layout shared by Package and PackageProcessor
static constexpr std::size_t kHeaderSize = 4;
static constexpr std::size_t kHeaderSenderRankIdx = 0;
static constexpr std::size_t kHeaderReceiverRankIdx = 1;
static constexpr std::size_t kHeaderBoundaryCountIdx = 2;
static constexpr std::size_t kHeaderMessageCodeIdx = 3;

// Header fields are float32 on the wire, integers must stay exact.
static constexpr std::int32_t kMaxHeaderValue = 1 << 24;

static constexpr std::int32_t kMaxBoundaryCount = 1 << 20;
static constexpr std::size_t kMaxPayloadElems = std::size_t(1) << 28;

enum class MessageCode : std::int32_t {
  ParameterRequest = 0,
  GradientUpdate   = 1,
  ParameterUpdate  = 2,
  EvaluateParams   = 3,
  Exit             = 4
};

using HeaderBuffer = std::array<float, kHeaderSize>;

struct Header {
  std::int32_t sender_rank{kUnsetRank};
  std::int32_t receiver_rank{kUnsetRank};
  std::int32_t boundary_count{0};
  std::int32_t message_code{0};

  HeaderBuffer to_buffer() const;
};

class Package {
public:
  // Header-only package. Throws InvalidInput for a negative sender_rank.
  Package(int sender_rank, int message_code, int receiver_rank = kUnsetRank);

  // Flattens buffers into one payload; an empty list gives a header-only
  // package. Throws InvalidInput on an empty sub-buffer.
  static Package build(const TensorList& buffers, int sender_rank, int message_code);

  // Receive-side reconstruction. Throws LengthMismatch unless the header,
  // boundaries and payload agree.
  static Package assemble(const Header& header,
                          std::vector<std::int32_t> boundaries,
                          Tensor payload);

  static Header parse_header(const float* raw, std::size_t n);
  static Header parse_header(const Tensor& raw);

  static TensorList parse_content(const std::vector<std::int32_t>& boundaries,
                                  const Tensor& flat);

  void append_tensor(const Tensor& t);
  void append_tensor_list(const TensorList& ts);

  void set_receiver_rank(int rank);

  const Header& header() const { return header_; }
  const std::vector<std::int32_t>& boundaries() const { return boundaries_; }
  const Tensor& payload() const { return payload_; }

  bool header_only() const { return header_.boundary_count == 0; }

  TensorList content() const;

private:
  Package() = default;

  Header header_{};
  std::vector<std::int32_t> boundaries_;
  Tensor payload_;
};

// SHA-256 over the encoded boundary table and payload of `buffers`.
Bytes content_fingerprint(const TensorList& buffers);

} // namespace tpack
