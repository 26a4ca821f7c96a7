#pragma once
#include "tpack.hpp"
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

namespace tpack {

// Rank-addressed, blocking, ordered point-to-point channel.
// Every send() is one message; recv() must be given exactly its size.
class IChannel {
public:
  virtual ~IChannel() = default;

  virtual int rank() const = 0;

  virtual void send(const std::uint8_t* data, std::size_t n, int dst) = 0;

  // Blocks until a message from `src` (or any peer for kAnySource) arrives.
  // Returns the rank that actually sent it.
  virtual int recv(std::uint8_t* out, std::size_t n, int src) = 0;
};

class LocalGroup;

class LocalChannel final : public IChannel {
public:
  int rank() const override { return rank_; }

  void send(const std::uint8_t* data, std::size_t n, int dst) override;
  int recv(std::uint8_t* out, std::size_t n, int src) override;

private:
  friend class LocalGroup;
  LocalChannel(LocalGroup& group, int rank) : group_(group), rank_(rank) {}

  LocalGroup& group_;
  int rank_;
};

// In-process group of endpoints, one FIFO mailbox per (src, dst) pair.
// Sends never block. Safe to drive each endpoint from its own thread.
class LocalGroup {
public:
  explicit LocalGroup(int world_size);
  LocalGroup(const LocalGroup&) = delete;
  LocalGroup& operator=(const LocalGroup&) = delete;

  int world_size() const { return world_size_; }

  LocalChannel& endpoint(int rank);

  // Wakes every blocked recv; all further calls fail with ChannelFailure.
  void close();

  std::uint64_t sent_count(int rank) const;

private:
  friend class LocalChannel;

  struct Message {
    std::uint64_t seq;
    Bytes data;
  };

  void post(int src, int dst, const std::uint8_t* data, std::size_t n);
  int take(int self, int src, std::uint8_t* out, std::size_t n);

  std::deque<Message>& mailbox(int dst, int src);
  void check_rank(int rank) const;

  int world_size_;
  std::vector<std::unique_ptr<LocalChannel>> endpoints_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<std::deque<Message>> mailboxes_;
  std::vector<std::uint64_t> sent_;
  std::uint64_t next_seq_{0};
  bool closed_{false};
};

} // namespace tpack
