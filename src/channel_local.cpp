#include "tpack/channel.hpp"
#include "tpack/error.hpp"
#include "tpack/util.hpp"

#include <cstring>
#include <string>

namespace tpack {

void LocalChannel::send(const std::uint8_t* data, std::size_t n, int dst) {
  group_.post(rank_, dst, data, n);
}

int LocalChannel::recv(std::uint8_t* out, std::size_t n, int src) {
  return group_.take(rank_, src, out, n);
}

LocalGroup::LocalGroup(int world_size)
  : world_size_(world_size) {
  ensure<InvalidInput>(world_size > 0, "world size must be positive");
  endpoints_.reserve((std::size_t)world_size);
  for (int r = 0; r < world_size; ++r)
    endpoints_.push_back(std::unique_ptr<LocalChannel>(new LocalChannel(*this, r)));
  mailboxes_.resize((std::size_t)world_size * (std::size_t)world_size);
  sent_.assign((std::size_t)world_size, 0);
}

void LocalGroup::check_rank(int rank) const {
  ensure<ChannelFailure>(rank >= 0 && rank < world_size_,
                         "unknown rank " + std::to_string(rank));
}

LocalChannel& LocalGroup::endpoint(int rank) {
  check_rank(rank);
  return *endpoints_[(std::size_t)rank];
}

std::deque<LocalGroup::Message>& LocalGroup::mailbox(int dst, int src) {
  return mailboxes_[(std::size_t)dst * (std::size_t)world_size_ + (std::size_t)src];
}

void LocalGroup::close() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

std::uint64_t LocalGroup::sent_count(int rank) const {
  check_rank(rank);
  std::lock_guard<std::mutex> lk(mu_);
  return sent_[(std::size_t)rank];
}

void LocalGroup::post(int src, int dst, const std::uint8_t* data, std::size_t n) {
  check_rank(dst);
  {
    std::lock_guard<std::mutex> lk(mu_);
    ensure<ChannelFailure>(!closed_, "send on closed channel");
    mailbox(dst, src).push_back(Message{next_seq_++, Bytes(data, data + n)});
    sent_[(std::size_t)src]++;
  }
  cv_.notify_all();
}

int LocalGroup::take(int self, int src, std::uint8_t* out, std::size_t n) {
  if (src != kAnySource) check_rank(src);

  std::unique_lock<std::mutex> lk(mu_);
  int from = -1;
  cv_.wait(lk, [&] {
    if (closed_) return true;
    if (src != kAnySource) {
      if (!mailbox(self, src).empty()) from = src;
      return from >= 0;
    }
    // Wildcard: oldest pending message from any source
    std::uint64_t best = 0;
    for (int s = 0; s < world_size_; ++s) {
      const auto& q = mailbox(self, s);
      if (q.empty()) continue;
      if (from < 0 || q.front().seq < best) {
        from = s;
        best = q.front().seq;
      }
    }
    return from >= 0;
  });
  ensure<ChannelFailure>(!closed_, "recv on closed channel");

  auto& q = mailbox(self, from);
  Message m = std::move(q.front());
  q.pop_front();
  lk.unlock();

  ensure<ChannelFailure>(m.data.size() == n,
                         "message size " + std::to_string(m.data.size()) +
                         " from rank " + std::to_string(from) +
                         " != expected " + std::to_string(n));
  if (n) std::memcpy(out, m.data.data(), n);
  return from;
}

} // namespace tpack
