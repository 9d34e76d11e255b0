#pragma once
#include <cstdint>
#include <mutex>

namespace rpace {

// Latest-only value slot between one producer thread and one consumer.
// Older values are overwritten; the consumer only ever sees the newest.
template <class T>
class LatestBuffer {
public:
  void publish(const T& v) {
    std::lock_guard<std::mutex> lk(mu_);
    data_ = v;
    ++seq_;
  }

  // Copy out if the sequence advanced past cursor.
  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    std::lock_guard<std::mutex> lk(mu_);
    if (seq_ != cursor) {
      out = data_;
      cursor = seq_;
      return true;
    }
    return false;
  }

  std::uint64_t sequence() const {
    std::lock_guard<std::mutex> lk(mu_);
    return seq_;
  }

private:
  mutable std::mutex mu_;
  T data_{};
  std::uint64_t seq_{0};
};

} // namespace rpace
