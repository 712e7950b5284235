#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

/*
    LatestStore holds the newest value written by one thread for readers on another.

    The camera capture thread writes every frame it decodes; the frame scheduler reads whatever
    is newest on each display tick. Older frames are overwritten, never queued, so a slow camera
    or a slow tick never builds a backlog and end-to-end latency stays bounded by one frame.
*/

namespace toon {

template <typename T>
class LatestStore {
public:
  LatestStore() = default;

  LatestStore(const LatestStore&) = delete;
  LatestStore& operator=(const LatestStore&) = delete;

  void write(T value) {
    std::lock_guard<std::mutex> lock(mu_);
    latest_ = std::move(value);
    has_value_ = true;
    ++version_;
  }

  std::optional<T> read_latest() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!has_value_) return std::nullopt;
    return latest_;
  }

  // Copies the value only if it was written after 'seen', then advances 'seen' to it.
  // Lets one reader take each value at most once without draining it for others
  std::optional<T> read_if_newer(std::uint64_t& seen) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!has_value_ || version_ == seen) return std::nullopt;
    seen = version_;
    return latest_;
  }

  std::uint64_t version() const {
    std::lock_guard<std::mutex> lock(mu_);
    return version_;
  }

  bool has_value() const {
    std::lock_guard<std::mutex> lock(mu_);
    return has_value_;
  }

  // Drops the held value; version keeps counting
  void reset() {
    std::lock_guard<std::mutex> lock(mu_);
    latest_ = T{};
    has_value_ = false;
  }

private:
  mutable std::mutex mu_;
  T latest_{};
  bool has_value_{false};
  std::uint64_t version_{0};
};

} // namespace toon