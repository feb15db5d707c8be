#pragma once
#include <chrono>
#include <cstdint>

// Adds the wall time spent in the enclosing scope to `ns`.
struct ScopedTimer {
  using clock = std::chrono::steady_clock;
  clock::time_point t0;
  std::uint64_t& ns;
  explicit ScopedTimer(std::uint64_t& total_ns) : t0(clock::now()), ns(total_ns) {}
  ~ScopedTimer() {
    ns += static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - t0).count());
  }
};
