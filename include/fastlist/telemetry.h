#pragma once
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace FastList {

// Operation counters for one or more lists. Counters are relaxed atomics so a
// monitoring thread can read them; the lists themselves stay unsynchronized.
struct Telemetry {
  // Counters
  std::atomic<uint64_t> pushes{0};
  std::atomic<uint64_t> inserts{0};
  std::atomic<uint64_t> pops{0};
  std::atomic<uint64_t> empty_pops{0};
  std::atomic<uint64_t> removes{0};
  std::atomic<uint64_t> stale_removes{0};
  std::atomic<uint64_t> finds{0};
  std::atomic<uint64_t> find_misses{0};
  std::atomic<uint64_t> compares{0};

  std::atomic<uint64_t> timed_ops{0};
  std::atomic<uint64_t> total_latency_ns{0};

  static constexpr uint64_t BIN_WIDTH_NS = 25;        // each bin = 25 ns
  static constexpr uint64_t MAX_TRACK_NS = 5'000'000; // 5 ms cap
  static constexpr size_t NUM_BINS = MAX_TRACK_NS / BIN_WIDTH_NS + 1;
  std::array<std::atomic<uint64_t>, NUM_BINS> hist{};

  void record_push() noexcept {
    pushes.fetch_add(1, std::memory_order_relaxed);
  }

  void record_insert(uint64_t compare_count) noexcept {
    inserts.fetch_add(1, std::memory_order_relaxed);
    compares.fetch_add(compare_count, std::memory_order_relaxed);
  }

  void record_pop(bool empty) noexcept {
    if (empty)
      empty_pops.fetch_add(1, std::memory_order_relaxed);
    else
      pops.fetch_add(1, std::memory_order_relaxed);
  }

  void record_remove(bool stale) noexcept {
    if (stale)
      stale_removes.fetch_add(1, std::memory_order_relaxed);
    else
      removes.fetch_add(1, std::memory_order_relaxed);
  }

  void record_find(bool hit, uint64_t compare_count) noexcept {
    finds.fetch_add(1, std::memory_order_relaxed);
    if (!hit)
      find_misses.fetch_add(1, std::memory_order_relaxed);
    compares.fetch_add(compare_count, std::memory_order_relaxed);
  }

  void record_latency(uint64_t ns) noexcept {
    size_t idx = std::min<size_t>(ns / BIN_WIDTH_NS, NUM_BINS - 1);
    hist[idx].fetch_add(1, std::memory_order_relaxed);

    timed_ops.fetch_add(1, std::memory_order_relaxed);
    total_latency_ns.fetch_add(ns, std::memory_order_relaxed);
  }

  double avg_latency_ns() const noexcept {
    auto total = timed_ops.load(std::memory_order_relaxed);
    return total ? double(total_latency_ns.load(std::memory_order_relaxed)) /
                       total
                 : 0.0;
  }

  // Average comparator calls per sorted insert or find.
  double compares_per_op() const noexcept {
    auto ops = inserts.load(std::memory_order_relaxed) +
               finds.load(std::memory_order_relaxed);
    return ops ? double(compares.load(std::memory_order_relaxed)) / ops : 0.0;
  }

  // Latency (ns) below which `target` of the timed ops fall, 0 if none.
  uint64_t percentile(double target) const noexcept;

  void dump_percentiles() const noexcept;
  void dump(double elapsed_s) const noexcept;
};

// Per-operation latency measurement
struct ScopedTimer {
  Telemetry &tel;
  std::chrono::high_resolution_clock::time_point start;
  explicit ScopedTimer(Telemetry &t) noexcept
      : tel(t), start(std::chrono::high_resolution_clock::now()) {}

  ~ScopedTimer() noexcept {
    auto end = std::chrono::high_resolution_clock::now();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start)
                  .count();
    tel.record_latency(ns);
  }
};

} // namespace FastList
