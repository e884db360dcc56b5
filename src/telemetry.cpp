#include "fastlist/telemetry.h"
#include <cinttypes>
#include <cstdio>

using namespace FastList;

uint64_t Telemetry::percentile(double target) const noexcept {
  uint64_t total = 0;
  for (auto &h : hist)
    total += h.load(std::memory_order_relaxed);
  if (total == 0)
    return 0;

  uint64_t cumulative = 0;
  for (size_t i = 0; i < NUM_BINS; ++i) {
    cumulative += hist[i].load(std::memory_order_relaxed);
    if (double(cumulative) / total >= target)
      return i * BIN_WIDTH_NS;
  }
  return (NUM_BINS - 1) * BIN_WIDTH_NS;
}

void Telemetry::dump_percentiles() const noexcept {
  if (timed_ops.load(std::memory_order_relaxed) == 0)
    return;

  std::printf("p50=%" PRIu64 " ns  p90=%" PRIu64 " ns  p99=%" PRIu64
              " ns  p999=%" PRIu64 " ns\n",
              percentile(0.50), percentile(0.90), percentile(0.99),
              percentile(0.999));
}

void Telemetry::dump(double elapsed_s) const noexcept {
  uint64_t ops = pushes.load() + inserts.load() + pops.load() +
                 empty_pops.load() + removes.load() + stale_removes.load() +
                 finds.load();
  double throughput = elapsed_s > 0 ? ops / elapsed_s : 0.0;

  std::printf("[FastList Telemetry]\n");
  std::printf("pushes=%" PRIu64 " inserts=%" PRIu64 " pops=%" PRIu64
              " empty pops=%" PRIu64 "\n",
              pushes.load(), inserts.load(), pops.load(), empty_pops.load());
  std::printf("removes=%" PRIu64 " stale removes=%" PRIu64 " finds=%" PRIu64
              " find misses=%" PRIu64 "\n",
              removes.load(), stale_removes.load(), finds.load(),
              find_misses.load());
  std::printf("compares=%" PRIu64 " (%.2f per sorted op)\n", compares.load(),
              compares_per_op());
  std::printf("avg_latency=%.2f ns, total_latency= %" PRIu64 " ns\n",
              avg_latency_ns(), total_latency_ns.load());
  std::printf("throughput=%.2f ops/s\n", throughput);
  dump_percentiles();
}
