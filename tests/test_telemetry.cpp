#include "fastlist/telemetry.h"
#include "records.h"
#include <gtest/gtest.h>

class TelemetryTest : public ::testing::Test {
protected:
  FastList::Telemetry telemetry_;
  Item items_[4] = {{3}, {1}, {4}, {2}};
  ItemList sorted_{by_key, &telemetry_};
  ItemList fifo_;
};

TEST_F(TelemetryTest, StartsAtZero) {
  EXPECT_EQ(telemetry_.pushes.load(), 0u);
  EXPECT_EQ(telemetry_.compares.load(), 0u);
  EXPECT_EQ(telemetry_.avg_latency_ns(), 0.0);
  EXPECT_EQ(telemetry_.compares_per_op(), 0.0);
  EXPECT_EQ(telemetry_.percentile(0.5), 0u);
}

TEST_F(TelemetryTest, CountsListOperations) {
  for (auto &item : items_)
    sorted_.insert(item);

  Item lookup{4};
  Item absent{9};
  ASSERT_NE(sorted_.find_equal(lookup), nullptr);
  EXPECT_EQ(sorted_.find_equal(absent), nullptr);

  EXPECT_TRUE(sorted_.remove(items_[0]));
  EXPECT_FALSE(sorted_.remove(items_[0]));
  EXPECT_NE(sorted_.pop(), nullptr);

  EXPECT_EQ(telemetry_.inserts.load(), 4u);
  EXPECT_EQ(telemetry_.finds.load(), 2u);
  EXPECT_EQ(telemetry_.find_misses.load(), 1u);
  EXPECT_EQ(telemetry_.removes.load(), 1u);
  EXPECT_EQ(telemetry_.stale_removes.load(), 1u);
  EXPECT_EQ(telemetry_.pops.load(), 1u);
  EXPECT_EQ(telemetry_.empty_pops.load(), 0u);
  EXPECT_GT(telemetry_.compares.load(), 0u);
}

TEST_F(TelemetryTest, CountsSortedInsertCompares) {
  // 3 -> [3]: no compare
  // 1 -> tail 3, head 3: 2 compares
  // 4 -> tail 3: 1 compare
  // 2 -> tail 4, head 1, walk 3: 3 compares
  for (auto &item : items_)
    sorted_.insert(item);

  EXPECT_EQ(telemetry_.compares.load(), 6u);
  EXPECT_DOUBLE_EQ(telemetry_.compares_per_op(), 1.5);
}

TEST_F(TelemetryTest, UnattachedListRecordsNothing) {
  for (auto &item : items_)
    fifo_.push(item);
  fifo_.pop();

  EXPECT_EQ(telemetry_.pushes.load(), 0u);
  EXPECT_EQ(telemetry_.pops.load(), 0u);

  fifo_.set_telemetry(&telemetry_);
  fifo_.pop();
  fifo_.pop();
  fifo_.pop();
  EXPECT_EQ(fifo_.pop(), nullptr);

  EXPECT_EQ(telemetry_.pops.load(), 3u);
  EXPECT_EQ(telemetry_.empty_pops.load(), 1u);
  EXPECT_EQ(fifo_.telemetry(), &telemetry_);
}

TEST_F(TelemetryTest, LatencyHistogram) {
  telemetry_.record_latency(10);
  telemetry_.record_latency(60);
  telemetry_.record_latency(60);
  telemetry_.record_latency(9'000'000); // clamps into the last bin

  EXPECT_EQ(telemetry_.timed_ops.load(), 4u);
  EXPECT_EQ(telemetry_.percentile(0.25), 0u);
  EXPECT_EQ(telemetry_.percentile(0.50), 50u);
  EXPECT_EQ(telemetry_.percentile(0.75), 50u);
  EXPECT_EQ(telemetry_.percentile(1.0), FastList::Telemetry::MAX_TRACK_NS);
  EXPECT_DOUBLE_EQ(telemetry_.avg_latency_ns(),
                   (10.0 + 60 + 60 + 9'000'000) / 4);
}

TEST_F(TelemetryTest, ScopedTimerRecordsOnce) {
  {
    FastList::ScopedTimer timer(telemetry_);
    sorted_.insert(items_[0]);
  }
  EXPECT_EQ(telemetry_.timed_ops.load(), 1u);
}
