#pragma once

#include <cstdint>
#include <string_view>

namespace FastList {

struct BenchArgs {
  static constexpr uint64_t default_records = 10'000;
  static constexpr uint64_t default_rounds = 10;
  // Upper bounds keep the record array allocatable and the run finite.
  static constexpr uint64_t max_records = 1 << 20;
  static constexpr uint64_t max_rounds = 1000;

  uint64_t records = default_records;
  uint64_t rounds = default_rounds;
};

// Parses a decimal count in [1, max]. Only digits are accepted: no sign, no
// whitespace. Throws std::invalid_argument otherwise.
uint64_t parse_count(std::string_view text, uint64_t max);

// fastlist_bench [records] [rounds]. Throws std::invalid_argument on a bad
// or surplus argument.
BenchArgs parse_bench_args(int argc, const char *const *argv);

} // namespace FastList
