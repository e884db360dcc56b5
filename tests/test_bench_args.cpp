#include "fastlist/bench_args.h"
#include <gtest/gtest.h>
#include <cstdint>
#include <stdexcept>
#include <string>

using FastList::BenchArgs;
using FastList::parse_bench_args;
using FastList::parse_count;

TEST(ParseCountTest, AcceptsDigits) {
  EXPECT_EQ(parse_count("1", 10), 1u);
  EXPECT_EQ(parse_count("10", 10), 10u);
  EXPECT_EQ(parse_count("007", 10), 7u);
}

TEST(ParseCountTest, RejectsSignsAndJunk) {
  for (const char *text : {"-1", "-0", "+5", " 5", "5 ", "abc", "12x", ""})
    EXPECT_THROW(parse_count(text, 100), std::invalid_argument) << text;
}

TEST(ParseCountTest, RejectsZero) {
  EXPECT_THROW(parse_count("0", 100), std::invalid_argument);
}

TEST(ParseCountTest, RejectsAboveMax) {
  EXPECT_EQ(parse_count("100", 100), 100u);
  EXPECT_THROW(parse_count("101", 100), std::invalid_argument);
  EXPECT_THROW(parse_count("99999999999999999999", UINT64_MAX),
               std::invalid_argument);
}

TEST(ParseBenchArgsTest, DefaultsWithoutArguments) {
  const char *argv[] = {"fastlist_bench"};
  BenchArgs args = parse_bench_args(1, argv);
  EXPECT_EQ(args.records, BenchArgs::default_records);
  EXPECT_EQ(args.rounds, BenchArgs::default_rounds);
}

TEST(ParseBenchArgsTest, ReadsRecordsAndRounds) {
  const char *argv[] = {"fastlist_bench", "100", "3"};
  BenchArgs args = parse_bench_args(3, argv);
  EXPECT_EQ(args.records, 100u);
  EXPECT_EQ(args.rounds, 3u);
}

// A negative count used to wrap to a huge value and reach the allocator.
TEST(ParseBenchArgsTest, RejectsNegativeCounts) {
  const char *records[] = {"fastlist_bench", "-1", "1"};
  EXPECT_THROW(parse_bench_args(3, records), std::invalid_argument);

  const char *rounds[] = {"fastlist_bench", "100", "-3"};
  EXPECT_THROW(parse_bench_args(3, rounds), std::invalid_argument);
}

TEST(ParseBenchArgsTest, RejectsOversizedRun) {
  std::string records = std::to_string(BenchArgs::max_records + 1);
  const char *too_many_records[] = {"fastlist_bench", records.c_str()};
  EXPECT_THROW(parse_bench_args(2, too_many_records), std::invalid_argument);

  std::string rounds = std::to_string(BenchArgs::max_rounds + 1);
  const char *too_many_rounds[] = {"fastlist_bench", "10", rounds.c_str()};
  EXPECT_THROW(parse_bench_args(3, too_many_rounds), std::invalid_argument);
}

TEST(ParseBenchArgsTest, RejectsSurplusArguments) {
  const char *argv[] = {"fastlist_bench", "10", "1", "extra"};
  EXPECT_THROW(parse_bench_args(4, argv), std::invalid_argument);
}
