#include "fastlist/bench_args.h"
#include <charconv>
#include <stdexcept>
#include <string>

using namespace FastList;

uint64_t FastList::parse_count(std::string_view text, uint64_t max) {
  std::string shown(text);
  if (text.empty())
    throw std::invalid_argument("empty count");

  // from_chars takes no sign or space, but reject those explicitly so a
  // leading '-' can never wrap around
  for (char c : text) {
    if (c < '0' || c > '9')
      throw std::invalid_argument("not a positive integer: " + shown);
  }

  uint64_t value = 0;
  const char *last = text.data() + text.size();
  auto [end, ec] = std::from_chars(text.data(), last, value);
  if (ec == std::errc::result_out_of_range || value > max)
    throw std::invalid_argument("count out of range (max " +
                                std::to_string(max) + "): " + shown);
  if (ec != std::errc() || end != last || value == 0)
    throw std::invalid_argument("not a positive integer: " + shown);
  return value;
}

BenchArgs FastList::parse_bench_args(int argc, const char *const *argv) {
  BenchArgs args;
  if (argc > 3)
    throw std::invalid_argument("too many arguments");
  if (argc > 1)
    args.records = parse_count(argv[1], BenchArgs::max_records);
  if (argc > 2)
    args.rounds = parse_count(argv[2], BenchArgs::max_rounds);
  return args;
}
