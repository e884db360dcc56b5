#include "fastlist/bench_args.h"
#include "fastlist/intrusive_list.h"
#include "fastlist/telemetry.h"
#include <chrono>
#include <cinttypes>
#include <compare>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <new>
#include <random>
#include <stdexcept>

using namespace std;

namespace {

struct Record {
  uint64_t key;
  uint64_t id;
  FastList::Link<Record> link;
};

std::weak_ordering by_key(const Record &a, const Record &b) {
  return a.key <=> b.key;
}

constexpr uint64_t find_stride = 64; // look up every Nth record

// Telemetry carries a large histogram, keep it off the stack.
FastList::Telemetry telemetry;

void usage(const char *prog) {
  std::cerr << "usage: " << prog << " [records] [rounds]\n"
            << "  records  records per round, 1.."
            << FastList::BenchArgs::max_records << " (default "
            << FastList::BenchArgs::default_records << ")\n"
            << "  rounds   number of rounds, 1.."
            << FastList::BenchArgs::max_rounds << " (default "
            << FastList::BenchArgs::default_rounds << ")\n";
}

// Sorted-inserts every record, samples finds, removes every other record and
// pops the rest. Returns false if the list ever came out of order or lost a
// record.
bool run_round(Record *records, uint64_t count, mt19937_64 &rng) {
  FastList::List<Record> list(by_key, &telemetry);

  // Keys are drawn from a narrow range so equal keys are common.
  uniform_int_distribution<uint64_t> keys(0, count / 4 + 1);
  for (uint64_t i = 0; i < count; ++i) {
    records[i].key = keys(rng);
    records[i].id = i;
    FastList::ScopedTimer t(telemetry);
    list.insert(records[i]);
  }

  if (!list.is_sorted() || !list.check_invariants())
    return false;

  for (uint64_t i = 0; i < count; i += find_stride) {
    FastList::ScopedTimer t(telemetry);
    list.find_equal(records[i]);
  }

  for (uint64_t i = 0; i < count; i += 2) {
    FastList::ScopedTimer t(telemetry);
    if (!list.remove(records[i]))
      return false;
  }

  uint64_t prev_key = 0;
  while (true) {
    FastList::ScopedTimer t(telemetry);
    Record *r = list.pop();
    if (r == nullptr)
      break;
    if (r->key < prev_key)
      return false;
    prev_key = r->key;
  }
  return list.empty();
}

} // namespace

int main(int argc, char **argv) {
  FastList::BenchArgs args;
  try {
    args = FastList::parse_bench_args(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << "[Bench] " << e.what() << "\n";
    usage(argv[0]);
    return 1;
  }
  const uint64_t count = args.records;
  const uint64_t rounds = args.rounds;

  // Records stay put for the whole run; the list only borrows them.
  unique_ptr<Record[]> records;
  try {
    records = make_unique<Record[]>(count);
  } catch (const std::bad_alloc &e) {
    std::cerr << "[Bench] cannot allocate " << count << " records: "
              << e.what() << "\n";
    return 1;
  }
  mt19937_64 rng(42);

  auto start = chrono::steady_clock::now();
  for (uint64_t round = 0; round < rounds; ++round) {
    if (!run_round(records.get(), count, rng)) {
      std::cerr << "[Bench] round " << round << " produced an unsorted list\n";
      return 2;
    }

    auto now = chrono::steady_clock::now();
    double elapsed = chrono::duration<double>(now - start).count();
    std::cout << "round " << round + 1 << "/" << rounds << ": "
              << (round + 1) * count << " records in " << elapsed << "s\n";
  }

  double elapsed =
      chrono::duration<double>(chrono::steady_clock::now() - start).count();
  telemetry.dump(elapsed);
  std::printf("records=%" PRIu64 " rounds=%" PRIu64 "\n", count, rounds);
  return 0;
}
