#include <benchmark/benchmark.h>
#include <rill/rill.hpp>
#include <vector>

using namespace rill;

static void BM_publish_fanout(benchmark::State& st) {
  publish_subject<int> subj;
  volatile int sink = 0;

  std::vector<disposable> subs;
  for (int i = 0; i < st.range(1); ++i) {
    subs.push_back(subj.subscribe([&](int x){
      sink = x;
      benchmark::DoNotOptimize(sink);
    }));
  }

  for (auto _ : st) {
    for (int i = 0; i < st.range(0); ++i) {
      benchmark::DoNotOptimize(i);
      subj.on_next(i);
    }
  }
}
BENCHMARK(BM_publish_fanout)->Args({1000, 1})->Args({1000, 8})->Args({1000, 64});

static void BM_behavior_subscribe_dispose(benchmark::State& st) {
  behavior_subject<int> subj(0);
  volatile int sink = 0;

  for (auto _ : st) {
    auto d = subj.subscribe([&](int x){ sink = x; });
    benchmark::DoNotOptimize(sink);
    d.dispose();
  }
}
BENCHMARK(BM_behavior_subscribe_dispose);

static void BM_cold_subscribe(benchmark::State& st) {
  auto src = observable<int>::create([](observer<int> o) {
    o.next(1);
    o.completed();
    return disposable{};
  });
  volatile int sink = 0;

  for (auto _ : st) {
    auto d = src.subscribe([&](int x){ sink = x; });
    benchmark::DoNotOptimize(sink);
  }
}
BENCHMARK(BM_cold_subscribe);

static void BM_bag_insert_dispose(benchmark::State& st) {
  for (auto _ : st) {
    disposal_bag bag;
    for (int i = 0; i < st.range(0); ++i) bag.insert(make_disposable([]{}));
    bag.dispose();
  }
}
BENCHMARK(BM_bag_insert_dispose)->Arg(16)->Arg(256);

static void BM_single_success(benchmark::State& st) {
  auto s = single<int>::create([](single_observer<int> o) {
    o.success(42);
    return disposable{};
  });
  volatile int sink = 0;

  for (auto _ : st) {
    auto d = s.subscribe([&](int x){ sink = x; });
    benchmark::DoNotOptimize(sink);
  }
}
BENCHMARK(BM_single_success);

BENCHMARK_MAIN();
