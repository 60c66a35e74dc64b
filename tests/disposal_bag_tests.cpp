#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>
#include <rill/rill.hpp>

using namespace rill;

// Owner whose lifetime scopes its subscriptions.
struct view_model {
  explicit view_model(publish_subject<int>& src) {
    src.subscribe(bag, [this](int v){ last = v; ++seen; });
  }
  int last{0};
  int seen{0};
  disposal_bag bag;
};

int main() {
  // dispose cascades to every stored handle
  {
    int released = 0;
    disposal_bag bag;
    for (int i = 0; i < 5; ++i) bag.insert(make_disposable([&]{ ++released; }));
    assert(bag.size() == 5);
    bag.dispose();
    assert(released == 5);
    assert(bag.is_disposed() && bag.size() == 0);
    bag.dispose();
    assert(released == 5 && "Second dispose must be a no-op");
  }

  // insert after dispose releases immediately, never stores
  {
    int released = 0;
    disposal_bag bag;
    bag.dispose();
    bag.insert(make_disposable([&]{ ++released; }));
    assert(released == 1);
    assert(bag.size() == 0);
  }

  // destructor of the bag tears everything down
  {
    int released = 0;
    {
      disposal_bag bag;
      make_disposable([&]{ ++released; }).disposed_by(bag);
      make_disposable([&]{ ++released; }).disposed_by(bag);
    }
    assert(released == 2);
  }

  // release action re-entering the same bag: no deadlock, no double release
  {
    int released = 0;
    auto bag = std::make_unique<disposal_bag>();
    auto* raw = bag.get();
    bag->insert(make_disposable([&, raw]{
      ++released;
      raw->dispose();
      raw->insert(make_disposable([&]{ ++released; }));
    }));
    bag->dispose();
    assert(released == 2);
  }

  // subscriptions stored in an owner's bag stop when the owner dies
  {
    publish_subject<int> src;
    auto vm = std::make_unique<view_model>(src);
    src.on_next(1);
    src.on_next(2);
    assert(vm->last == 2 && vm->seen == 2);
    assert(src.has_observers());
    vm.reset();
    assert(!src.has_observers() && "Bag teardown must detach the subscription");
    src.on_next(3);
  }

  // concurrent inserts racing dispose: every handle released exactly once
  for (int round = 0; round < 20; ++round) {
    std::atomic<int> released{0};
    constexpr int per_thread = 200;
    disposal_bag bag;
    std::vector<std::thread> ts;
    for (int i = 0; i < 4; ++i) {
      ts.emplace_back([&]{
        for (int k = 0; k < per_thread; ++k) bag.insert(make_disposable([&]{ released.fetch_add(1); }));
      });
    }
    std::thread killer([&]{ bag.dispose(); });
    for (auto& t : ts) t.join();
    killer.join();
    bag.dispose();
    assert(released.load() == 4 * per_thread);
  }

  std::cout << "[disposal_bag_tests] OK\n";
  return 0;
}
