#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#include <rill/rill.hpp>

using namespace rill;

int main() {
  // shared activation, delivery through the UI queue, fallback on error
  {
    auto ui = std::make_shared<serial_queue>();
    int activations = 0;
    observer<int> producer;
    auto src = observable<int>::create([&](observer<int> o) {
      ++activations;
      producer = o;
      return disposable{};
    });

    auto d = as_driver(src, -1, ui);
    assert(!d.is_connected() && activations == 0);

    std::vector<int> a, b, c;
    int a_done = 0;
    auto s1 = d.subscribe([&](int v){ a.push_back(v); }, [&]{ ++a_done; });
    auto s2 = d.subscribe([&](int v){ b.push_back(v); });
    assert(d.is_connected());
    assert(activations == 1 && "The source must be connected once for all subscribers");

    producer.next(1);
    assert(a.empty() && "Callbacks only run when the UI queue drains");
    ui->drain();
    assert((a == std::vector<int>{1}));
    assert((b == std::vector<int>{1}));

    auto s3 = d.subscribe([&](int v){ c.push_back(v); });
    ui->drain();
    assert(activations == 1);
    assert((c == std::vector<int>{1}) && "Late subscriber replays the latest value");

    producer.error(std::make_exception_ptr(std::runtime_error("backend down")));
    ui->drain();
    assert((a == std::vector<int>{1, -1}) && a_done == 1);
    assert((b == std::vector<int>{1, -1}));
    assert((c == std::vector<int>{1, -1}));
  }

  // callbacks land on the thread that drains, not on the producer thread
  {
    auto ui = std::make_shared<serial_queue>();
    auto src = observable<int>::create([](observer<int> o) {
      std::thread([o]{ o.next(7); o.completed(); }).join();
      return disposable{};
    });

    auto d = as_driver(src, 0, ui);
    std::thread::id seen{};
    int value = 0;
    bool done = false;
    auto sub = d.subscribe([&](int v){ value = v; seen = std::this_thread::get_id(); },
                           [&]{ done = true; });
    ui->drain();
    assert(value == 7 && done);
    assert(seen == std::this_thread::get_id());
  }

  // disposed before the queue drains: nothing is delivered
  {
    auto ui = std::make_shared<serial_queue>();
    auto d = as_driver(just(3), 0, ui);
    int got = 0;
    auto sub = d.subscribe([&](int){ ++got; });
    sub.dispose();
    ui->drain();
    assert(got == 0);
  }

  std::cout << "[driver_tests] OK\n";
  return 0;
}
