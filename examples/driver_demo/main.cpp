#include <rill/rill.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace rill;
using namespace std::chrono_literals;

int main() {
  // the "main loop" queue; a worker thread produces temperature readings
  auto ui = std::make_shared<serial_queue>();
  std::atomic<int> activations{0};

  auto readings = observable<double>::create([&](observer<double> o) {
    ++activations;
    auto alive = std::make_shared<std::atomic<bool>>(true);
    std::thread([o, alive]{
      for (int i = 0; i < 5 && alive->load(); ++i) {
        o.next(20.0 + i * 0.5);
        std::this_thread::sleep_for(10ms);
      }
      o.error(std::make_exception_ptr(std::runtime_error("sensor disconnected")));
    }).detach();
    return disposable([alive]{ alive->store(false); });
  });

  auto temperature = as_driver(readings, -273.15, ui);

  auto label = temperature.subscribe([](double t){ std::cout << "[label] " << t << "\n"; });
  auto chart = temperature.subscribe([](double t){ std::cout << "[chart] " << t << "\n"; },
                                     []{ std::cout << "[chart] done\n"; });

  for (int i = 0; i < 20; ++i) {
    ui->drain();
    std::this_thread::sleep_for(10ms);
  }
  ui->drain();

  std::cout << "source activations: " << activations.load() << "\n";
  return 0;
}
