#include <QCoreApplication>
#include <QTimer>

#include <rill/rill.hpp>
#include <rill/adapters/qt.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

using namespace rill;
using namespace std::chrono_literals;

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);

  // Background producer: progress updates from a worker thread
  auto progress = observable<int>::create([](observer<int> o) {
    auto alive = std::make_shared<std::atomic<bool>>(true);
    std::thread([o, alive]{
      for (int p = 0; p <= 100 && alive->load(); p += 25) {
        o.next(p);
        std::this_thread::sleep_for(50ms);
      }
      o.completed();
    }).detach();
    return disposable([alive]{ alive->store(false); });
  });

  // Callbacks are re-posted to the application thread via QMetaObject::invokeMethod
  auto ui_progress = rill::qt::as_driver(progress, -1, &app);

  disposal_bag bag;
  ui_progress.subscribe([](int p){ std::cout << "[progress] " << p << "%\n"; },
                        [&app]{ std::cout << "[progress] finished\n"; app.quit(); })
    .disposed_by(bag);

  QTimer::singleShot(2000, &app, &QCoreApplication::quit);
  return app.exec();
}
