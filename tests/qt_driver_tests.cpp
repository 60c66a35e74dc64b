#include <QCoreApplication>
#include <QThread>

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

#include <rill/rill.hpp>
#include <rill/adapters/qt.hpp>

using namespace rill;

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);

  observer<int> producer;
  int activations = 0;
  auto src = observable<int>::create([&](observer<int> o) {
    ++activations;
    producer = o;
    return disposable{};
  });

  auto d = rill::qt::as_driver(src, 0, &app);

  std::vector<int> got;
  bool done = false;
  bool on_gui_thread = true;
  auto sub = d.subscribe([&](int v){
    got.push_back(v);
    on_gui_thread = on_gui_thread && QThread::currentThread() == app.thread();
  }, [&]{ done = true; });

  std::thread worker([&]{
    producer.next(1);
    producer.next(2);
    producer.error(std::make_exception_ptr(std::runtime_error("gone")));
  });
  worker.join();

  assert(got.empty() && "Delivery is queued onto the application thread");
  QCoreApplication::sendPostedEvents();
  QCoreApplication::processEvents();

  assert(activations == 1);
  assert((got == std::vector<int>{1, 2, 0}) && "Error is replaced by the fallback value");
  assert(done);
  assert(on_gui_thread);

  std::cout << "[qt_driver_tests] OK\n";
  return 0;
}
