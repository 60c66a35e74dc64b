#include <rill/rill.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace rill;

// A "request" that answers once. The connection handle is released as soon
// as the answer (or the failure) has been delivered.
static single<std::string> fetch_user(int id) {
  return single<std::string>::create([id](single_observer<std::string> o) {
    std::cout << "[fetch] open connection for user " << id << "\n";
    if (id < 0) o.failure(std::make_exception_ptr(std::invalid_argument("bad id")));
    else        o.success("user#" + std::to_string(id));
    return disposable([id]{ std::cout << "[fetch] close connection for user " << id << "\n"; });
  });
}

int main() {
  auto ok = fetch_user(7).subscribe(
    [](const std::string& u){ std::cout << "got " << u << "\n"; },
    [](std::exception_ptr){ std::cout << "failed\n"; });

  auto bad = fetch_user(-1).subscribe(
    [](const std::string& u){ std::cout << "got " << u << "\n"; },
    [](std::exception_ptr e){
      try { std::rethrow_exception(e); }
      catch (const std::exception& ex) { std::cout << "failed: " << ex.what() << "\n"; }
    });

  // Narrowing a stream that produces too much ends in a sequence_error.
  publish_subject<int> numbers;
  auto narrowed = as_single(numbers.as_observable()).subscribe(
    [](int v){ std::cout << "single value " << v << "\n"; },
    [](std::exception_ptr e){
      try { std::rethrow_exception(e); }
      catch (const sequence_error& ex) { std::cout << "as_single: " << ex.what() << "\n"; }
    });
  numbers.on_next(1);
  numbers.on_next(2);

  return 0;
}
