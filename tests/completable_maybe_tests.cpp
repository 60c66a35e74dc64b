#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>
#include <rill/rill.hpp>

using namespace rill;

int main() {
  config quiet;
  quiet.report_violations = false;
  configure(quiet);

  // completable: completion or error, released afterwards
  {
    int released = 0;
    int done = 0;
    auto c = completable::create([&](completable_observer o) {
      o.completed();
      o.completed();
      return disposable([&]{ ++released; });
    });
    auto sub = c.subscribe([&]{ ++done; });
    assert(done == 1 && released == 1);

    bool failed = false;
    auto bad = completable::create([](completable_observer o) {
      o.failure(std::make_exception_ptr(std::runtime_error("disk full")));
      return disposable{};
    });
    auto sub2 = bad.subscribe([]{ assert(false); }, [&](std::exception_ptr){ failed = true; });
    assert(failed);
  }

  // as_completable drops the values
  {
    auto src = observable<int>::create([](observer<int> o) {
      o.next(1);
      o.next(2);
      o.completed();
      return disposable{};
    });
    bool done = false;
    auto sub = as_completable(src).subscribe([&]{ done = true; });
    assert(done);
  }

  // maybe: value path, empty path, error path
  {
    int value = 0;
    int empties = 0;
    auto with_value = maybe<int>::create([](maybe_observer<int> o) {
      o.success(3);
      return disposable{};
    });
    auto s1 = with_value.subscribe([&](int v){ value = v; }, {}, [&]{ ++empties; });
    assert(value == 3 && empties == 0 && "A value ends the maybe without on_completed");

    auto nothing = maybe<int>::create([](maybe_observer<int> o) {
      o.completed();
      o.success(4);
      return disposable{};
    });
    auto s2 = nothing.subscribe([](int){ assert(false); }, {}, [&]{ ++empties; });
    assert(empties == 1);

    bool failed = false;
    auto broken = maybe<int>::create([](maybe_observer<int> o) {
      o.failure(std::make_exception_ptr(std::runtime_error("no cache")));
      return disposable{};
    });
    auto s3 = broken.subscribe([](int){ assert(false); }, [&](std::exception_ptr){ failed = true; });
    assert(failed);
  }

  // as_maybe
  {
    bool empty_done = false;
    auto s1 = as_maybe(empty<int>()).subscribe([](int){ assert(false); }, {}, [&]{ empty_done = true; });
    assert(empty_done);

    int v = 0;
    auto s2 = as_maybe(just(8)).subscribe([&](int x){ v = x; });
    assert(v == 8);

    bool failed = false;
    auto two = observable<int>::create([](observer<int> o) {
      o.next(1);
      o.next(2);
      o.completed();
      return disposable{};
    });
    auto s3 = as_maybe(two).subscribe([](int){ assert(false); }, [&](std::exception_ptr){ failed = true; });
    assert(failed);
  }

  std::cout << "[completable_maybe_tests] OK\n";
  return 0;
}
