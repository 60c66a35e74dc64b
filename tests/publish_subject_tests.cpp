#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <rill/rill.hpp>

using namespace rill;

int main() {
  // nothing is replayed: only values emitted after attaching are seen
  {
    publish_subject<std::string> subject;
    subject.on_next("a");
    std::vector<std::string> collect;
    auto sub = subject.subscribe([&](const std::string& s){ collect.push_back(s); });
    subject.on_next("b");
    assert((collect == std::vector<std::string>{"b"}));
  }

  // fan-out, detach, completion, late subscriber gets completion at once
  {
    publish_subject<int> subject;
    std::vector<int> a, b;
    int a_done = 0, b_done = 0;
    auto s1 = subject.subscribe([&](int v){ a.push_back(v); }, {}, [&]{ ++a_done; });
    auto s2 = subject.subscribe([&](int v){ b.push_back(v); }, {}, [&]{ ++b_done; });
    subject.on_next(1);
    s2.dispose();
    subject.on_next(2);
    subject.on_completed();
    subject.on_next(3);
    assert((a == std::vector<int>{1, 2}) && a_done == 1);
    assert((b == std::vector<int>{1}) && b_done == 0);
    assert(subject.is_terminated() && !subject.has_observers());

    bool late_done = false;
    auto s3 = subject.subscribe([](int){ assert(false); }, {}, [&]{ late_done = true; });
    assert(late_done && "Late subscriber must see the terminal event immediately");
  }

  // the stored error is replayed to late subscribers
  {
    publish_subject<int> subject;
    subject.on_error(std::make_exception_ptr(std::runtime_error("down")));
    std::string msg;
    auto sub = subject.subscribe([](int){}, [&](std::exception_ptr e){
      try { std::rethrow_exception(e); } catch (const std::exception& ex) { msg = ex.what(); }
    });
    assert(msg == "down");
  }

  // detaching during an in-flight emission: that emission is still delivered,
  // the next one is not
  {
    publish_subject<int> subject;
    disposable s2;
    std::vector<int> a, b;
    auto s1 = subject.subscribe([&](int v){
      a.push_back(v);
      s2.dispose();
    });
    s2 = subject.subscribe([&](int v){ b.push_back(v); });
    subject.on_next(1);
    subject.on_next(2);
    assert((a == std::vector<int>{1, 2}));
    assert((b == std::vector<int>{1}) && "Snapshot taken before forwarding still includes b");
  }

  // attaching during an emission: the new subscriber sees the next one only
  {
    publish_subject<int> subject;
    std::vector<disposable> extra;
    std::vector<int> late;
    auto s1 = subject.subscribe([&](int){
      if (extra.empty()) extra.push_back(subject.subscribe([&](int v){ late.push_back(v); }));
    });
    subject.on_next(1);
    subject.on_next(2);
    assert((late == std::vector<int>{2}));
  }

  // a subscriber may complete the subject from inside its callback
  {
    publish_subject<int> subject;
    int done = 0;
    auto s1 = subject.subscribe([&](int v){ if (v == 2) subject.on_completed(); }, {}, [&]{ ++done; });
    auto s2 = subject.subscribe([](int){}, {}, [&]{ ++done; });
    subject.on_next(1);
    subject.on_next(2);
    assert(done == 2);
  }

  // handles may outlive the subject
  {
    disposable sub;
    {
      publish_subject<int> subject;
      sub = subject.subscribe([](int){});
    }
    sub.dispose();
  }

  std::cout << "[publish_subject_tests] OK\n";
  return 0;
}
