#include <rill/rill.hpp>
#include <iostream>
#include <string>

using namespace rill;

int main() {
  behavior_subject<std::string> status("idle");

  auto s1 = status.subscribe([](const std::string& s){ std::cout << "A " << s << "\n"; });
  status.on_next("loading");

  // B joins late and immediately sees "loading"
  auto s2 = status.subscribe([](const std::string& s){ std::cout << "B " << s << "\n"; });
  status.on_next("ready");

  // unsubscribe B and send another event
  s2.dispose();
  status.on_next("only A hears this");

  // terminate the stream
  status.on_completed();

  // new subscribers see on_completed immediately after completion
  auto s3 = status.subscribe(
    [](const std::string& s){ std::cout << "C got: " << s << "\n"; },
    nullptr,
    []{ std::cout << "C completed immediately\n"; }
  );

  return 0;
}
