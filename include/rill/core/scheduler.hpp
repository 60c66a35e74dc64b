#pragma once
#include <functional>
#include <mutex>
#include <queue>
#include <utility>

namespace rill {

// Execution context interface. The core never posts anything itself;
// drivers and adapters layered on top do.
struct executor {
  virtual ~executor() = default;
  virtual void post(std::function<void()> f) = 0;
};

// Runs the work on the calling thread, right away.
struct immediate_executor final : executor {
  void post(std::function<void()> f) override { f(); }
};

// FIFO queue without a thread of its own. The owning thread (a main or UI
// loop) calls drain(); work posted from anywhere runs there.
class serial_queue final : public executor {
public:
  void post(std::function<void()> f) override {
    std::lock_guard<std::mutex> lock(m_);
    q_.push(std::move(f));
  }

  // Runs everything queued so far, including work posted while draining.
  // Returns the number of items executed.
  std::size_t drain() {
    std::size_t n = 0;
    for (;;) {
      std::function<void()> f;
      {
        std::lock_guard<std::mutex> lock(m_);
        if (q_.empty()) break;
        f = std::move(q_.front()); q_.pop();
      }
      f();
      ++n;
    }
    return n;
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(m_);
    return q_.empty();
  }

private:
  mutable std::mutex m_;
  std::queue<std::function<void()>> q_;
};

inline void schedule(executor& ctx, std::function<void()> work) {
  ctx.post(std::move(work));
}

} // namespace rill
