#pragma once
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

#include <rill/core/disposable.hpp>
#include <rill/core/log.hpp>
#include <rill/core/observable.hpp>
#include <rill/core/scheduler.hpp>
#include <rill/subjects/replay_subject.hpp>

namespace rill {

// UI-facing wrapper over a stream:
// - callbacks always run on the given executor (main/UI context);
// - an error is replaced by the fallback value followed by completion;
// - the source is connected once, on the first subscription, and shared by
//   every subscriber; late subscribers get the latest value first.
template <class T>
class driver {
public:
  using value_type = T;
  using OnNext = std::function<void(const T&)>;
  using OnDone = std::function<void()>;

  driver(observable<T> source, T fallback, std::shared_ptr<executor> ctx)
    : hub_(std::make_shared<hub>(std::move(source), std::move(fallback)))
    , ctx_(std::move(ctx)) {}

  observable<T> as_observable() const {
    auto h = hub_;
    auto ctx = ctx_;
    return observable<T>::create([h, ctx](observer<T> o) {
      auto alive = std::make_shared<std::atomic<bool>>(true);

      disposable inner = h->subj.subscribe(observer<T>([ctx, o, alive](const event<T>& ev) {
        if (!alive->load(std::memory_order_acquire)) return;
        ctx->post([o, ev, alive] {
          if (!alive->load(std::memory_order_acquire)) return;
          o.on(ev);
        });
      }));
      h->connect();

      return make_composite(
        disposable([alive] { alive->store(false, std::memory_order_release); }),
        std::move(inner));
    });
  }

  // No error channel: errors never reach driver subscribers.
  disposable subscribe(OnNext on_next, OnDone on_done = {}) const {
    return as_observable().subscribe(std::move(on_next), nullptr, std::move(on_done));
  }

  bool is_connected() const { return hub_->connected.load(std::memory_order_acquire); }

private:
  struct hub : std::enable_shared_from_this<hub> {
    hub(observable<T> src, T fb)
      : source(std::move(src)), fallback(std::move(fb)), subj(1) {}

    void connect() {
      if (connected.exchange(true, std::memory_order_acq_rel)) return;

      std::weak_ptr<hub> weak = this->shared_from_this();
      disposable up = source.subscribe(
        [weak](const T& v) {
          if (auto self = weak.lock()) self->subj.on_next(v);
        },
        [weak](std::exception_ptr) {
          auto self = weak.lock();
          if (!self) return;
          log::logger()->warn("driver source failed, substituting fallback value");
          self->subj.on_next(self->fallback);
          self->subj.on_completed();
        },
        [weak] {
          if (auto self = weak.lock()) self->subj.on_completed();
        });

      std::lock_guard<std::mutex> lock(m);
      upstream = std::move(up);
    }

    observable<T> source;
    T fallback;
    replay_subject<T> subj;
    std::atomic<bool> connected{false};
    std::mutex m;
    disposable upstream;
  };

  std::shared_ptr<hub> hub_;
  std::shared_ptr<executor> ctx_;
};

template <class T>
inline driver<T> as_driver(observable<T> source, T fallback, std::shared_ptr<executor> ctx) {
  return driver<T>(std::move(source), std::move(fallback), std::move(ctx));
}

} // namespace rill
