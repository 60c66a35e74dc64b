#pragma once
#include <exception>
#include <functional>
#include <memory>
#include <utility>

#include <rill/core/disposable.hpp>
#include <rill/core/disposal_bag.hpp>
#include <rill/core/event.hpp>
#include <rill/core/observer.hpp>
#include <rill/core/sink.hpp>

namespace rill {

template <class T> class observable;

namespace detail {
// Builds an observable whose activation applies its own guarding
// (subjects keep one guard per table entry instead of a sink).
template <class T>
struct observable_access {
  static observable<T> unguarded(std::function<disposable(observer<T>)> impl) {
    return observable<T>(std::move(impl));
  }
};
} // namespace detail

// Cold event stream: the activation runs once per subscribe() call and
// never without one.
template <class T>
class observable {
public:
  using value_type = T;
  using OnNext = typename observer<T>::OnNext;
  using OnErr  = typename observer<T>::OnErr;
  using OnDone = typename observer<T>::OnDone;
  using activation = std::function<disposable(observer<T>)>;

  // Factory: create observable from an activation function.
  // The activation receives a guarded observer: at most one terminal event
  // reaches the subscriber and nothing after it. When the subscription ends
  // (terminal event or dispose) the handle the activation returned is
  // disposed. An activation that throws is reported as an error event.
  static observable create(activation fn) {
    return observable([fn = std::move(fn)](observer<T> down) -> disposable {
      auto s = std::make_shared<detail::sink<T>>(std::move(down));
      try {
        s->set_upstream(fn(s->as_observer()));
      } catch (...) {
        s->on(event<T>::error(std::current_exception()));
        return disposable{};
      }
      return disposable([s] { s->dispose(); });
    });
  }

  disposable subscribe(observer<T> obs) const {
    return impl_(std::move(obs));
  }

  disposable subscribe(OnNext on_next,
                       OnErr  on_err  = {},
                       OnDone on_done = {}) const {
    return subscribe(observer<T>::from(std::move(on_next), std::move(on_err), std::move(on_done)));
  }

  // Subscribes and hands the handle to the bag.
  void subscribe(disposal_bag& bag,
                 OnNext on_next,
                 OnErr  on_err  = {},
                 OnDone on_done = {}) const {
    bag.insert(subscribe(std::move(on_next), std::move(on_err), std::move(on_done)));
  }

private:
  friend struct detail::observable_access<T>;

  explicit observable(activation impl) : impl_(std::move(impl)) {}

  activation impl_;
};

} // namespace rill
