#pragma once
#include <exception>
#include <functional>
#include <utility>

#include <rill/core/event.hpp>
#include <rill/core/log.hpp>

namespace rill {

// Subscriber capability: a single handler over event<T>.
// next/error/completed are shorthands that build the event and dispatch it.
template <class T>
class observer {
public:
  using handler = std::function<void(const event<T>&)>;
  using OnNext  = std::function<void(const T&)>;
  using OnErr   = std::function<void(std::exception_ptr)>;
  using OnDone  = std::function<void()>;

  observer() = default;
  explicit observer(handler h) : h_(std::move(h)) {}

  // Any callback may be empty. An error nobody listens to is logged.
  static observer from(OnNext on_next, OnErr on_err = {}, OnDone on_done = {}) {
    return observer([on_next = std::move(on_next),
                     on_err  = std::move(on_err),
                     on_done = std::move(on_done)](const event<T>& ev) {
      switch (ev.kind()) {
        case event_kind::next:
          if (on_next) on_next(ev.value());
          break;
        case event_kind::error:
          if (on_err) on_err(ev.error_ptr());
          else log::logger()->debug("unhandled error event");
          break;
        case event_kind::completed:
          if (on_done) on_done();
          break;
      }
    });
  }

  void on(const event<T>& ev) const { if (h_) h_(ev); }

  void next(const T& v) const { on(event<T>::next(v)); }
  void error(std::exception_ptr e) const { on(event<T>::error(std::move(e))); }
  void completed() const { on(event<T>::completed()); }

  explicit operator bool() const noexcept { return static_cast<bool>(h_); }

private:
  handler h_;
};

} // namespace rill
