#pragma once
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <utility>

#include <rill/core/diagnostics.hpp>
#include <rill/core/disposable.hpp>
#include <rill/core/observable.hpp>
#include <rill/core/terminal_guard.hpp>

namespace rill {

// Emission side of a maybe: one of success(v), completed() or failure(e).
template <class T>
class maybe_observer {
public:
  explicit maybe_observer(observer<T> o)
    : o_(std::move(o)), guard_(std::make_shared<terminal_guard>()) {}

  void success(const T& v) const {
    if (!close(violation::value_after_single)) return;
    o_.next(v);
    o_.completed();
  }

  void completed() const {
    if (!close(violation::terminal_after_terminal)) return;
    o_.completed();
  }

  void failure(std::exception_ptr e) const {
    if (!close(violation::terminal_after_terminal)) return;
    o_.error(std::move(e));
  }

private:
  bool close(violation kind) const {
    if (guard_->try_terminate()) return true;
    diagnostics::report_violation(kind, "maybe");
    return false;
  }

  observer<T> o_;
  std::shared_ptr<terminal_guard> guard_;
};

// Zero or one value then completion, or an error.
template <class T>
class maybe {
public:
  using value_type = T;
  using OnSuccess = std::function<void(const T&)>;
  using OnErr     = std::function<void(std::exception_ptr)>;
  using OnDone    = std::function<void()>;
  using activation = std::function<disposable(maybe_observer<T>)>;

  static maybe create(activation fn) {
    return maybe(observable<T>::create([fn = std::move(fn)](observer<T> o) {
      return fn(maybe_observer<T>(std::move(o)));
    }));
  }

  static maybe from_observable_unchecked(observable<T> src) { return maybe(std::move(src)); }

  // on_completed only fires on the empty path; a value ends with on_success.
  disposable subscribe(OnSuccess on_success, OnErr on_err = {}, OnDone on_completed = {}) const {
    auto got = std::make_shared<std::atomic<bool>>(false);
    return src_.subscribe(
      [got, on_success = std::move(on_success)](const T& v) {
        got->store(true, std::memory_order_release);
        if (on_success) on_success(v);
      },
      std::move(on_err),
      [got, on_completed = std::move(on_completed)] {
        if (!got->load(std::memory_order_acquire) && on_completed) on_completed();
      });
  }

  observable<T> as_observable() const { return src_; }

private:
  explicit maybe(observable<T> src) : src_(std::move(src)) {}

  observable<T> src_;
};

} // namespace rill
