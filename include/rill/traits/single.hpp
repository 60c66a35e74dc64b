#pragma once
#include <exception>
#include <functional>
#include <memory>
#include <utility>

#include <rill/core/diagnostics.hpp>
#include <rill/core/disposable.hpp>
#include <rill/core/observable.hpp>
#include <rill/core/terminal_guard.hpp>

namespace rill {

// Emission side of a single: exactly one of success(v) or failure(e).
// Anything produced after that is dropped and reported as a violation.
template <class T>
class single_observer {
public:
  explicit single_observer(observer<T> o)
    : o_(std::move(o)), guard_(std::make_shared<terminal_guard>()) {}

  void success(const T& v) const {
    if (!guard_->try_terminate()) {
      diagnostics::report_violation(violation::value_after_single, "single");
      return;
    }
    o_.next(v);
    o_.completed();
  }

  void failure(std::exception_ptr e) const {
    if (!guard_->try_terminate()) {
      diagnostics::report_violation(violation::value_after_single, "single");
      return;
    }
    o_.error(std::move(e));
  }

private:
  observer<T> o_;
  std::shared_ptr<terminal_guard> guard_;
};

// Exactly one value or an error. Seen as a stream it is Next(v) followed by
// Completed, or Error.
template <class T>
class single {
public:
  using value_type = T;
  using OnSuccess = std::function<void(const T&)>;
  using OnErr     = std::function<void(std::exception_ptr)>;
  using activation = std::function<disposable(single_observer<T>)>;

  static single create(activation fn) {
    return single(observable<T>::create([fn = std::move(fn)](observer<T> o) {
      return fn(single_observer<T>(std::move(o)));
    }));
  }

  // Trusts the stream to honour the contract; see as_single() for checking.
  static single from_observable_unchecked(observable<T> src) { return single(std::move(src)); }

  disposable subscribe(OnSuccess on_success, OnErr on_err = {}) const {
    return src_.subscribe(std::move(on_success), std::move(on_err));
  }

  observable<T> as_observable() const { return src_; }

private:
  explicit single(observable<T> src) : src_(std::move(src)) {}

  observable<T> src_;
};

template <class T>
inline single<T> make_single(T v) {
  return single<T>::create([v = std::move(v)](single_observer<T> o) {
    o.success(v);
    return disposable{};
  });
}

} // namespace rill
