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

// Placeholder element type of a completable stream. Never emitted.
struct no_value {};

class completable_observer {
public:
  explicit completable_observer(observer<no_value> o)
    : o_(std::move(o)), guard_(std::make_shared<terminal_guard>()) {}

  void completed() const {
    if (!close()) return;
    o_.completed();
  }

  void failure(std::exception_ptr e) const {
    if (!close()) return;
    o_.error(std::move(e));
  }

private:
  bool close() const {
    if (guard_->try_terminate()) return true;
    diagnostics::report_violation(violation::terminal_after_terminal, "completable");
    return false;
  }

  observer<no_value> o_;
  std::shared_ptr<terminal_guard> guard_;
};

// Completion or error, no value channel.
class completable {
public:
  using OnDone = std::function<void()>;
  using OnErr  = std::function<void(std::exception_ptr)>;
  using activation = std::function<disposable(completable_observer)>;

  static completable create(activation fn) {
    return completable(observable<no_value>::create([fn = std::move(fn)](observer<no_value> o) {
      return fn(completable_observer(std::move(o)));
    }));
  }

  static completable from_observable_unchecked(observable<no_value> src) {
    return completable(std::move(src));
  }

  disposable subscribe(OnDone on_done, OnErr on_err = {}) const {
    return src_.subscribe(nullptr, std::move(on_err), std::move(on_done));
  }

  observable<no_value> as_observable() const { return src_; }

private:
  explicit completable(observable<no_value> src) : src_(std::move(src)) {}

  observable<no_value> src_;
};

} // namespace rill
