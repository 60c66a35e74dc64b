#pragma once
#include <memory>
#include <mutex>
#include <utility>

#include <rill/core/diagnostics.hpp>
#include <rill/core/disposable.hpp>
#include <rill/core/event.hpp>
#include <rill/core/observer.hpp>
#include <rill/core/terminal_guard.hpp>

namespace rill {
namespace detail {

// Sits between an activation and its subscriber for the lifetime of one
// subscription. Owns the subscription's terminal_guard and the handle the
// activation returned.
template <class T>
class sink : public std::enable_shared_from_this<sink<T>> {
public:
  explicit sink(observer<T> down, const char* where = "observable")
    : down_(std::move(down)), where_(where) {}

  sink(const sink&) = delete;
  sink& operator=(const sink&) = delete;

  void on(const event<T>& ev) {
    if (ev.is_next()) {
      if (guard_.is_open()) {
        down_.on(ev);
      } else {
        rejected(violation::event_after_terminal);
      }
      return;
    }

    if (!guard_.try_terminate()) {
      rejected(violation::terminal_after_terminal);
      return;
    }
    try {
      down_.on(ev);
    } catch (...) {
      release_upstream();
      throw;
    }
    release_upstream();
  }

  // Subscriber side went away: nothing more is forwarded, no terminal event.
  void dispose() {
    guard_.try_dispose();
    release_upstream();
  }

  // Handle returned by the activation. May arrive after the subscription
  // already ended (terminal emitted synchronously inside the activation).
  void set_upstream(disposable d) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!released_) {
        upstream_ = std::move(d);
        return;
      }
    }
    d.dispose();
  }

  // The capability handed to the activation.
  observer<T> as_observer() {
    auto self = this->shared_from_this();
    return observer<T>([self](const event<T>& ev) { self->on(ev); });
  }

  const terminal_guard& guard() const noexcept { return guard_; }

private:
  void release_upstream() {
    disposable local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (released_) return;
      released_ = true;
      local = std::move(upstream_);
    }
    local.dispose();
  }

  // Events losing against a closed guard: after a terminal it is a caller
  // bug, after dispose it is the expected cancellation race.
  void rejected(violation v) {
    if (guard_.is_disposed()) {
      diagnostics::report_dropped(where_);
    } else {
      diagnostics::report_violation(v, where_);
    }
  }

  observer<T> down_;
  const char* where_;
  terminal_guard guard_;

  std::mutex m_;
  bool released_{false};
  disposable upstream_;
};

} // namespace detail
} // namespace rill
