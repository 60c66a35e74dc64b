#pragma once
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include <rill/core/diagnostics.hpp>

namespace rill {

// RAII token for the release of whatever a subscription acquired.
// - One owner: copying is prohibited, moving transfers the release right.
// - dispose() is idempotent and may race from several threads; the release
//   action runs at most once.
// - By default the destructor disposes (can be disabled).
class disposable {
public:
  using action = std::function<void()>;

  // Empty handle, nothing to release.
  disposable() noexcept = default;

  explicit disposable(action fn, bool dispose_on_destruct = true)
    : state_(fn ? std::make_shared<state>(std::move(fn)) : nullptr)
    , dispose_on_dtor_(dispose_on_destruct && static_cast<bool>(state_)) {}

  disposable(const disposable&) = delete;
  disposable& operator=(const disposable&) = delete;

  disposable(disposable&& other) noexcept
    : state_(std::move(other.state_))
    , dispose_on_dtor_(other.dispose_on_dtor_) {
    other.dispose_on_dtor_ = false;
  }

  disposable& operator=(disposable&& other) noexcept {
    if (this != &other) {
      dispose();
      state_ = std::move(other.state_);
      dispose_on_dtor_ = other.dispose_on_dtor_;
      other.dispose_on_dtor_ = false;
    }
    return *this;
  }

  ~disposable() {
    if (dispose_on_dtor_) dispose();
  }

  // Runs the release action once. Repeated or concurrent calls are no-ops.
  // A throwing action is logged and counted, never rethrown.
  void dispose() noexcept {
    if (!state_) return;
    if (state_->done.exchange(true, std::memory_order_acq_rel)) return;

    action fn = std::move(state_->fn);
    state_->fn = nullptr;
    try {
      fn();
    } catch (const std::exception& e) {
      diagnostics::report_release_failure(e.what());
    } catch (...) {
      diagnostics::report_release_failure("non-standard exception");
    }
  }

  bool is_disposed() const noexcept {
    return !state_ || state_->done.load(std::memory_order_acquire);
  }

  // Drop the release right without running it. Useful when another object
  // took over the responsibility.
  void release() noexcept {
    state_.reset();
    dispose_on_dtor_ = false;
  }

  // Live action still pending.
  explicit operator bool() const noexcept { return !is_disposed(); }

  disposable& dispose_on_destruct(bool v) noexcept {
    dispose_on_dtor_ = v && static_cast<bool>(state_);
    return *this;
  }

  void swap(disposable& other) noexcept {
    using std::swap;
    swap(state_, other.state_);
    swap(dispose_on_dtor_, other.dispose_on_dtor_);
  }

  // Hand the handle over to a bag (or anything with insert(disposable)).
  template <class Bag>
  void disposed_by(Bag& bag) && {
    bag.insert(std::move(*this));
  }

private:
  struct state {
    explicit state(action f) : fn(std::move(f)) {}
    std::atomic<bool> done{false};
    action fn;
  };

  std::shared_ptr<state> state_{};
  bool dispose_on_dtor_{false};
};

template <class F,
          std::enable_if_t<std::is_invocable_v<F&>, int> = 0>
inline disposable make_disposable(F&& f, bool dispose_on_destruct = true) {
  return disposable(disposable::action(std::forward<F>(f)), dispose_on_destruct);
}

inline disposable empty_disposable() noexcept {
  return disposable{};
}

// A handle over a fixed set of children, disposed together exactly once.
// Only an explicit dispose() of the composite reaches the children, so
// release() on it leaves them untouched.
inline disposable make_composite(std::vector<disposable> children) {
  for (auto& d : children) d.dispose_on_destruct(false);
  auto held = std::make_shared<std::vector<disposable>>(std::move(children));
  return disposable([held] {
    for (auto& d : *held) d.dispose();
  });
}

template <class... Ds,
          std::enable_if_t<(std::is_same_v<std::decay_t<Ds>, disposable> && ...), int> = 0>
inline disposable make_composite(Ds&&... ds) {
  std::vector<disposable> v;
  v.reserve(sizeof...(Ds));
  (v.push_back(std::move(ds)), ...);
  return make_composite(std::move(v));
}

} // namespace rill
