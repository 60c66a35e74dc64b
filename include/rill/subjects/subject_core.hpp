#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <rill/core/diagnostics.hpp>
#include <rill/core/disposable.hpp>
#include <rill/core/event.hpp>
#include <rill/core/log.hpp>
#include <rill/core/observable.hpp>
#include <rill/core/observer.hpp>
#include <rill/core/terminal_guard.hpp>

namespace rill {
namespace detail {

// Replay policies: what a newly attached subscriber sees first.

template <class T>
struct replay_none {
  static constexpr bool after_terminal = false;
  void record(const T&) {}
  std::vector<T> snapshot() const { return {}; }
};

template <class T>
struct replay_latest {
  static constexpr bool after_terminal = false;
  explicit replay_latest(T seed) : latest(std::move(seed)) {}
  void record(const T& v) { latest = v; }
  std::vector<T> snapshot() const { return std::vector<T>(1, latest); }
  T latest;
};

template <class T>
struct replay_buffer {
  static constexpr bool after_terminal = true;
  explicit replay_buffer(std::size_t cap) : capacity(cap) {}
  void record(const T& v) {
    if (capacity == 0) return;
    if (buf.size() == capacity) buf.pop_front();
    buf.push_back(v);
  }
  std::vector<T> snapshot() const { return std::vector<T>(buf.begin(), buf.end()); }
  std::size_t capacity;
  std::deque<T> buf;
};

// One attached subscriber. Events for it go through a small queue: the
// thread that finds the entry idle owns delivery and drains the queue,
// others enqueue and return. Callbacks never run under a lock, and two
// events never interleave for one subscriber.
template <class T>
struct subject_entry {
  explicit subject_entry(observer<T> o) : down(std::move(o)) {}

  void deliver(event<T> ev) {
    {
      std::lock_guard<std::mutex> lock(m);
      pending.push_back(std::move(ev));
      if (busy) return;
      busy = true;
    }
    drain();
  }

  // Caller must own delivery (busy set by it).
  void drain() {
    for (;;) {
      std::optional<event<T>> ev;
      {
        std::lock_guard<std::mutex> lock(m);
        if (pending.empty()) {
          busy = false;
          return;
        }
        ev.emplace(std::move(pending.front()));
        pending.pop_front();
      }
      try {
        if (ev->is_next() ? guard.is_open() : guard.try_terminate()) {
          down.on(*ev);
        }
      } catch (...) {
        {
          std::lock_guard<std::mutex> lock(m);
          busy = false;
        }
        throw;
      }
    }
  }

  std::mutex m;
  std::deque<event<T>> pending;
  bool busy{false};
  terminal_guard guard;
  observer<T> down;
};

// Shared state of every subject flavour. Lives behind a shared_ptr so
// handles and observables may outlive the subject object itself.
template <class T, class Replay>
class subject_core : public std::enable_shared_from_this<subject_core<T, Replay>> {
public:
  using entry = subject_entry<T>;

  explicit subject_core(Replay replay, const char* name)
    : replay_(std::move(replay)), name_(name) {}

  subject_core(const subject_core&) = delete;
  subject_core& operator=(const subject_core&) = delete;

  observable<T> as_observable() {
    std::weak_ptr<subject_core> weak = this->shared_from_this();
    return observable_access<T>::unguarded([weak](observer<T> o) -> disposable {
      if (auto self = weak.lock()) return self->attach(std::move(o));
      // Subject is gone: nothing will ever be emitted.
      return disposable{};
    });
  }

  void on_next(const T& v) {
    std::vector<std::shared_ptr<entry>> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!guard_.is_open()) {
        diagnostics::report_violation(violation::event_after_terminal, name_);
        return;
      }
      replay_.record(v);
      local.reserve(entries_.size());
      for (auto& kv : entries_) local.push_back(kv.second);
    }
    const auto ev = event<T>::next(v);
    for (auto& e : local) e->deliver(ev);
  }

  void on_error(std::exception_ptr e) { terminate(event<T>::error(std::move(e))); }
  void on_completed() { terminate(event<T>::completed()); }

  void on(const event<T>& ev) {
    if (ev.is_next()) on_next(ev.value());
    else terminate(ev);
  }

  bool has_observers() const {
    std::lock_guard<std::mutex> lock(m_);
    return !entries_.empty();
  }

  bool is_terminated() const { return !guard_.is_open(); }

  // Runs f(replay state, stored terminal event or nullptr) under the lock.
  template <class F>
  decltype(auto) inspect(F&& f) const {
    std::lock_guard<std::mutex> lock(m_);
    return std::forward<F>(f)(replay_, stop_ ? &*stop_ : nullptr);
  }

private:
  disposable attach(observer<T> o) {
    auto e = std::make_shared<entry>(std::move(o));
    std::vector<T> replay;
    std::optional<event<T>> stop;
    std::uint64_t id = 0;

    std::unique_lock<std::mutex> lock(m_);
    if (guard_.is_open() || Replay::after_terminal) replay = replay_.snapshot();
    if (guard_.is_open()) {
      id = next_id_++;
      entries_.emplace(id, e);
    } else {
      stop = stop_;
    }
    // Queued and claimed before the table lock is released: an emission
    // that snapshots this entry lands behind the replayed values.
    {
      std::lock_guard<std::mutex> queue(e->m);
      for (auto& v : replay) e->pending.push_back(event<T>::next(std::move(v)));
      if (stop) e->pending.push_back(*stop);
      e->busy = true;
    }
    lock.unlock();

    e->drain();
    if (stop) return disposable{};

    std::weak_ptr<subject_core> weak = this->shared_from_this();
    return disposable([weak, id] {
      if (auto self = weak.lock()) self->detach(id);
    });
  }

  void detach(std::uint64_t id) {
    std::shared_ptr<entry> gone;
    {
      std::lock_guard<std::mutex> lock(m_);
      auto it = entries_.find(id);
      if (it == entries_.end()) return;
      gone = std::move(it->second);
      entries_.erase(it);
    }
    // gone is released outside the lock; its callbacks may own resources.
  }

  void terminate(const event<T>& ev) {
    std::map<std::uint64_t, std::shared_ptr<entry>> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!guard_.try_terminate()) {
        diagnostics::report_violation(violation::terminal_after_terminal, name_);
        return;
      }
      stop_ = ev;
      local.swap(entries_);
    }
    log::logger()->debug("{} terminated ({}), {} subscriber(s) notified",
                         name_, ev.is_error() ? "error" : "completed", local.size());
    for (auto& kv : local) kv.second->deliver(ev);
  }

  mutable std::mutex m_;
  std::map<std::uint64_t, std::shared_ptr<entry>> entries_;
  std::uint64_t next_id_{0};
  terminal_guard guard_;
  std::optional<event<T>> stop_;
  Replay replay_;
  const char* name_;
};

// Public surface shared by the subject flavours.
template <class T, class Replay>
class subject_base {
public:
  using value_type = T;
  using OnNext = typename observer<T>::OnNext;
  using OnErr  = typename observer<T>::OnErr;
  using OnDone = typename observer<T>::OnDone;

  subject_base(const subject_base&) = delete;
  subject_base& operator=(const subject_base&) = delete;

  void on_next(const T& v) { core_->on_next(v); }
  void on_error(std::exception_ptr e) { core_->on_error(std::move(e)); }
  void on_completed() { core_->on_completed(); }
  void on(const event<T>& ev) { core_->on(ev); }

  observable<T> as_observable() const { return core_->as_observable(); }

  disposable subscribe(observer<T> obs) const {
    return as_observable().subscribe(std::move(obs));
  }

  disposable subscribe(OnNext on_next, OnErr on_err = {}, OnDone on_done = {}) const {
    return as_observable().subscribe(std::move(on_next), std::move(on_err), std::move(on_done));
  }

  void subscribe(disposal_bag& bag, OnNext on_next, OnErr on_err = {}, OnDone on_done = {}) const {
    as_observable().subscribe(bag, std::move(on_next), std::move(on_err), std::move(on_done));
  }

  bool has_observers() const { return core_->has_observers(); }
  bool is_terminated() const { return core_->is_terminated(); }

protected:
  using core_type = subject_core<T, Replay>;

  subject_base(Replay replay, const char* name)
    : core_(std::make_shared<core_type>(std::move(replay), name)) {}
  ~subject_base() = default;

  std::shared_ptr<core_type> core_;
};

} // namespace detail
} // namespace rill
