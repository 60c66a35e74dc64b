#pragma once
#include <utility>

#include <rill/subjects/behavior_subject.hpp>
#include <rill/subjects/publish_subject.hpp>

namespace rill {

// Relays are subjects that can never terminate: the producer side only has
// accept(). Subscribers may still see nothing but values.

template <class T>
class publish_relay {
public:
  using value_type = T;
  using OnNext = typename observer<T>::OnNext;

  publish_relay() = default;
  publish_relay(const publish_relay&) = delete;
  publish_relay& operator=(const publish_relay&) = delete;

  void accept(const T& v) { subj_.on_next(v); }

  observable<T> as_observable() const { return subj_.as_observable(); }
  disposable subscribe(OnNext on_next) const { return subj_.subscribe(std::move(on_next)); }
  disposable subscribe(observer<T> obs) const { return subj_.subscribe(std::move(obs)); }
  void subscribe(disposal_bag& bag, OnNext on_next) const { subj_.subscribe(bag, std::move(on_next)); }
  bool has_observers() const { return subj_.has_observers(); }

private:
  publish_subject<T> subj_;
};

template <class T>
class behavior_relay {
public:
  using value_type = T;
  using OnNext = typename observer<T>::OnNext;

  explicit behavior_relay(T seed) : subj_(std::move(seed)) {}
  behavior_relay(const behavior_relay&) = delete;
  behavior_relay& operator=(const behavior_relay&) = delete;

  void accept(const T& v) { subj_.on_next(v); }
  T value() const { return subj_.value(); }

  observable<T> as_observable() const { return subj_.as_observable(); }
  disposable subscribe(OnNext on_next) const { return subj_.subscribe(std::move(on_next)); }
  disposable subscribe(observer<T> obs) const { return subj_.subscribe(std::move(obs)); }
  void subscribe(disposal_bag& bag, OnNext on_next) const { subj_.subscribe(bag, std::move(on_next)); }
  bool has_observers() const { return subj_.has_observers(); }

private:
  behavior_subject<T> subj_;
};

} // namespace rill
