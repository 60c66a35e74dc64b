#pragma once
#include <exception>
#include <type_traits>
#include <utility>

#include <rill/core/disposable.hpp>
#include <rill/core/observable.hpp>

namespace rill {

// One value, then completed.
template <class T>
inline observable<std::decay_t<T>> just(T&& v) {
  using U = std::decay_t<T>;
  return observable<U>::create([v = U(std::forward<T>(v))](observer<U> o) {
    o.next(v);
    o.completed();
    return disposable{};
  });
}

template <class T>
inline observable<T> empty() {
  return observable<T>::create([](observer<T> o) {
    o.completed();
    return disposable{};
  });
}

// Never emits and never terminates.
template <class T>
inline observable<T> never() {
  return observable<T>::create([](observer<T>) { return disposable{}; });
}

template <class T>
inline observable<T> fail(std::exception_ptr e) {
  return observable<T>::create([e](observer<T> o) {
    o.error(e);
    return disposable{};
  });
}

// The factory runs on every subscribe; its stream is subscribed in turn.
template <class F,
          class O = std::invoke_result_t<F&>,
          class T = typename O::value_type>
inline observable<T> defer(F factory) {
  return observable<T>::create([factory = std::move(factory)](observer<T> o) mutable {
    O inner = factory();
    return inner.subscribe(std::move(o));
  });
}

} // namespace rill
