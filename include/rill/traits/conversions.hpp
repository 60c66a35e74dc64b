#pragma once
#include <memory>
#include <optional>
#include <utility>

#include <rill/core/errors.hpp>
#include <rill/core/observable.hpp>
#include <rill/traits/completable.hpp>
#include <rill/traits/maybe.hpp>
#include <rill/traits/single.hpp>

namespace rill {

// Narrow an arbitrary stream to a bounded contract. Breaking the contract
// is reported on the error channel as a sequence_error.

namespace detail {
template <class T>
struct narrowing_state {
  std::optional<T> held;
  bool done{false};
};
} // namespace detail

template <class T>
inline single<T> as_single(observable<T> src) {
  return single<T>::create([src = std::move(src)](single_observer<T> out) {
    auto st = std::make_shared<detail::narrowing_state<T>>();
    return src.subscribe(
      [st, out](const T& v) {
        if (st->done) return;
        if (st->held) {
          st->done = true;
          out.failure(make_error(sequence_errc::more_than_one_element));
          return;
        }
        st->held.emplace(v);
      },
      [st, out](std::exception_ptr e) {
        if (st->done) return;
        st->done = true;
        out.failure(std::move(e));
      },
      [st, out] {
        if (st->done) return;
        st->done = true;
        if (st->held) out.success(*st->held);
        else out.failure(make_error(sequence_errc::no_elements));
      });
  });
}

template <class T>
inline maybe<T> as_maybe(observable<T> src) {
  return maybe<T>::create([src = std::move(src)](maybe_observer<T> out) {
    auto st = std::make_shared<detail::narrowing_state<T>>();
    return src.subscribe(
      [st, out](const T& v) {
        if (st->done) return;
        if (st->held) {
          st->done = true;
          out.failure(make_error(sequence_errc::more_than_one_element));
          return;
        }
        st->held.emplace(v);
      },
      [st, out](std::exception_ptr e) {
        if (st->done) return;
        st->done = true;
        out.failure(std::move(e));
      },
      [st, out] {
        if (st->done) return;
        st->done = true;
        if (st->held) out.success(*st->held);
        else out.completed();
      });
  });
}

// Values are ignored; only the terminal event is kept.
template <class T>
inline completable as_completable(observable<T> src) {
  return completable::create([src = std::move(src)](completable_observer out) {
    return src.subscribe(
      nullptr,
      [out](std::exception_ptr e) { out.failure(std::move(e)); },
      [out] { out.completed(); });
  });
}

} // namespace rill
