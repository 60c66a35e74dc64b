#pragma once
#include <cstddef>
#include <exception>
#include <utility>
#include <variant>

namespace rill {

struct completed_t {};

enum class event_kind { next, error, completed };

// Exactly one of Next(T), Error(std::exception_ptr), Completed.
template <class T>
class event {
public:
  using value_type = T;

  static event next(T v) { return event(std::in_place_index<0>, std::move(v)); }
  static event error(std::exception_ptr e) { return event(std::in_place_index<1>, std::move(e)); }
  static event completed() { return event(std::in_place_index<2>, completed_t{}); }

  event_kind kind() const noexcept { return static_cast<event_kind>(data_.index()); }

  bool is_next() const noexcept { return data_.index() == 0; }
  bool is_error() const noexcept { return data_.index() == 1; }
  bool is_completed() const noexcept { return data_.index() == 2; }
  bool is_terminal() const noexcept { return !is_next(); }

  // Preconditions: is_next() / is_error() respectively.
  const T& value() const { return std::get<0>(data_); }
  const std::exception_ptr& error_ptr() const { return std::get<1>(data_); }

private:
  template <std::size_t I, class A>
  event(std::in_place_index_t<I> tag, A&& a) : data_(tag, std::forward<A>(a)) {}

  std::variant<T, std::exception_ptr, completed_t> data_;
};

} // namespace rill
