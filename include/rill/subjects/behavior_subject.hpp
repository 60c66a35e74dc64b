#pragma once
#include <exception>
#include <utility>

#include <rill/subjects/subject_core.hpp>

namespace rill {

// Replays the latest value (the seed until something is emitted) to every
// new subscriber, then forwards live events.
template <class T>
class behavior_subject : public detail::subject_base<T, detail::replay_latest<T>> {
  using base = detail::subject_base<T, detail::replay_latest<T>>;

public:
  explicit behavior_subject(T seed)
    : base(detail::replay_latest<T>(std::move(seed)), "behavior_subject") {}

  // Latest value. Rethrows the stored error if the subject failed.
  T value() const {
    return this->core_->inspect([](const detail::replay_latest<T>& r, const event<T>* stop) {
      if (stop && stop->is_error()) std::rethrow_exception(stop->error_ptr());
      return r.latest;
    });
  }
};

} // namespace rill
