#pragma once
#include <cstddef>
#include <vector>

#include <rill/subjects/subject_core.hpp>

namespace rill {

// Replays up to `buffer_size` latest values to new subscribers, also after
// termination (followed by the terminal event).
template <class T>
class replay_subject : public detail::subject_base<T, detail::replay_buffer<T>> {
  using base = detail::subject_base<T, detail::replay_buffer<T>>;

public:
  explicit replay_subject(std::size_t buffer_size)
    : base(detail::replay_buffer<T>(buffer_size), "replay_subject") {}

  std::vector<T> buffered() const {
    return this->core_->inspect([](const detail::replay_buffer<T>& r, const event<T>*) {
      return r.snapshot();
    });
  }
};

} // namespace rill
