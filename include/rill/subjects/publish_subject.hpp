#pragma once
#include <rill/subjects/subject_core.hpp>

namespace rill {

// Hot multicast source. A subscriber only sees what is emitted after it
// attached; after termination it receives the terminal event right away.
template <class T>
class publish_subject : public detail::subject_base<T, detail::replay_none<T>> {
  using base = detail::subject_base<T, detail::replay_none<T>>;

public:
  publish_subject() : base(detail::replay_none<T>{}, "publish_subject") {}
};

} // namespace rill
