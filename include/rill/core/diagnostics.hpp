#pragma once
#include <atomic>
#include <cstdint>
#include <string_view>

#include <rill/core/config.hpp>
#include <rill/core/log.hpp>

namespace rill {

// Caller bugs observed by the core. They never reach a subscriber as an
// extra terminal event; they are counted and logged instead.
enum class violation {
  event_after_terminal,    // next() after error/completed was forwarded
  terminal_after_terminal, // a second error/completed
  value_after_single,      // single/maybe produced more than one result
};

inline const char* to_string(violation v) noexcept {
  switch (v) {
    case violation::event_after_terminal:    return "event after terminal";
    case violation::terminal_after_terminal: return "terminal after terminal";
    case violation::value_after_single:      return "more than one result";
  }
  return "unknown";
}

namespace diagnostics {

namespace detail {
struct counters {
  std::atomic<std::uint64_t> violations{0};
  std::atomic<std::uint64_t> release_failures{0};
};

inline counters& get() {
  static counters c;
  return c;
}
} // namespace detail

inline std::uint64_t violation_count() noexcept {
  return detail::get().violations.load(std::memory_order_acquire);
}

inline std::uint64_t release_failures() noexcept {
  return detail::get().release_failures.load(std::memory_order_acquire);
}

inline void report_violation(violation v, std::string_view where) {
  detail::get().violations.fetch_add(1, std::memory_order_acq_rel);
  if (rill::detail::flags().report_violations.load(std::memory_order_relaxed)) {
    log::logger()->warn("contract violation in {}: {}", where, to_string(v));
  }
}

inline void report_dropped(std::string_view where) {
  if (rill::detail::flags().trace_dropped.load(std::memory_order_relaxed)) {
    log::logger()->trace("{}: event dropped after dispose", where);
  }
}

inline void report_release_failure(std::string_view what) noexcept {
  detail::get().release_failures.fetch_add(1, std::memory_order_acq_rel);
  try {
    log::logger()->error("release action threw: {}", what);
  } catch (const std::exception&) {
    // logging itself failed; the counter above still records it
  }
}

} // namespace diagnostics
} // namespace rill
