#pragma once
#include <atomic>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

#include <rill/core/log.hpp>

namespace rill {

// Runtime knobs. Everything here only affects diagnostics output;
// delivery semantics never depend on configuration.
struct config {
  spdlog::level::level_enum level{spdlog::level::warn};
  // Log contract violations (they are counted either way).
  bool report_violations{true};
  // Trace events dropped because the subscription was already disposed.
  bool trace_dropped{false};
};

namespace detail {
struct runtime_flags {
  std::atomic<bool> report_violations{true};
  std::atomic<bool> trace_dropped{false};
};

inline runtime_flags& flags() {
  static runtime_flags f;
  return f;
}
} // namespace detail

inline void configure(const config& c) {
  log::logger()->set_level(c.level);
  detail::flags().report_violations.store(c.report_violations, std::memory_order_relaxed);
  detail::flags().trace_dropped.store(c.trace_dropped, std::memory_order_relaxed);
}

// Honours SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=rill=debug).
inline void configure_from_env() {
  log::logger(); // make sure "rill" is registered before levels are applied
  spdlog::cfg::load_env_levels();
}

} // namespace rill
