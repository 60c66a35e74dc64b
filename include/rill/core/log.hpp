#pragma once
#include <memory>
#include <mutex>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rill {
namespace log {

inline constexpr const char* logger_name = "rill";

namespace detail {
struct holder {
  std::mutex m;
  std::shared_ptr<spdlog::logger> lg;
};

inline holder& instance() {
  static holder h;
  return h;
}
} // namespace detail

// Library logger ("rill"). Created lazily on stderr unless the application
// registered its own logger under the same name or called set_logger().
inline std::shared_ptr<spdlog::logger> logger() {
  auto& h = detail::instance();
  std::lock_guard<std::mutex> lock(h.m);
  if (!h.lg) {
    h.lg = spdlog::get(logger_name);
    if (!h.lg) {
      h.lg = spdlog::stderr_color_mt(logger_name);
      h.lg->set_level(spdlog::level::warn);
    }
  }
  return h.lg;
}

// Route library output to the host's sinks.
inline void set_logger(std::shared_ptr<spdlog::logger> lg) {
  auto& h = detail::instance();
  std::lock_guard<std::mutex> lock(h.m);
  h.lg = std::move(lg);
}

} // namespace log
} // namespace rill
