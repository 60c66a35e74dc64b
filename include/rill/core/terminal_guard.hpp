#pragma once
#include <atomic>
#include <cstdint>

namespace rill {

// Once-only latch behind every "at most one terminal event" guarantee.
// open -> terminated (error/completed forwarded) or open -> disposed
// (subscriber went away). Either transition happens at most once.
class terminal_guard {
public:
  enum class state : std::uint8_t { open, terminated, disposed };

  terminal_guard() noexcept = default;

  terminal_guard(const terminal_guard&) = delete;
  terminal_guard& operator=(const terminal_guard&) = delete;

  // True for exactly one caller, and only while open.
  bool try_terminate() noexcept { return transition(state::terminated); }
  bool try_dispose() noexcept { return transition(state::disposed); }

  state current() const noexcept { return s_.load(std::memory_order_acquire); }

  bool is_open() const noexcept { return current() == state::open; }
  bool is_terminated() const noexcept { return current() == state::terminated; }
  bool is_disposed() const noexcept { return current() == state::disposed; }

private:
  bool transition(state to) noexcept {
    auto expected = state::open;
    return s_.compare_exchange_strong(expected, to,
                                      std::memory_order_acq_rel,
                                      std::memory_order_acquire);
  }

  std::atomic<state> s_{state::open};
};

} // namespace rill
