#pragma once
#include <cstddef>
#include <mutex>
#include <vector>

#include <rill/core/disposable.hpp>

namespace rill {

// Owns many handles and disposes all of them on its own teardown.
// Keep one as a field of the object whose lifetime scopes the subscriptions.
class disposal_bag {
public:
  disposal_bag() = default;

  // Stores the handle, or disposes it right away if the bag is already gone.
  void insert(disposable d) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!disposed_) {
        items_.push_back(std::move(d));
        return;
      }
    }
    d.dispose();
  }

  // First caller takes the handles and disposes them outside the lock, so a
  // release action may call back into this bag.
  void dispose() {
    std::vector<disposable> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (disposed_) return;
      disposed_ = true;
      local.swap(items_);
    }
    for (auto& d : local) d.dispose();
  }

  bool is_disposed() const {
    std::lock_guard<std::mutex> lock(m_);
    return disposed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(m_);
    return items_.size();
  }

  ~disposal_bag() { dispose(); }

  disposal_bag(const disposal_bag&)            = delete;
  disposal_bag& operator=(const disposal_bag&) = delete;

  disposal_bag(disposal_bag&&)            = delete;
  disposal_bag& operator=(disposal_bag&&) = delete;

private:
  mutable std::mutex m_;
  bool disposed_{false};
  std::vector<disposable> items_;
};

} // namespace rill
