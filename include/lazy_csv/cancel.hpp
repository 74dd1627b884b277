#pragma once
#include <atomic>

#include "lazy_csv/errors.hpp"

namespace lc {

// Cooperative cancellation. May be tripped from any thread; checked by the
// fetch loop at row boundaries and before each pass.
class CancelToken {
public:
  void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
  bool cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }
  void check() const {
    if (cancelled()) throw Cancelled();
  }

private:
  std::atomic<bool> cancelled_{false};
};

}
