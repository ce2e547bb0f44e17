#pragma once

#include <atomic>

namespace netqasm::vm {

// Cancellation flag shared between the executing thread and a controller.
// The only object in the runtime that may be touched from another thread.
class AbortSignal {
 public:
  void Request() {
    requested_.store(true, std::memory_order_release);
  }

  void Reset() {
    requested_.store(false, std::memory_order_release);
  }

  [[nodiscard]] auto IsRequested() const -> bool {
    return requested_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> requested_{false};
};

}  // namespace netqasm::vm
