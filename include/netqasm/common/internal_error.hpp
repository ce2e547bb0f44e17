#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace netqasm::common {

// Broken invariant inside netqasm itself. Malformed subroutines, bad
// builder calls and processor failures are Diagnostics, never this.
class InternalError : public std::logic_error {
 public:
  InternalError(const char* where, const std::string& detail)
      : std::logic_error(
            fmt::format("netqasm internal error ({}): {}", where, detail)),
        where_(where) {
  }

  [[nodiscard]] auto Where() const -> const char* {
    return where_;
  }

 private:
  const char* where_;
};

[[noreturn]] inline void ThrowInternalError(
    const char* where, const std::string& detail) {
  throw InternalError(where, detail);
}

}  // namespace netqasm::common
