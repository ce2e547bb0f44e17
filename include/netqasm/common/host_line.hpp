#pragma once

#include <cstdint>
#include <source_location>
#include <string>

namespace netqasm {

// Location in host code (application source or a text subroutine) that
// produced an instruction. Used for diagnostics only.
struct HostLine {
  std::string file;
  uint32_t line = 0;

  auto operator==(const HostLine&) const -> bool = default;

  static auto FromSourceLocation(const std::source_location& loc) -> HostLine {
    return HostLine{.file = loc.file_name(), .line = loc.line()};
  }
};

}  // namespace netqasm
