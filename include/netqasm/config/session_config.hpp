#pragma once

#include <cstdint>
#include <string>

namespace netqasm::config {

// Settings of one application session, as read from netqasm.toml or given
// on the command line.
struct SessionConfig {
  std::string flavour = "vanilla";
  uint16_t app_id = 0;
  double angle_tolerance = 1e-9;
  std::string log_level = "info";

  auto operator==(const SessionConfig&) const -> bool = default;
};

}  // namespace netqasm::config
