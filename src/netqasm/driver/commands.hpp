#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "netqasm/config/session_config.hpp"

namespace netqasm::driver {

// Binary subroutines are recognized by this extension.
inline constexpr std::string_view kBinaryExtension = ".nqb";

struct CommandInput {
  config::SessionConfig config;
  std::string file;
  std::optional<std::string> output;
  int32_t outcome = 0;
  int32_t incoming_message = 0;
};

auto CheckCommand(const CommandInput& input) -> int;
auto PrintCommand(const CommandInput& input) -> int;
auto EncodeCommand(const CommandInput& input) -> int;
auto DecodeCommand(const CommandInput& input) -> int;
auto RunCommand(const CommandInput& input) -> int;

}  // namespace netqasm::driver
