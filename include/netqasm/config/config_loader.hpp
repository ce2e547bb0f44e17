#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "netqasm/config/session_config.hpp"

namespace netqasm::config {

inline constexpr std::string_view kConfigFileName = "netqasm.toml";

// Search for netqasm.toml starting from dir, going up to parent dirs
// Returns nullopt if not found
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse netqasm.toml. Missing sections and keys keep their defaults.
// Throws DiagnosticException on parse errors or invalid values.
auto LoadConfig(const std::filesystem::path& config_path) -> SessionConfig;

// Same as LoadConfig for text already in memory; `source` names it in
// diagnostics.
auto ParseConfig(std::string_view text, std::string_view source = "<string>")
    -> SessionConfig;

}  // namespace netqasm::config
