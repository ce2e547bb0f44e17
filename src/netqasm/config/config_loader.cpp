#include "netqasm/config/config_loader.hpp"

#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <spdlog/common.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/config/session_config.hpp"
#include "netqasm/flavour/flavour.hpp"

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace netqasm::config {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void ThrowConfigError(std::string_view source, std::string msg) {
  throw DiagnosticException(
      Diagnostic::HostError(fmt::format("{}: {}", source, msg)));
}

auto FromTable(const toml::table& tbl, std::string_view source)
    -> SessionConfig {
  SessionConfig config;

  // [session] section (optional)
  if (auto session = tbl["session"]) {
    if (auto node = session["flavour"]) {
      auto name = node.value<std::string>();
      if (!name) {
        ThrowConfigError(source, "'session.flavour' must be a string");
      }
      if (!flavour::FlavourByName(*name)) {
        ThrowConfigError(
            source, fmt::format("unknown flavour '{}' in 'session.flavour'",
                                *name));
      }
      config.flavour = *name;
    }
    if (auto node = session["app_id"]) {
      auto app_id = node.value<int64_t>();
      if (!app_id || *app_id < 0 ||
          *app_id > std::numeric_limits<uint16_t>::max()) {
        ThrowConfigError(
            source, "'session.app_id' must be an integer in [0, 65535]");
      }
      config.app_id = static_cast<uint16_t>(*app_id);
    }
  }

  // [compiler] section (optional)
  if (auto compiler = tbl["compiler"]) {
    if (auto node = compiler["angle_tolerance"]) {
      auto tolerance = node.value<double>();
      if (!tolerance || *tolerance < 0.0) {
        ThrowConfigError(
            source, "'compiler.angle_tolerance' must be a non-negative number");
      }
      config.angle_tolerance = *tolerance;
    }
  }

  // [log] section (optional)
  if (auto log = tbl["log"]) {
    if (auto node = log["level"]) {
      auto level = node.value<std::string>();
      if (!level) {
        ThrowConfigError(source, "'log.level' must be a string");
      }
      // spdlog maps unknown names to "off"; only accept that when asked for.
      if (spdlog::level::from_str(*level) == spdlog::level::off &&
          *level != "off") {
        ThrowConfigError(source, fmt::format("unknown log level '{}'", *level));
      }
      config.log_level = *level;
    }
  }

  return config;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> SessionConfig {
  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    ThrowConfigError(
        config_path.string(), fmt::format("failed to parse: {}", e.what()));
  }
  return FromTable(tbl, config_path.string());
}

auto ParseConfig(std::string_view text, std::string_view source)
    -> SessionConfig {
  toml::table tbl;
  try {
    tbl = toml::parse(text, source);
  } catch (const toml::parse_error& e) {
    ThrowConfigError(source, fmt::format("failed to parse: {}", e.what()));
  }
  return FromTable(tbl, source);
}

}  // namespace netqasm::config
