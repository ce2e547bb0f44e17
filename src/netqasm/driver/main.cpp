#include <argparse/argparse.hpp>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include <fmt/core.h>
#include <spdlog/common.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/config/config_loader.hpp"
#include "netqasm/config/session_config.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

void AddInputFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--flavour").help(
      "Instruction flavour: vanilla or nv (overrides netqasm.toml)");
  cmd.add_argument("file").help("Subroutine file (.nqb for binary)");
}

void AddOutputFlag(argparse::ArgumentParser& cmd) {
  cmd.add_argument("-o", "--output").help("Output file").metavar("file");
}

// Config from netqasm.toml when one is found above the working directory.
auto LoadOptionalConfig() -> std::optional<netqasm::config::SessionConfig> {
  auto config_path = netqasm::config::FindConfig();
  if (!config_path) {
    return std::nullopt;
  }
  return netqasm::config::LoadConfig(*config_path);
}

auto BuildInput(
    const argparse::ArgumentParser& cmd,
    const netqasm::config::SessionConfig& config)
    -> netqasm::driver::CommandInput {
  netqasm::driver::CommandInput input{
      .config = config,
      .file = cmd.get<std::string>("file"),
      .output = std::nullopt,
  };
  if (auto flavour = cmd.present<std::string>("--flavour")) {
    input.config.flavour = *flavour;
  }
  if (cmd.is_used("--output")) {
    input.output = cmd.get<std::string>("--output");
  }
  return input;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("netqasm", "0.1.0");
  program.add_description("NetQASM subroutine assembler and runner");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug logging");

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Parse and validate a subroutine");
  AddInputFlags(check_cmd);

  // Subcommand: print
  argparse::ArgumentParser print_cmd("print");
  print_cmd.add_description("Print a subroutine in canonical text form");
  AddInputFlags(print_cmd);
  AddOutputFlag(print_cmd);

  // Subcommand: encode
  argparse::ArgumentParser encode_cmd("encode");
  encode_cmd.add_description("Assemble a text subroutine into binary form");
  AddInputFlags(encode_cmd);
  AddOutputFlag(encode_cmd);

  // Subcommand: decode
  argparse::ArgumentParser decode_cmd("decode");
  decode_cmd.add_description("Disassemble a binary subroutine");
  AddInputFlags(decode_cmd);
  AddOutputFlag(decode_cmd);

  // Subcommand: run
  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description(
      "Execute a subroutine against a tracing processor");
  AddInputFlags(run_cmd);
  run_cmd.add_argument("--outcome")
      .default_value(0)
      .scan<'i', int>()
      .help("Outcome reported for every measurement");
  run_cmd.add_argument("--message")
      .default_value(0)
      .scan<'i', int>()
      .help("Value delivered by every recv");

  program.add_subparser(check_cmd);
  program.add_subparser(print_cmd);
  program.add_subparser(encode_cmd);
  program.add_subparser(decode_cmd);
  program.add_subparser(run_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    netqasm::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before looking for netqasm.toml
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      netqasm::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  netqasm::config::SessionConfig config;
  try {
    if (auto loaded = LoadOptionalConfig()) {
      config = *loaded;
    }
  } catch (const netqasm::DiagnosticException& e) {
    netqasm::driver::PrintDiagnostic(e.GetDiagnostic());
    return 1;
  }

  spdlog::set_level(spdlog::level::from_str(config.log_level));
  if (program.get<bool>("--verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  if (program.is_subcommand_used("check")) {
    return netqasm::driver::CheckCommand(BuildInput(check_cmd, config));
  }

  if (program.is_subcommand_used("print")) {
    return netqasm::driver::PrintCommand(BuildInput(print_cmd, config));
  }

  if (program.is_subcommand_used("encode")) {
    return netqasm::driver::EncodeCommand(BuildInput(encode_cmd, config));
  }

  if (program.is_subcommand_used("decode")) {
    return netqasm::driver::DecodeCommand(BuildInput(decode_cmd, config));
  }

  if (program.is_subcommand_used("run")) {
    auto input = BuildInput(run_cmd, config);
    input.outcome = static_cast<int32_t>(run_cmd.get<int>("--outcome"));
    input.incoming_message =
        static_cast<int32_t>(run_cmd.get<int>("--message"));
    return netqasm::driver::RunCommand(input);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
