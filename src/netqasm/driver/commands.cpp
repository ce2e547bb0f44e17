#include "commands.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/flavour/flavour.hpp"
#include "netqasm/lang/encoding.hpp"
#include "netqasm/lang/operand.hpp"
#include "netqasm/lang/subroutine.hpp"
#include "netqasm/lang/text_parser.hpp"
#include "netqasm/lang/text_printer.hpp"
#include "netqasm/runtime/session.hpp"
#include "netqasm/vm/app_memory.hpp"
#include "print.hpp"
#include "trace_processor.hpp"

namespace netqasm::driver {
namespace {

namespace fs = std::filesystem;

auto ReadTextFile(const std::string& path) -> Result<std::string> {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("cannot open '{}'", path)));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

auto ReadBinaryFile(const std::string& path) -> Result<std::vector<uint8_t>> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("cannot open '{}'", path)));
  }
  return std::vector<uint8_t>(
      std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

auto WriteFile(const std::string& path, std::string_view contents)
    -> Result<void> {
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("cannot write '{}'", path)));
  }
  out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("failed writing '{}'", path)));
  }
  return {};
}

auto IsBinaryInput(const std::string& path) -> bool {
  return fs::path(path).extension() == fs::path(kBinaryExtension);
}

// Reads the input as text or binary depending on its extension.
auto LoadSubroutine(const CommandInput& input, const flavour::Flavour& flavour)
    -> Result<lang::Subroutine> {
  if (IsBinaryInput(input.file)) {
    auto bytes = ReadBinaryFile(input.file);
    if (!bytes) {
      return std::unexpected(std::move(bytes).error());
    }
    return lang::DecodeSubroutine(*bytes, flavour);
  }
  auto text = ReadTextFile(input.file);
  if (!text) {
    return std::unexpected(std::move(text).error());
  }
  return lang::ParseText(*text, flavour, input.file);
}

auto FormatValues(const vm::ArrayValues& values) -> std::string {
  std::string out = "[";
  for (size_t i = 0; i < values.size(); ++i) {
    if (i != 0) {
      out += ", ";
    }
    out += values[i] ? fmt::format("{}", *values[i]) : "_";
  }
  out += "]";
  return out;
}

// Emits the result (or the diagnostic) and turns it into an exit code.
template <typename F>
auto WithSubroutine(const CommandInput& input, F&& action) -> int {
  auto flavour = flavour::FlavourByName(input.config.flavour);
  if (!flavour) {
    PrintDiagnostic(flavour.error());
    return 1;
  }
  auto subroutine = LoadSubroutine(input, **flavour);
  if (!subroutine) {
    PrintDiagnostic(subroutine.error());
    return 1;
  }
  auto done = std::forward<F>(action)(**flavour, *subroutine);
  if (!done) {
    PrintDiagnostic(done.error());
    return 1;
  }
  return 0;
}

}  // namespace

auto CheckCommand(const CommandInput& input) -> int {
  return WithSubroutine(
      input,
      [&](const flavour::Flavour& flavour,
          const lang::Subroutine& subroutine) -> Result<void> {
        fmt::print(
            "{}: {} instruction(s), valid for flavour {}\n", input.file,
            subroutine.Size(), flavour.name);
        return {};
      });
}

auto PrintCommand(const CommandInput& input) -> int {
  return WithSubroutine(
      input,
      [&](const flavour::Flavour&,
          const lang::Subroutine& subroutine) -> Result<void> {
        auto text = lang::PrintText(subroutine);
        if (input.output) {
          return WriteFile(*input.output, text);
        }
        fmt::print("{}", text);
        return {};
      });
}

auto EncodeCommand(const CommandInput& input) -> int {
  return WithSubroutine(
      input,
      [&](const flavour::Flavour& flavour,
          const lang::Subroutine& subroutine) -> Result<void> {
        auto bytes = lang::EncodeSubroutine(subroutine, flavour);
        if (!bytes) {
          return std::unexpected(std::move(bytes).error());
        }
        fs::path default_output(input.file);
        default_output.replace_extension(fs::path(kBinaryExtension));
        std::string output = input.output.value_or(default_output.string());
        spdlog::debug("writing {} byte(s) to {}", bytes->size(), output);
        return WriteFile(
            output, std::string_view(
                        reinterpret_cast<const char*>(bytes->data()),
                        bytes->size()));
      });
}

auto DecodeCommand(const CommandInput& input) -> int {
  if (!IsBinaryInput(input.file)) {
    PrintError(
        fmt::format(
            "'{}' is not a binary subroutine (expected a {} file)", input.file,
            kBinaryExtension));
    return 1;
  }
  return PrintCommand(input);
}

auto RunCommand(const CommandInput& input) -> int {
  TraceProcessor processor(TraceProcessor::Options{
      .outcome = input.outcome,
      .incoming_message = input.incoming_message,
  });

  std::optional<runtime::Session> session;
  try {
    session.emplace(input.config, processor);
  } catch (const DiagnosticException& e) {
    PrintDiagnostic(e.GetDiagnostic());
    return 1;
  }

  return WithSubroutine(
      input,
      [&](const flavour::Flavour&,
          const lang::Subroutine& subroutine) -> Result<void> {
        auto returned = session->RunSubroutine(subroutine);
        if (!returned) {
          return std::unexpected(std::move(returned).error());
        }

        const auto& memory = session->Memory();
        for (uint32_t bank = 0; bank < lang::kNumRegisterBanks; ++bank) {
          for (uint32_t index = 0; index < lang::kRegistersPerBank; ++index) {
            lang::Register reg{
                .bank = static_cast<lang::RegisterBank>(bank),
                .index = static_cast<uint8_t>(index),
            };
            int32_t value = memory.GetRegister(reg);
            if (value != 0) {
              fmt::print("{} = {}\n", lang::ToString(reg), value);
            }
          }
        }
        for (const auto& [reg, value] : returned->registers) {
          fmt::print("returned {} = {}\n", lang::ToString(reg), value);
        }
        for (const auto& [address, values] : returned->arrays) {
          fmt::print("returned @{} = {}\n", address, FormatValues(values));
        }
        return {};
      });
}

}  // namespace netqasm::driver
