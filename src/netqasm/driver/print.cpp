#include "print.hpp"

#include <cstdio>
#include <string>
#include <variant>

#include <fmt/color.h>
#include <fmt/core.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/diagnostic/diagnostic_sink.hpp"
#include "netqasm/common/overloaded.hpp"

namespace netqasm::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
    default:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
  }
}

auto FormatLocation(const DiagSpan& span) -> std::string {
  return std::visit(
      Overloaded{
          [](const InstrSpan& s) -> std::string {
            if (s.host_line) {
              return fmt::format(
                  "{}:{} (instruction {})", s.host_line->file,
                  s.host_line->line, s.index);
            }
            return fmt::format("instruction {}", s.index);
          },
          [](const TextSpan& s) -> std::string {
            return fmt::format("line {}", s.line);
          },
          [](const HostSpan& s) -> std::string {
            return fmt::format("{}:{}", s.host_line.file, s.host_line.line);
          },
          [](UnknownSpan) -> std::string { return {}; },
      },
      span);
}

void PrintDiagItem(const DiagItem& item, bool is_primary) {
  auto location = FormatLocation(item.span);
  auto kind = fmt::format("{}:", ToString(item.kind));
  auto message_style =
      is_primary ? fmt::emphasis::bold : fmt::text_style{};

  if (!location.empty()) {
    fmt::print(
        stderr, "{}: {} {}\n", fmt::styled(location, fmt::emphasis::bold),
        fmt::styled(kind, DiagKindToStyle(item.kind)),
        fmt::styled(item.message, message_style));
  } else {
    fmt::print(
        stderr, "{}: {} {}\n", fmt::styled("netqasm", kToolStyle),
        fmt::styled(kind, DiagKindToStyle(item.kind)),
        fmt::styled(item.message, message_style));
  }
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("netqasm", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("netqasm", kToolStyle),
      fmt::styled(
          "warning:",
          fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintDiagItem(diag.primary, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, false);
  }
}

void PrintDiagnostics(const DiagnosticSink& sink) {
  for (const auto& diag : sink.GetDiagnostics()) {
    PrintDiagnostic(diag);
  }
}

}  // namespace netqasm::driver
