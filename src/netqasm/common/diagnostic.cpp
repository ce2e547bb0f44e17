#include <string>
#include <variant>

#include <fmt/core.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/overloaded.hpp"

namespace netqasm {

auto ToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kEncoding:
      return "EncodingError";
    case DiagKind::kLayout:
      return "LayoutError";
    case DiagKind::kCompile:
      return "CompileError";
    case DiagKind::kUnsupported:
      return "UnsupportedOperationError";
    case DiagKind::kExecution:
      return "ExecutionError";
    case DiagKind::kAddress:
      return "AddressError";
    case DiagKind::kAborted:
      return "Aborted";
    case DiagKind::kNotYetAvailable:
      return "NotYetAvailable";
    case DiagKind::kHostError:
      return "HostError";
    case DiagKind::kWarning:
      return "warning";
    case DiagKind::kNote:
      return "note";
  }
  return "Unknown";
}

namespace {

auto FormatSpan(const DiagSpan& span) -> std::string {
  return std::visit(
      Overloaded{
          [](const InstrSpan& s) -> std::string {
            if (s.host_line) {
              return fmt::format(
                  " at instruction {} ({}:{})", s.index, s.host_line->file,
                  s.host_line->line);
            }
            return fmt::format(" at instruction {}", s.index);
          },
          [](const TextSpan& s) -> std::string {
            return fmt::format(" at line {}", s.line);
          },
          [](const HostSpan& s) -> std::string {
            return fmt::format(" at {}:{}", s.host_line.file, s.host_line.line);
          },
          [](UnknownSpan) -> std::string { return ""; },
      },
      span);
}

}  // namespace

auto FormatDiagnostic(const Diagnostic& diag) -> std::string {
  std::string out = fmt::format(
      "{}{}: {}", ToString(diag.primary.kind), FormatSpan(diag.primary.span),
      diag.primary.message);
  for (const auto& note : diag.notes) {
    out += fmt::format("\n  note{}: {}", FormatSpan(note.span), note.message);
  }
  return out;
}

}  // namespace netqasm
