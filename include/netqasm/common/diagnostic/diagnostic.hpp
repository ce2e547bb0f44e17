#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "netqasm/common/host_line.hpp"

namespace netqasm {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kEncoding,         // Malformed bytes or text
  kLayout,           // Register/array/label budget or uniqueness violation
  kCompile,          // Invalid operation sequence
  kUnsupported,      // Flavour cannot express the requested operation
  kExecution,        // Runtime fault
  kAddress,          // Out-of-range register, array or qubit access
  kAborted,          // Externally cancelled while suspended
  kNotYetAvailable,  // Future read before its subroutine completed
  kHostError,        // I/O, configuration
  kWarning,          // Non-fatal
  kNote,             // Auxiliary message
};

// Position of an instruction inside a subroutine, with the host line that
// produced it when known.
struct InstrSpan {
  uint32_t index = 0;
  std::optional<HostLine> host_line;

  auto operator==(const InstrSpan&) const -> bool = default;
};

// Line inside a text subroutine (1-based).
struct TextSpan {
  uint32_t line = 0;

  auto operator==(const TextSpan&) const -> bool = default;
};

// Host source line of an operation that has no instruction index yet.
struct HostSpan {
  HostLine host_line;

  auto operator==(const HostSpan&) const -> bool = default;
};

// Represents missing location
struct UnknownSpan {
  auto operator==(const UnknownSpan&) const -> bool = default;
};

using DiagSpan = std::variant<InstrSpan, TextSpan, HostSpan, UnknownSpan>;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  DiagSpan span;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  [[nodiscard]] auto Kind() const -> DiagKind {
    return primary.kind;
  }

  [[nodiscard]] auto Message() const -> const std::string& {
    return primary.message;
  }

  static auto Make(DiagKind kind, DiagSpan span, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = kind, .span = std::move(span), .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto Encoding(DiagSpan span, std::string msg) -> Diagnostic {
    return Make(DiagKind::kEncoding, std::move(span), std::move(msg));
  }

  static auto Layout(DiagSpan span, std::string msg) -> Diagnostic {
    return Make(DiagKind::kLayout, std::move(span), std::move(msg));
  }

  static auto Compile(DiagSpan span, std::string msg) -> Diagnostic {
    return Make(DiagKind::kCompile, std::move(span), std::move(msg));
  }

  static auto Unsupported(DiagSpan span, std::string msg) -> Diagnostic {
    return Make(DiagKind::kUnsupported, std::move(span), std::move(msg));
  }

  static auto Execution(DiagSpan span, std::string msg) -> Diagnostic {
    return Make(DiagKind::kExecution, std::move(span), std::move(msg));
  }

  static auto Address(DiagSpan span, std::string msg) -> Diagnostic {
    return Make(DiagKind::kAddress, std::move(span), std::move(msg));
  }

  static auto Aborted(std::string msg) -> Diagnostic {
    return Make(DiagKind::kAborted, UnknownSpan{}, std::move(msg));
  }

  static auto NotYetAvailable(std::string msg) -> Diagnostic {
    return Make(DiagKind::kNotYetAvailable, UnknownSpan{}, std::move(msg));
  }

  // Factory: host error without location
  static auto HostError(std::string msg) -> Diagnostic {
    return Make(DiagKind::kHostError, UnknownSpan{}, std::move(msg));
  }

  static auto Warning(DiagSpan span, std::string msg) -> Diagnostic {
    return Make(DiagKind::kWarning, std::move(span), std::move(msg));
  }

  // Replace an unknown span, keeping spans that are already resolved.
  auto AtInstruction(InstrSpan span) && -> Diagnostic {
    if (std::holds_alternative<UnknownSpan>(primary.span)) {
      primary.span = std::move(span);
    }
    return std::move(*this);
  }

  // Add a note without location
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = UnknownSpan{},
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.primary.message.c_str();
  }

 private:
  Diagnostic diag_;
};

// Human-readable kind name ("LayoutError", "AddressError", ...)
auto ToString(DiagKind kind) -> const char*;

// One-line rendering: "<Kind> at instruction 3 (app.cpp:12): message"
auto FormatDiagnostic(const Diagnostic& diag) -> std::string;

}  // namespace netqasm
