#pragma once

#include <string>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/diagnostic/diagnostic_sink.hpp"

namespace netqasm::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);
void PrintDiagnostics(const DiagnosticSink& sink);

}  // namespace netqasm::driver
