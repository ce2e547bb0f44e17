#pragma once

#include <string>

#include "netqasm/lang/subroutine.hpp"

namespace netqasm::lang {

// Canonical text form: preamble, then one instruction per line with branch
// targets as absolute indices. ParseText accepts the output unchanged.
auto PrintText(const Subroutine& subroutine) -> std::string;

}  // namespace netqasm::lang
