#pragma once

#include <string>
#include <string_view>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/lang/subroutine.hpp"

namespace netqasm::flavour {
struct Flavour;
}

namespace netqasm::lang {

// Parses the text form of a subroutine:
//
//   # NETQASM 1.0
//   # APPID 0
//   # DEFINE q Q0
//   set $q 0
//   qalloc $q
//   LOOP:
//   beq R0 3 EXIT      // integer operands in register slots become `set`s
//   ...
//
// Preamble lines are optional. Syntax errors are encoding errors spanning
// the offending text line; the result is finalized against `flavour`.
auto ParseText(
    std::string_view text, const flavour::Flavour& flavour,
    std::string_view file_name = "<text>") -> Result<Subroutine>;

}  // namespace netqasm::lang
