#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/compiler/handle.hpp"
#include "netqasm/compiler/lowering.hpp"
#include "netqasm/flavour/flavour.hpp"
#include "netqasm/lang/operand.hpp"
#include "netqasm/lang/subroutine.hpp"

namespace netqasm::compiler {

// Output of one flush: the finalized subroutine plus where each future
// will find its value once the subroutine has run.
struct CompiledSubroutine {
  lang::Subroutine subroutine;
  std::vector<std::pair<FutureId, lang::Register>> register_futures;
  std::vector<std::pair<FutureId, int32_t>> array_futures;
};

// Lowers, allocates registers and finalizes against the flavour.
auto Compile(
    const LoweringInput& input, const flavour::Flavour& flavour,
    uint16_t app_id) -> Result<CompiledSubroutine>;

}  // namespace netqasm::compiler
