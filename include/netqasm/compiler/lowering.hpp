#pragma once

#include <cstdint>
#include <set>
#include <utility>
#include <vector>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/compiler/handle.hpp"
#include "netqasm/compiler/operation.hpp"
#include "netqasm/compiler/virtual_program.hpp"
#include "netqasm/flavour/flavour.hpp"

namespace netqasm::compiler {

struct LoweringInput {
  const std::vector<Operation>* operations = nullptr;

  // Virtual qubit ids allocated before this flush.
  std::set<int32_t> live_qubits;

  // Futures to publish at the end of the subroutine.
  std::vector<std::pair<FutureId, ValueId>> value_futures;
  std::vector<std::pair<FutureId, ArrayId>> array_futures;
};

struct LoweredProgram {
  VProgram program;
  std::vector<std::pair<FutureId, VReg>> register_futures;
  std::vector<std::pair<FutureId, int32_t>> array_futures;
};

// Flattens the operation tree into virtual instructions: control flow
// becomes labels and branches, constants become `set`, qubit handles become
// Q registers holding their virtual ids, and gates the flavour lacks are
// replaced by its decomposition.
auto Lower(const LoweringInput& input, const flavour::Flavour& flavour)
    -> Result<LoweredProgram>;

}  // namespace netqasm::compiler
