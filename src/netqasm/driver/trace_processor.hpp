#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <span>
#include <vector>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/lang/angle.hpp"
#include "netqasm/lang/gate.hpp"
#include "netqasm/vm/abort_signal.hpp"
#include "netqasm/vm/processor.hpp"

namespace netqasm::driver {

// Processor for `netqasm run`: logs every effect and answers with fixed
// values instead of simulating anything.
class TraceProcessor final : public vm::Processor {
 public:
  struct Options {
    int32_t outcome = 0;          // Every measurement returns this
    int32_t incoming_message = 0;  // Every recv returns this
  };

  explicit TraceProcessor(Options options) : options_(options) {
  }

  auto AllocateQubit() -> Result<int32_t> override;
  auto InitQubit(int32_t physical) -> Result<void> override;
  auto FreeQubit(int32_t physical) -> Result<void> override;
  auto ApplySingle(
      lang::Gate gate, int32_t physical, std::optional<lang::Angle> angle)
      -> Result<void> override;
  auto ApplyTwo(
      lang::Gate gate, int32_t control, int32_t target,
      std::optional<lang::Angle> angle) -> Result<void> override;
  auto Measure(int32_t physical) -> Result<int32_t> override;
  auto RequestEntanglement(
      const vm::EntanglementRequest& request, const vm::AbortSignal& abort)
      -> Result<std::vector<vm::EntangledPair>> override;
  auto Send(int32_t peer, std::span<const uint8_t> message)
      -> Result<void> override;
  auto Receive(int32_t peer, const vm::AbortSignal& abort)
      -> Result<std::vector<uint8_t>> override;
  void Breakpoint(const vm::BreakpointSnapshot& snapshot) override;

 private:
  auto CheckQubit(int32_t physical) const -> Result<void>;

  Options options_;
  int32_t next_qubit_ = 0;
  int32_t next_create_id_ = 0;
  std::set<int32_t> live_;
};

}  // namespace netqasm::driver
