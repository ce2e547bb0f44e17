#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <vector>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/lang/angle.hpp"
#include "netqasm/lang/gate.hpp"
#include "netqasm/vm/abort_signal.hpp"
#include "netqasm/vm/app_memory.hpp"

namespace netqasm::vm {

// Fields of the create-argument array read by create_epr.
inline constexpr int32_t kCreateFields = 20;
inline constexpr int32_t kCreateTypeField = 0;
inline constexpr int32_t kCreateNumberField = 1;
inline constexpr int32_t kCreateMinFidelityField = 4;

// Entanglement information written per generated pair.
inline constexpr int32_t kEntInfoFields = 10;

enum class EprType : uint8_t {
  kCreateKeep = 0,        // K: both halves stay in memory
  kMeasureDirectly = 1,   // M: halves are measured on generation
  kRemoteStatePrep = 2,   // R: creator measures, receiver keeps
};

enum class EprRole : uint8_t {
  kCreate,
  kReceive,
};

struct EntanglementRequest {
  EprRole role = EprRole::kCreate;
  int32_t remote_node = 0;
  int32_t socket = 0;
  EprType type = EprType::kCreateKeep;
  int32_t number = 1;
  int32_t min_fidelity = 0;
  // Raw create arguments (create side only); undefined fields read as 0.
  std::vector<int32_t> arguments;
};

// Whether the pairs of a request leave a local half in memory.
inline auto KeepsQubits(const EntanglementRequest& request) -> bool {
  return request.type == EprType::kCreateKeep ||
         (request.type == EprType::kRemoteStatePrep &&
          request.role == EprRole::kReceive);
}

struct EntangledPair {
  // Local physical qubit holding the half, when the pair keeps one.
  std::optional<int32_t> physical_qubit;
  std::array<int32_t, kEntInfoFields> info{};
};

enum class BreakpointAction : uint8_t {
  kNop = 0,
  kDumpLocalState = 1,
  kDumpGlobalState = 2,
};

enum class BreakpointRole : uint8_t {
  kCreate = 0,
  kReceive = 1,
};

// Copy of the application state handed to the processor on `breakpoint`.
struct BreakpointSnapshot {
  uint32_t pc = 0;
  uint8_t action = 0;
  uint8_t role = 0;
  RegisterFile registers{};
  std::map<int32_t, ArrayValues> arrays;
  std::map<int32_t, int32_t> qubits;
};

// Quantum backend, network stack and classical transport as seen by the
// executor. Blocking calls receive the abort signal and must return promptly
// (with any error) once it is raised.
class Processor {
 public:
  Processor() = default;
  virtual ~Processor() = default;

  Processor(const Processor&) = delete;
  auto operator=(const Processor&) -> Processor& = delete;
  Processor(Processor&&) = delete;
  auto operator=(Processor&&) -> Processor& = delete;

  // Returns the physical id of a fresh qubit.
  virtual auto AllocateQubit() -> Result<int32_t> = 0;
  virtual auto InitQubit(int32_t physical) -> Result<void> = 0;
  virtual auto FreeQubit(int32_t physical) -> Result<void> = 0;

  virtual auto ApplySingle(
      lang::Gate gate, int32_t physical, std::optional<lang::Angle> angle)
      -> Result<void> = 0;

  // Two-qubit gates; `control` is the first operand for mov as well.
  virtual auto ApplyTwo(
      lang::Gate gate, int32_t control, int32_t target,
      std::optional<lang::Angle> angle) -> Result<void> = 0;

  virtual auto Measure(int32_t physical) -> Result<int32_t> = 0;

  // Blocks until all requested pairs are delivered.
  virtual auto RequestEntanglement(
      const EntanglementRequest& request, const AbortSignal& abort)
      -> Result<std::vector<EntangledPair>> = 0;

  virtual auto Send(int32_t peer, std::span<const uint8_t> message)
      -> Result<void> = 0;

  // Blocks until a message from `peer` arrives.
  virtual auto Receive(int32_t peer, const AbortSignal& abort)
      -> Result<std::vector<uint8_t>> = 0;

  virtual void Breakpoint(const BreakpointSnapshot& snapshot) = 0;
};

}  // namespace netqasm::vm
