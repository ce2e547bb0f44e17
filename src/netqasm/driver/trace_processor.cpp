#include "trace_processor.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/lang/angle.hpp"
#include "netqasm/lang/gate.hpp"
#include "netqasm/vm/processor.hpp"

namespace netqasm::driver {

namespace {

auto AngleSuffix(std::optional<lang::Angle> angle) -> std::string {
  if (!angle) {
    return {};
  }
  return fmt::format("({}*pi/2^{})", angle->num, angle->denom_exp);
}

// Field layout of the info written per pair.
namespace keep {
constexpr size_t kType = 0;
constexpr size_t kCreateId = 1;
constexpr size_t kLogicalQubit = 2;
constexpr size_t kSequenceNumber = 4;
constexpr size_t kRemoteNode = 6;
}  // namespace keep

namespace measured {
constexpr size_t kType = 0;
constexpr size_t kCreateId = 1;
constexpr size_t kOutcome = 2;
constexpr size_t kSequenceNumber = 5;
constexpr size_t kRemoteNode = 7;
}  // namespace measured

}  // namespace

auto TraceProcessor::CheckQubit(int32_t physical) const -> Result<void> {
  if (!live_.contains(physical)) {
    return std::unexpected(
        Diagnostic::Execution(
            UnknownSpan{},
            fmt::format("physical qubit {} is not allocated", physical)));
  }
  return {};
}

auto TraceProcessor::AllocateQubit() -> Result<int32_t> {
  int32_t physical = next_qubit_++;
  live_.insert(physical);
  spdlog::info("processor: alloc q{}", physical);
  return physical;
}

auto TraceProcessor::InitQubit(int32_t physical) -> Result<void> {
  spdlog::info("processor: init q{}", physical);
  return CheckQubit(physical);
}

auto TraceProcessor::FreeQubit(int32_t physical) -> Result<void> {
  auto checked = CheckQubit(physical);
  if (!checked) {
    return checked;
  }
  live_.erase(physical);
  spdlog::info("processor: free q{}", physical);
  return {};
}

auto TraceProcessor::ApplySingle(
    lang::Gate gate, int32_t physical, std::optional<lang::Angle> angle)
    -> Result<void> {
  spdlog::info(
      "processor: {}{} q{}", lang::ToString(gate), AngleSuffix(angle),
      physical);
  return CheckQubit(physical);
}

auto TraceProcessor::ApplyTwo(
    lang::Gate gate, int32_t control, int32_t target,
    std::optional<lang::Angle> angle) -> Result<void> {
  spdlog::info(
      "processor: {}{} q{} q{}", lang::ToString(gate), AngleSuffix(angle),
      control, target);
  auto first = CheckQubit(control);
  if (!first) {
    return first;
  }
  return CheckQubit(target);
}

auto TraceProcessor::Measure(int32_t physical) -> Result<int32_t> {
  auto checked = CheckQubit(physical);
  if (!checked) {
    return std::unexpected(std::move(checked).error());
  }
  spdlog::info("processor: meas q{} -> {}", physical, options_.outcome);
  return options_.outcome;
}

auto TraceProcessor::RequestEntanglement(
    const vm::EntanglementRequest& request, const vm::AbortSignal& abort)
    -> Result<std::vector<vm::EntangledPair>> {
  if (abort.IsRequested()) {
    return std::unexpected(Diagnostic::Aborted("entanglement request aborted"));
  }
  bool keeps = vm::KeepsQubits(request);
  spdlog::info(
      "processor: {} {} pair(s) with node {} on socket {}",
      request.role == vm::EprRole::kCreate ? "create" : "receive",
      request.number, request.remote_node, request.socket);

  int32_t create_id = next_create_id_++;
  std::vector<vm::EntangledPair> pairs;
  for (int32_t i = 0; i < request.number; ++i) {
    vm::EntangledPair pair;
    auto type = static_cast<int32_t>(request.type);
    if (keeps) {
      int32_t physical = next_qubit_++;
      live_.insert(physical);
      pair.physical_qubit = physical;
      pair.info[keep::kType] = type;
      pair.info[keep::kCreateId] = create_id;
      pair.info[keep::kLogicalQubit] = physical;
      pair.info[keep::kSequenceNumber] = i;
      pair.info[keep::kRemoteNode] = request.remote_node;
    } else {
      pair.info[measured::kType] = type;
      pair.info[measured::kCreateId] = create_id;
      pair.info[measured::kOutcome] = options_.outcome;
      pair.info[measured::kSequenceNumber] = i;
      pair.info[measured::kRemoteNode] = request.remote_node;
    }
    pairs.push_back(pair);
  }
  return pairs;
}

auto TraceProcessor::Send(int32_t peer, std::span<const uint8_t> message)
    -> Result<void> {
  spdlog::info("processor: send {} byte(s) to {}", message.size(), peer);
  return {};
}

auto TraceProcessor::Receive(int32_t peer, const vm::AbortSignal& abort)
    -> Result<std::vector<uint8_t>> {
  if (abort.IsRequested()) {
    return std::unexpected(Diagnostic::Aborted("receive aborted"));
  }
  auto value = static_cast<uint32_t>(options_.incoming_message);
  spdlog::info(
      "processor: recv from {} -> {}", peer, options_.incoming_message);
  std::vector<uint8_t> message(4);
  for (size_t i = 0; i < message.size(); ++i) {
    message[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
  }
  return message;
}

void TraceProcessor::Breakpoint(const vm::BreakpointSnapshot& snapshot) {
  spdlog::info(
      "processor: breakpoint at {} (action {}, role {}), {} array(s), {} "
      "qubit(s)",
      snapshot.pc, snapshot.action, snapshot.role, snapshot.arrays.size(),
      snapshot.qubits.size());
}

}  // namespace netqasm::driver
