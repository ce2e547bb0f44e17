#pragma once

#include <cstdint>
#include <deque>
#include <expected>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/lang/angle.hpp"
#include "netqasm/lang/gate.hpp"
#include "netqasm/vm/abort_signal.hpp"
#include "netqasm/vm/processor.hpp"

namespace netqasm::test {

// Processor that records every call as a line of text and answers from
// queues the test fills in beforehand.
class RecordingProcessor final : public vm::Processor {
 public:
  auto AllocateQubit() -> Result<int32_t> override {
    int32_t physical = next_physical_++;
    live_.insert(physical);
    calls.push_back(fmt::format("alloc {}", physical));
    return physical;
  }

  auto InitQubit(int32_t physical) -> Result<void> override {
    calls.push_back(fmt::format("init {}", physical));
    return {};
  }

  auto FreeQubit(int32_t physical) -> Result<void> override {
    live_.erase(physical);
    calls.push_back(fmt::format("free {}", physical));
    return {};
  }

  auto ApplySingle(
      lang::Gate gate, int32_t physical, std::optional<lang::Angle> angle)
      -> Result<void> override {
    if (angle) {
      calls.push_back(
          fmt::format(
              "{}({},{}) {}", lang::ToString(gate), angle->num,
              angle->denom_exp, physical));
    } else {
      calls.push_back(fmt::format("{} {}", lang::ToString(gate), physical));
    }
    return {};
  }

  auto ApplyTwo(
      lang::Gate gate, int32_t control, int32_t target,
      std::optional<lang::Angle> angle) -> Result<void> override {
    if (angle) {
      calls.push_back(
          fmt::format(
              "{}({},{}) {} {}", lang::ToString(gate), angle->num,
              angle->denom_exp, control, target));
    } else {
      calls.push_back(
          fmt::format("{} {} {}", lang::ToString(gate), control, target));
    }
    return {};
  }

  auto Measure(int32_t physical) -> Result<int32_t> override {
    int32_t outcome = 0;
    if (!outcomes.empty()) {
      outcome = outcomes.front();
      outcomes.pop_front();
    }
    calls.push_back(fmt::format("meas {} -> {}", physical, outcome));
    return outcome;
  }

  auto RequestEntanglement(
      const vm::EntanglementRequest& request, const vm::AbortSignal& abort)
      -> Result<std::vector<vm::EntangledPair>> override {
    if (abort_on_entanglement) {
      aborter->Request();
    }
    if (abort.IsRequested()) {
      return std::unexpected(Diagnostic::Aborted("test abort"));
    }
    requests.push_back(request);
    calls.push_back(
        fmt::format("epr {} x{}", request.remote_node, request.number));
    bool keeps = vm::KeepsQubits(request);
    std::vector<vm::EntangledPair> pairs;
    for (int32_t i = 0; i < request.number; ++i) {
      vm::EntangledPair pair;
      if (keeps) {
        int32_t physical = next_physical_++;
        live_.insert(physical);
        pair.physical_qubit = physical;
      }
      pair.info[0] = static_cast<int32_t>(request.type);
      pair.info[1] = 100 + i;
      pairs.push_back(pair);
    }
    if (abort_after_entanglement) {
      aborter->Request();
    }
    return pairs;
  }

  auto Send(int32_t peer, std::span<const uint8_t> message)
      -> Result<void> override {
    sent.emplace_back(peer, std::vector<uint8_t>(message.begin(), message.end()));
    calls.push_back(fmt::format("send {}", peer));
    return {};
  }

  auto Receive(int32_t peer, const vm::AbortSignal& abort)
      -> Result<std::vector<uint8_t>> override {
    if (abort.IsRequested()) {
      return std::unexpected(Diagnostic::Aborted("test abort"));
    }
    calls.push_back(fmt::format("recv {}", peer));
    std::vector<uint8_t> message = {0, 0, 0, 0};
    if (!inbox.empty()) {
      message = std::move(inbox.front());
      inbox.pop_front();
    }
    return message;
  }

  void Breakpoint(const vm::BreakpointSnapshot& snapshot) override {
    snapshots.push_back(snapshot);
    calls.push_back(fmt::format("breakpoint {}", snapshot.pc));
  }

  [[nodiscard]] auto LiveQubits() const -> const std::set<int32_t>& {
    return live_;
  }

  std::vector<std::string> calls;
  std::deque<int32_t> outcomes;
  std::deque<std::vector<uint8_t>> inbox;
  std::vector<std::pair<int32_t, std::vector<uint8_t>>> sent;
  std::vector<vm::EntanglementRequest> requests;
  std::vector<vm::BreakpointSnapshot> snapshots;

  // Raises `aborter` from inside the next entanglement request, as a
  // controller thread would while the executor is blocked.
  bool abort_on_entanglement = false;
  // Raises `aborter` once the pairs of the next request are handed out.
  bool abort_after_entanglement = false;
  vm::AbortSignal* aborter = nullptr;

 private:
  int32_t next_physical_ = 0;
  std::set<int32_t> live_;
};

}  // namespace netqasm::test
