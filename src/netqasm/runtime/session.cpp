#include "netqasm/runtime/session.hpp"

#include <cstdint>
#include <expected>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/compiler/builder.hpp"
#include "netqasm/compiler/future.hpp"
#include "netqasm/flavour/flavour.hpp"
#include "netqasm/lang/encoding.hpp"
#include "netqasm/vm/executor.hpp"

namespace netqasm::runtime {

namespace {

auto ResolveFlavour(std::string_view name) -> const flavour::Flavour* {
  auto flavour = flavour::FlavourByName(name);
  if (!flavour) {
    throw DiagnosticException(std::move(flavour).error());
  }
  return *flavour;
}

}  // namespace

Session::Session(const config::SessionConfig& config, vm::Processor& processor)
    : config_(config),
      flavour_(ResolveFlavour(config.flavour)),
      processor_(&processor),
      builder_(
          *flavour_, compiler::BuilderOptions{
                         .app_id = config.app_id,
                         .angle_tolerance = config.angle_tolerance,
                     }) {
}

auto Session::Flush() -> Result<void> {
  auto compiled = builder_.Flush();
  if (!compiled) {
    return std::unexpected(std::move(compiled).error());
  }

  // The subroutine crosses to the executor in its wire form.
  auto bytes = lang::EncodeSubroutine(compiled->subroutine, *flavour_);
  if (!bytes) {
    return std::unexpected(std::move(bytes).error());
  }
  auto decoded = lang::DecodeSubroutine(*bytes, *flavour_);
  if (!decoded) {
    return std::unexpected(std::move(decoded).error());
  }
  spdlog::debug(
      "session: app {} sends subroutine of {} bytes", config_.app_id,
      bytes->size());

  std::vector<compiler::FutureId> futures;
  for (const auto& [future, reg] : compiled->register_futures) {
    results_.AddPending(future, compiler::RegisterSlot{.reg = reg});
    futures.push_back(future);
  }
  for (const auto& [future, address] : compiled->array_futures) {
    results_.AddPending(future, compiler::ArraySlot{.address = address});
    futures.push_back(future);
  }

  auto returned = RunSubroutine(*decoded);
  if (!returned) {
    return std::unexpected(std::move(returned).error());
  }
  return results_.Resolve(futures, *returned);
}

auto Session::RunSubroutine(const lang::Subroutine& subroutine)
    -> Result<vm::ReturnedValues> {
  vm::Executor executor(flavour_, processor_, &memory_, &abort_);
  auto returned = executor.Execute(subroutine);
  ++subroutines_run_;
  // An abort applies to the subroutine it interrupted; the next one starts
  // with a clear signal.
  abort_.Reset();
  if (!returned) {
    spdlog::debug(
        "session: subroutine {} failed: {}", subroutines_run_,
        returned.error().Message());
  }
  return returned;
}

auto Session::Read(compiler::Future future) const -> Result<int32_t> {
  return results_.Read(future);
}

auto Session::ReadArray(compiler::ArrayFuture future) const
    -> Result<vm::ArrayValues> {
  return results_.ReadArray(future);
}

auto Session::ReadEntry(compiler::ArrayFuture future, int32_t index) const
    -> Result<int32_t> {
  return results_.ReadEntry(future, index);
}

}  // namespace netqasm::runtime
