#pragma once

#include <cstdint>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/compiler/builder.hpp"
#include "netqasm/compiler/future.hpp"
#include "netqasm/config/session_config.hpp"
#include "netqasm/flavour/flavour.hpp"
#include "netqasm/lang/subroutine.hpp"
#include "netqasm/vm/abort_signal.hpp"
#include "netqasm/vm/app_memory.hpp"
#include "netqasm/vm/executor.hpp"
#include "netqasm/vm/processor.hpp"

namespace netqasm::runtime {

// One application talking to one processor. Each flush compiles the
// recorded operations, ships them through the binary encoding, executes
// them and resolves the futures they publish.
//
// Construction throws DiagnosticException when the configuration names an
// unknown flavour. The processor must outlive the session.
class Session {
 public:
  Session(const config::SessionConfig& config, vm::Processor& processor);

  Session(const Session&) = delete;
  auto operator=(const Session&) -> Session& = delete;
  Session(Session&&) = delete;
  auto operator=(Session&&) -> Session& = delete;
  ~Session() = default;

  [[nodiscard]] auto GetBuilder() -> compiler::Builder& {
    return builder_;
  }

  // Compiles, transmits and runs everything recorded since the last flush.
  auto Flush() -> Result<void>;

  // Runs an already finalized subroutine against this application's memory.
  auto RunSubroutine(const lang::Subroutine& subroutine)
      -> Result<vm::ReturnedValues>;

  [[nodiscard]] auto Read(compiler::Future future) const -> Result<int32_t>;
  [[nodiscard]] auto ReadArray(compiler::ArrayFuture future) const
      -> Result<vm::ArrayValues>;
  [[nodiscard]] auto ReadEntry(compiler::ArrayFuture future, int32_t index) const
      -> Result<int32_t>;

  // May be called from another thread while a flush is blocked. The request
  // ends the subroutine that is running, or the next one to run, and is
  // cleared once that subroutine returns.
  void Abort() {
    abort_.Request();
  }

  [[nodiscard]] auto GetFlavour() const -> const flavour::Flavour& {
    return *flavour_;
  }
  [[nodiscard]] auto Memory() const -> const vm::AppMemory& {
    return memory_;
  }
  [[nodiscard]] auto Config() const -> const config::SessionConfig& {
    return config_;
  }
  [[nodiscard]] auto SubroutinesRun() const -> uint32_t {
    return subroutines_run_;
  }

 private:
  config::SessionConfig config_;
  const flavour::Flavour* flavour_;
  vm::Processor* processor_;
  vm::AppMemory memory_;
  vm::AbortSignal abort_;
  compiler::Builder builder_;
  compiler::ResultStore results_;
  uint32_t subroutines_run_ = 0;
};

}  // namespace netqasm::runtime
