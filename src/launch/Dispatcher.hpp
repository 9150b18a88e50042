#pragma once

#include "config/HandlerConfig.hpp"
#include "launch/BuilderRegistry.hpp"
#include "launch/ProcessLauncher.hpp"
#include "payload/Instruction.hpp"
#include "utils/HandlerError.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace jp::launch
{

struct InstructionOutcome
{
    std::size_t index = 0;
    std::string target;
    HandlerError error = HandlerError::None;
    std::string message;
    // Empty unless a builder ran.
    ArgumentVector arguments;

    [[nodiscard]] bool launched() const noexcept
    {
        return error == HandlerError::None;
    }
};

struct DispatchReport
{
    std::vector<InstructionOutcome> outcomes;

    std::size_t launched() const noexcept;
    std::size_t failed() const noexcept;
};

using PacingFunction = std::function<void(std::chrono::milliseconds)>;

// Returns a copy of `instruction` with the scheme's default profile and the
// first matching user agent rule filled in where the instruction has none.
payload::PlaybackInstruction
apply_instruction_defaults(payload::PlaybackInstruction const &instruction,
                           std::string_view scheme,
                           config::HandlerConfig const &config);

class Dispatcher
{
  public:
    Dispatcher(config::HandlerConfig config,
               std::shared_ptr<IProcessLauncher> launcher,
               BuilderRegistry const &registry = BuilderRegistry::instance(),
               PacingFunction pace = {});

    // Launches each instruction in order. A failing instruction is logged
    // and recorded in the report; it never stops the rest of the batch.
    DispatchReport dispatch(
        std::vector<payload::PlaybackInstruction> const &instructions,
        std::string_view scheme = {}) const;

  private:
    InstructionOutcome
    dispatch_one(std::size_t index,
                 payload::PlaybackInstruction const &instruction) const;

    config::HandlerConfig config_;
    std::shared_ptr<IProcessLauncher> launcher_;
    BuilderRegistry const &registry_;
    PacingFunction pace_;
};

} // namespace jp::launch
