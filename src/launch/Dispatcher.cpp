#include "launch/Dispatcher.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <format>
#include <thread>
#include <utility>

namespace jp::launch
{

namespace
{
std::string describe(payload::PlaybackInstruction const &instruction)
{
    auto text = std::format("target={}", instruction.target);
    if (instruction.title)
    {
        text += std::format(" title=\"{}\"", *instruction.title);
    }
    if (instruction.geometry)
    {
        text += std::format(" geometry={}", *instruction.geometry);
    }
    return text;
}

std::string join_arguments(ArgumentVector const &arguments)
{
    std::string joined;
    for (auto const &argument : arguments)
    {
        if (!joined.empty())
        {
            joined.push_back(' ');
        }
        joined += argument;
    }
    return joined;
}
} // namespace

std::size_t DispatchReport::launched() const noexcept
{
    return static_cast<std::size_t>(
        std::count_if(outcomes.begin(), outcomes.end(),
                      [](InstructionOutcome const &outcome)
                      { return outcome.launched(); }));
}

std::size_t DispatchReport::failed() const noexcept
{
    return outcomes.size() - launched();
}

payload::PlaybackInstruction
apply_instruction_defaults(payload::PlaybackInstruction const &instruction,
                           std::string_view scheme,
                           config::HandlerConfig const &config)
{
    auto resolved = instruction;
    if (!resolved.profile || resolved.profile->empty())
    {
        if (auto profile = config.default_profile(scheme))
        {
            resolved.profile = std::move(profile);
        }
    }
    if (!resolved.user_agent || resolved.user_agent->empty())
    {
        if (auto agent = config.user_agent_for(resolved.url))
        {
            JP_LOG_DEBUG("user agent rule matched {}", resolved.url);
            resolved.user_agent = std::move(agent);
        }
    }
    return resolved;
}

Dispatcher::Dispatcher(config::HandlerConfig config,
                       std::shared_ptr<IProcessLauncher> launcher,
                       BuilderRegistry const &registry, PacingFunction pace)
    : config_(std::move(config)), launcher_(std::move(launcher)),
      registry_(registry), pace_(std::move(pace))
{
    if (!pace_)
    {
        pace_ = [](std::chrono::milliseconds delay)
        { std::this_thread::sleep_for(delay); };
    }
}

DispatchReport Dispatcher::dispatch(
    std::vector<payload::PlaybackInstruction> const &instructions,
    std::string_view scheme) const
{
    DispatchReport report;
    report.outcomes.reserve(instructions.size());
    for (std::size_t index = 0; index < instructions.size(); ++index)
    {
        auto resolved =
            apply_instruction_defaults(instructions[index], scheme, config_);
        auto outcome = dispatch_one(index, resolved);
        bool const attempted = !outcome.arguments.empty();
        report.outcomes.push_back(std::move(outcome));
        if (attempted && index + 1 < instructions.size() &&
            config_.launch_interval.count() > 0)
        {
            pace_(config_.launch_interval);
        }
    }
    JP_LOG_INFO("dispatch finished: {} launched, {} failed",
                report.launched(), report.failed());
    return report;
}

InstructionOutcome
Dispatcher::dispatch_one(std::size_t index,
                         payload::PlaybackInstruction const &instruction) const
{
    InstructionOutcome outcome;
    outcome.index = index;
    outcome.target = instruction.target;

    if (instruction.target.empty())
    {
        outcome.error = HandlerError::UnknownTarget;
        outcome.message = "instruction has no target";
        JP_LOG_WARN("instruction #{}: {}", index, outcome.message);
        return outcome;
    }

    auto executable = config_.executable_for(instruction.target);
    if (!executable)
    {
        outcome.error = HandlerError::MissingExecutablePath;
        outcome.message = std::format("no executable configured for target {}",
                                      instruction.target);
        JP_LOG_WARN("instruction #{}: {}", index, outcome.message);
        return outcome;
    }

    auto const *builder = registry_.find(instruction.target);
    if (builder == nullptr)
    {
        outcome.error = HandlerError::UnknownTarget;
        outcome.message =
            std::format("no argument builder for target {}", instruction.target);
        JP_LOG_WARN("instruction #{}: {}", index, outcome.message);
        return outcome;
    }

    outcome.arguments = (*builder)(*executable, instruction);
    JP_LOG_INFO("instruction #{}: launching {}", index, describe(instruction));
    JP_LOG_DEBUG("executing: {}", join_arguments(outcome.arguments));

    LaunchResult launched;
    if (launcher_)
    {
        launched = launcher_->launch(outcome.arguments);
    }
    else
    {
        launched.message = "no process launcher available";
    }
    if (!launched.success)
    {
        outcome.error = HandlerError::ProcessStartFailure;
        outcome.message = launched.message;
        JP_LOG_ERROR("instruction #{}: failed to start {}: {}", index,
                     executable->string(), launched.message);
        return outcome;
    }
    outcome.message = launched.message;
    JP_LOG_INFO("instruction #{}: started ({})", index, launched.message);
    return outcome;
}

} // namespace jp::launch
