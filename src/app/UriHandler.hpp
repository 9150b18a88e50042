#pragma once

#include "config/HandlerConfig.hpp"
#include "launch/Dispatcher.hpp"
#include "launch/ProcessLauncher.hpp"
#include "utils/HandlerError.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace jp::app
{

struct HandleResult
{
    // Only whole-payload errors land here; per-instruction failures are in
    // the report.
    HandlerError error = HandlerError::None;
    std::string message;
    std::string scheme;
    launch::DispatchReport report;

    [[nodiscard]] bool ok() const noexcept
    {
        return error == HandlerError::None;
    }
};

// Decode phase (all-or-nothing) followed by the dispatch phase.
HandleResult handle_uri(std::string_view raw,
                        config::HandlerConfig const &config,
                        std::shared_ptr<launch::IProcessLauncher> launcher,
                        launch::PacingFunction pace = {});

} // namespace jp::app
