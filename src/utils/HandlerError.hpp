#pragma once

#include <string_view>

namespace jp
{

enum class HandlerError
{
    None,
    // Whole-payload failures; nothing is launched.
    SchemeMismatch,
    DecodeError,
    MalformedPayload,
    // Per-instruction failures; the rest of the batch still runs.
    UnknownTarget,
    MissingExecutablePath,
    ProcessStartFailure,
};

constexpr std::string_view to_string(HandlerError error) noexcept
{
    switch (error)
    {
    case HandlerError::None:
        return "none";
    case HandlerError::SchemeMismatch:
        return "scheme-mismatch";
    case HandlerError::DecodeError:
        return "decode-error";
    case HandlerError::MalformedPayload:
        return "malformed-payload";
    case HandlerError::UnknownTarget:
        return "unknown-target";
    case HandlerError::MissingExecutablePath:
        return "missing-executable-path";
    case HandlerError::ProcessStartFailure:
        return "process-start-failure";
    }
    return "unknown";
}

constexpr bool is_fatal(HandlerError error) noexcept
{
    return error == HandlerError::SchemeMismatch ||
           error == HandlerError::DecodeError ||
           error == HandlerError::MalformedPayload;
}

} // namespace jp
