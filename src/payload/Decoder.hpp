#pragma once

#include "payload/Instruction.hpp"
#include "utils/HandlerError.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace jp::payload
{

struct DecodeResult
{
    // Never empty when error == HandlerError::None.
    std::vector<PlaybackInstruction> instructions;
    HandlerError error = HandlerError::None;
    std::string message;
    // Diagnostics: the text before and after sanitizing, and the decoded
    // JSON text when it failed to parse.
    std::string raw;
    std::string cleaned;
    std::string decoded_text;
    bool batch = false;

    [[nodiscard]] bool ok() const noexcept
    {
        return error == HandlerError::None;
    }
};

// Decodes an already sanitized string. `raw` is only carried into the
// result for diagnostics.
DecodeResult decode_instructions(std::string_view cleaned,
                                 std::string_view raw = {});

// Sanitizes then decodes the text following "<scheme>://".
DecodeResult decode_payload(std::string_view raw);

// Producer side: JSON text for a batch (array) or a single legacy object.
std::string serialize_instructions(
    std::vector<PlaybackInstruction> const &instructions, bool as_array);
std::string serialize_instruction(PlaybackInstruction const &instruction);

} // namespace jp::payload
