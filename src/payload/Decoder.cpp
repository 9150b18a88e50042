#include "payload/Decoder.hpp"

#include "payload/Sanitizer.hpp"
#include "utils/Base64.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <optional>
#include <utility>

#include <yyjson.h>

namespace jp::payload
{

namespace
{

std::string clean_decoded_text(std::vector<std::uint8_t> const &bytes)
{
    std::string text;
    text.reserve(bytes.size());
    for (auto byte : bytes)
    {
        if (byte == '\0' || byte == '\f')
        {
            continue;
        }
        text.push_back(static_cast<char>(byte));
    }
    auto begin = text.find_first_not_of(" \t\r\n\v");
    if (begin == std::string::npos)
    {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n\v");
    return text.substr(begin, end - begin + 1);
}

std::optional<std::string> optional_member(yyjson_val *object,
                                           char const *key)
{
    yyjson_val *value = yyjson_obj_get(object, key);
    if (value == nullptr || !yyjson_is_str(value))
    {
        return std::nullopt;
    }
    return std::string(yyjson_get_str(value), yyjson_get_len(value));
}

PlaybackInstruction parse_instruction(yyjson_val *object)
{
    PlaybackInstruction instruction;
    instruction.target = std::string(json::get_string(object, "target"));
    if (instruction.target.empty())
    {
        instruction.target = std::string(json::get_string(object, "mode"));
    }
    instruction.url = std::string(json::get_string(object, "url"));
    instruction.profile = optional_member(object, "profile");
    instruction.geometry = optional_member(object, "geometry");
    instruction.title = optional_member(object, "title");
    instruction.subtitle_url = optional_member(object, "subtitleUrl");
    if (!instruction.subtitle_url)
    {
        instruction.subtitle_url = optional_member(object, "subtitle");
    }
    instruction.user_agent = optional_member(object, "userAgent");
    return instruction;
}

// Batch mode: a non-empty array whose elements are all objects.
std::optional<std::vector<PlaybackInstruction>> parse_batch(yyjson_val *root)
{
    if (root == nullptr || !yyjson_is_arr(root) || yyjson_arr_size(root) == 0)
    {
        return std::nullopt;
    }
    std::vector<PlaybackInstruction> result;
    result.reserve(yyjson_arr_size(root));
    size_t idx, limit;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(root, idx, limit, entry)
    {
        if (!yyjson_is_obj(entry))
        {
            return std::nullopt;
        }
        result.push_back(parse_instruction(entry));
    }
    return result;
}

void add_optional(yyjson_mut_doc *doc, yyjson_mut_val *object,
                  char const *key, std::optional<std::string> const &value)
{
    if (value)
    {
        yyjson_mut_obj_add_strncpy(doc, object, key, value->data(),
                                   value->size());
    }
}

yyjson_mut_val *build_object(yyjson_mut_doc *doc,
                             PlaybackInstruction const &instruction)
{
    auto *object = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_strncpy(doc, object, "mode", instruction.target.data(),
                               instruction.target.size());
    yyjson_mut_obj_add_strncpy(doc, object, "url", instruction.url.data(),
                               instruction.url.size());
    add_optional(doc, object, "profile", instruction.profile);
    add_optional(doc, object, "geometry", instruction.geometry);
    add_optional(doc, object, "title", instruction.title);
    add_optional(doc, object, "subtitleUrl", instruction.subtitle_url);
    add_optional(doc, object, "userAgent", instruction.user_agent);
    return object;
}

} // namespace

DecodeResult decode_instructions(std::string_view cleaned,
                                 std::string_view raw)
{
    DecodeResult result;
    result.raw = std::string(raw);
    result.cleaned = std::string(cleaned);

    auto bytes = utils::decode_base64(cleaned);
    if (!bytes)
    {
        result.error = HandlerError::DecodeError;
        result.message =
            std::format("base64 decode failed (raw=\"{}\", cleaned=\"{}\")",
                        raw, cleaned);
        return result;
    }
    result.decoded_text = clean_decoded_text(*bytes);

    yyjson_read_err read_error{};
    auto doc = json::Document::parse(result.decoded_text, &read_error);
    if (!doc.is_valid())
    {
        result.error = HandlerError::MalformedPayload;
        result.message = std::format(
            "payload is not JSON: {} at byte {} (text=\"{}\")",
            read_error.msg ? read_error.msg : "unknown error", read_error.pos,
            result.decoded_text);
        return result;
    }

    auto *root = doc.root();
    if (auto batch = parse_batch(root))
    {
        result.instructions = std::move(*batch);
        result.batch = true;
        return result;
    }
    if (root != nullptr && yyjson_is_obj(root))
    {
        result.instructions.push_back(parse_instruction(root));
        return result;
    }

    result.error = HandlerError::MalformedPayload;
    result.message = std::format(
        "payload is neither an instruction array nor an object: expected "
        "object, found {} (text=\"{}\")",
        root ? yyjson_get_type_desc(root) : "nothing", result.decoded_text);
    return result;
}

DecodeResult decode_payload(std::string_view raw)
{
    auto cleaned = sanitize_payload(raw);
    JP_LOG_DEBUG("sanitized payload: {}", cleaned);
    return decode_instructions(cleaned, raw);
}

std::string serialize_instructions(
    std::vector<PlaybackInstruction> const &instructions, bool as_array)
{
    if (!as_array && instructions.size() == 1)
    {
        return serialize_instruction(instructions.front());
    }
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "[]";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_arr(native);
    doc.set_root(root);
    for (auto const &instruction : instructions)
    {
        yyjson_mut_arr_append(root, build_object(native, instruction));
    }
    return doc.write("[]");
}

std::string serialize_instruction(PlaybackInstruction const &instruction)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    doc.set_root(build_object(doc.doc(), instruction));
    return doc.write("{}");
}

} // namespace jp::payload
