#include "app/UriHandler.hpp"

#include "payload/Decoder.hpp"
#include "payload/SchemeUri.hpp"
#include "utils/Log.hpp"

#include <format>
#include <utility>

namespace jp::app
{

HandleResult handle_uri(std::string_view raw,
                        config::HandlerConfig const &config,
                        std::shared_ptr<launch::IProcessLauncher> launcher,
                        launch::PacingFunction pace)
{
    HandleResult result;
    JP_LOG_INFO("raw uri: {}", raw);

    auto uri = payload::split_scheme_uri(raw);
    if (!uri)
    {
        result.error = HandlerError::SchemeMismatch;
        result.message = "input is not of the form <scheme>://<payload>";
        JP_LOG_ERROR("{}", result.message);
        return result;
    }
    result.scheme = uri->scheme;
    if (!config.accepts_scheme(uri->scheme))
    {
        result.error = HandlerError::SchemeMismatch;
        result.message = std::format("scheme {} is not registered", uri->scheme);
        JP_LOG_ERROR("{}", result.message);
        return result;
    }

    auto decoded = payload::decode_payload(uri->payload);
    if (!decoded.ok())
    {
        result.error = decoded.error;
        result.message = std::move(decoded.message);
        JP_LOG_ERROR("{}: {}", to_string(result.error), result.message);
        return result;
    }
    JP_LOG_INFO("decoded {} instruction(s) ({} mode)",
                decoded.instructions.size(),
                decoded.batch ? "batch" : "legacy");

    launch::Dispatcher dispatcher(config, std::move(launcher),
                                  launch::BuilderRegistry::instance(),
                                  std::move(pace));
    result.report = dispatcher.dispatch(decoded.instructions, uri->scheme);
    return result;
}

} // namespace jp::app
