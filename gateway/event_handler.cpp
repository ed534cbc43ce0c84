#include "wisteria/gateway/event_handler.hpp"
#include "wisteria/gateway/opcode.hpp"
#include "wisteria/logger.hpp"

#include <string>
#include <type_traits>
#include <variant>

namespace wisteria::gateway
{

EventHandler::EventHandler(bool ignore_unknown_dispatch)
    : ignore_unknown(ignore_unknown_dispatch)
{
}

EventHandler::EventHandler(const Config& config)
    : ignore_unknown(config.gateway().ignore_unknown_dispatch)
    , max_frame(config.gateway().max_frame_size)
{
}

template<class Ev>
void EventHandler::notify(const Ev& ev)
{
    if (auto it = hdls.find(std::type_index(typeid(Ev))); it != hdls.end())
    {
        for (const auto& hdl : it->second)
        {
            hdl(&ev);
        }
    }
}

std::expected<void, Error> EventHandler::handle(const FrameEnvelope& frame)
{
    auto event = resolve(frame);
    if (!event)
    {
        const auto& err = event.error();
        if (err.code == Error::errc::unknown_dispatch && ignore_unknown)
        {
            WISTERIA_LOG_WARN("Ignoring dispatch: {}", err);
            return {};
        }
        WISTERIA_LOG_ERROR("Dropping frame (op {}): {}", frame.op, err);
        return std::unexpected(err);
    }

    route(*event);
    return {};
}

std::expected<void, Error> EventHandler::handle(std::string_view text)
{
    auto frame = FrameEnvelope::parse(text, max_frame);
    if (!frame)
    {
        WISTERIA_LOG_ERROR("Dropping frame text ({} bytes): {}", text.size(), frame.error());
        return std::unexpected(std::move(frame.error()));
    }
    return handle(*frame);
}

void EventHandler::route(const Event& event)
{
    std::visit([this](const auto& ev)
    {
        notify(ev);
        if constexpr (std::is_same_v<std::decay_t<decltype(ev)>, Dispatch>)
        {
            WISTERIA_LOG_DEBUG("Dispatch {} (seq {})", ev.type,
                               ev.sequence ? std::to_string(*ev.sequence) : std::string("none"));
            std::visit([this](const auto& inner) { notify(inner); }, ev.event);
        }
    }, event);
}

} // namespace wisteria::gateway
