#include "wisteria/gateway/opcode.hpp"
#include "wisteria/fundamentals/json_utils.hpp"
#include "wisteria/gateway/dispatch_registry.hpp"

namespace wisteria::gateway
{

namespace {

std::expected<Event, Error> resolve_dispatch(const FrameEnvelope& frame)
{
    if (!frame.d)
    {
        return std::unexpected(Error::invalid_format("d", "dispatch frame without payload"));
    }
    if (!frame.t)
    {
        return std::unexpected(Error::invalid_format("t", "dispatch frame without event type"));
    }

    auto ev = DispatchRegistry::instance().decode(*frame.t, *frame.d);
    if (!ev)
    {
        return std::unexpected(std::move(ev.error()));
    }
    return Dispatch{frame.s, *frame.t, std::move(*ev)};
}

std::expected<Event, Error> resolve_invalid_session(const FrameEnvelope& frame)
{
    if (!frame.d)
    {
        return std::unexpected(Error::invalid_format("d", "INVALID_SESSION without payload"));
    }
    if (!frame.d->is_bool())
    {
        return std::unexpected(Error::invalid_format("d", "INVALID_SESSION payload must be a boolean"));
    }
    return InvalidSession{frame.d->get_bool()};
}

std::expected<Event, Error> resolve_hello(const FrameEnvelope& frame)
{
    if (!frame.d)
    {
        return std::unexpected(Error::invalid_format("d", "HELLO without payload"));
    }

    auto rd = json_utils::Reader::open(*frame.d);
    if (!rd)
    {
        return std::unexpected(Error::invalid_format("d", "HELLO payload must be an object"));
    }
    auto interval = rd->required<uint64_t>("heartbeat_interval");
    if (rd->ok() && interval == 0)
    {
        rd->reject("heartbeat_interval", "must be positive");
    }
    auto hello = rd->finish(Hello{interval});
    if (!hello)
    {
        return std::unexpected(Error::invalid_format("d", hello.error().message()));
    }
    return *hello;
}

} // namespace

std::optional<Opcode> opcode_from(int64_t raw)
{
    switch (raw)
    {
        case 0: case 1: case 2: case 3: case 4:
        case 6: case 7: case 8: case 9: case 10: case 11:
            return static_cast<Opcode>(raw);
        default:
            return std::nullopt;
    }
}

std::string_view to_string(Opcode op)
{
    switch (op)
    {
        case Opcode::Dispatch:            return "DISPATCH";
        case Opcode::Heartbeat:           return "HEARTBEAT";
        case Opcode::Identify:            return "IDENTIFY";
        case Opcode::PresenceUpdate:      return "PRESENCE_UPDATE";
        case Opcode::VoiceStateUpdate:    return "VOICE_STATE_UPDATE";
        case Opcode::Resume:              return "RESUME";
        case Opcode::Reconnect:           return "RECONNECT";
        case Opcode::RequestGuildMembers: return "REQUEST_GUILD_MEMBERS";
        case Opcode::InvalidSession:      return "INVALID_SESSION";
        case Opcode::Hello:               return "HELLO";
        case Opcode::HeartbeatAck:        return "HEARTBEAT_ACK";
    }
    return "UNKNOWN";
}

std::expected<Event, Error> resolve(const FrameEnvelope& frame)
{
    auto op = opcode_from(frame.op);
    if (!op)
    {
        return std::unexpected(Error::unexpected_opcode(frame.op));
    }

    switch (*op)
    {
        case Opcode::Dispatch:
            return resolve_dispatch(frame);
        case Opcode::Heartbeat:
        case Opcode::Reconnect:
        case Opcode::InvalidSession:
        case Opcode::Hello:
        case Opcode::HeartbeatAck:
            break;
        default:
            // Identify, Resume and the other client-to-server opcodes.
            return std::unexpected(Error::unexpected_opcode(frame.op));
    }

    if (frame.t)
    {
        return std::unexpected(Error::invalid_format("t", "event type on a non-dispatch frame"));
    }

    switch (*op)
    {
        case Opcode::Heartbeat:      return HeartbeatRequest{};
        case Opcode::Reconnect:      return Reconnect{};
        case Opcode::InvalidSession: return resolve_invalid_session(frame);
        case Opcode::Hello:          return resolve_hello(frame);
        default:                     return HeartbeatAck{};
    }
}

} // namespace wisteria::gateway
