#pragma once

#include "wisteria/error.hpp"
#include "wisteria/gateway/event.hpp"
#include "wisteria/gateway/frame.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>

namespace wisteria::gateway
{

enum class Opcode : uint8_t
{
    Dispatch            = 0,
    Heartbeat           = 1,
    Identify            = 2,
    PresenceUpdate      = 3,
    VoiceStateUpdate    = 4,
    Resume              = 6,
    Reconnect           = 7,
    RequestGuildMembers = 8,
    InvalidSession      = 9,
    Hello               = 10,
    HeartbeatAck        = 11,
};

[[nodiscard]] std::optional<Opcode> opcode_from(int64_t raw);
[[nodiscard]] std::string_view to_string(Opcode op);

// Classifies one inbound frame. Pure; safe to call from any thread.
[[nodiscard]] std::expected<Event, Error> resolve(const FrameEnvelope& frame);

} // namespace wisteria::gateway
