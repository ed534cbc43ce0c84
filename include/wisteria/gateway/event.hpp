#pragma once

#include "wisteria/gateway/events.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace wisteria::gateway
{

// op 0
struct Dispatch
{
    std::optional<uint64_t> sequence;
    std::string type;
    DispatchEvent event;

    bool operator==(const Dispatch&) const = default;
};

// op 1, sent by the server to ask for a heartbeat right away
struct HeartbeatRequest
{
    bool operator==(const HeartbeatRequest&) const = default;
};

// op 7
struct Reconnect
{
    bool operator==(const Reconnect&) const = default;
};

// op 9
struct InvalidSession
{
    bool resumable = false;

    bool operator==(const InvalidSession&) const = default;
};

// op 10
struct Hello
{
    uint64_t heartbeat_interval = 0;   // milliseconds

    bool operator==(const Hello&) const = default;
};

// op 11
struct HeartbeatAck
{
    bool operator==(const HeartbeatAck&) const = default;
};

using Event = std::variant<Dispatch, HeartbeatRequest, Reconnect, InvalidSession, Hello, HeartbeatAck>;

} // namespace wisteria::gateway
