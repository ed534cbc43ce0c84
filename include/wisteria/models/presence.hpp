#pragma once

#include "wisteria/fundamentals/json_utils.hpp"
#include "wisteria/models/snowflake.hpp"
#include "wisteria/models/user.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wisteria::models
{

struct Activity
{
    std::string name;
    uint8_t kind = 0;   // 0 game, 1 streaming, 2 listening, 4 custom, 5 competing
    std::optional<std::string> url;
    std::optional<uint64_t> created_at;
    std::optional<Snowflake> application_id;
    std::optional<std::string> details;
    std::optional<std::string> state;

    [[nodiscard]] static json_utils::Decoded<Activity> from_json(const boost::json::value& jv);

    bool operator==(const Activity&) const = default;
};

struct ClientStatus
{
    std::optional<std::string> desktop;
    std::optional<std::string> mobile;
    std::optional<std::string> web;

    [[nodiscard]] static json_utils::Decoded<ClientStatus> from_json(const boost::json::value& jv);

    bool operator==(const ClientStatus&) const = default;
};

struct Presence
{
    PartialUser user;
    std::optional<Snowflake> guild_id;
    std::string status;   // idle, dnd, online, offline
    std::vector<Activity> activities;
    std::optional<ClientStatus> client_status;

    [[nodiscard]] static json_utils::Decoded<Presence> from_json(const boost::json::value& jv);

    bool operator==(const Presence&) const = default;
};

} // namespace wisteria::models
