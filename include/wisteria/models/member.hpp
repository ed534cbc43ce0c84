#pragma once

#include "wisteria/fundamentals/json_utils.hpp"
#include "wisteria/models/snowflake.hpp"
#include "wisteria/models/user.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wisteria::models
{

// Guild-specific data about a user. `user` is left out when the member is
// attached to an object that already carries the user (message authors).
struct GuildMember
{
    std::optional<User> user;
    std::optional<std::string> nick;
    std::vector<Snowflake> roles;
    std::string joined_at;
    std::optional<std::string> premium_since;
    bool deaf = false;
    bool mute = false;

    [[nodiscard]] static json_utils::Decoded<GuildMember> from_json(const boost::json::value& jv);

    bool operator==(const GuildMember&) const = default;
};

} // namespace wisteria::models
