#pragma once

#include "wisteria/fundamentals/json_utils.hpp"
#include "wisteria/models/member.hpp"
#include "wisteria/models/snowflake.hpp"

#include <optional>
#include <string>

namespace wisteria::models
{

struct VoiceState
{
    std::optional<Snowflake> guild_id;
    std::optional<Snowflake> channel_id;   // absent once the user left voice
    Snowflake user_id;
    std::optional<GuildMember> member;
    std::string session_id;
    bool deaf = false;
    bool mute = false;
    bool self_deaf = false;
    bool self_mute = false;
    std::optional<bool> self_stream;
    bool self_video = false;
    bool suppress = false;

    [[nodiscard]] static json_utils::Decoded<VoiceState> from_json(const boost::json::value& jv);

    bool operator==(const VoiceState&) const = default;
};

} // namespace wisteria::models
