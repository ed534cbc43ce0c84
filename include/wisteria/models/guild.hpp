#pragma once

#include "wisteria/fundamentals/json_utils.hpp"
#include "wisteria/models/channel.hpp"
#include "wisteria/models/emoji.hpp"
#include "wisteria/models/member.hpp"
#include "wisteria/models/presence.hpp"
#include "wisteria/models/role.hpp"
#include "wisteria/models/snowflake.hpp"
#include "wisteria/models/voice.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wisteria::models
{

/**
 * A guild as sent by GUILD_CREATE / GUILD_UPDATE.
 * The large collections (members, channels, voice_states, presences) are
 * only present in GUILD_CREATE; they decode to empty elsewhere.
 */
struct Guild
{
    Snowflake id;
    std::string name;
    std::optional<std::string> icon;
    std::optional<std::string> splash;
    std::optional<std::string> discovery_splash;
    Snowflake owner_id;
    std::optional<std::string> region;
    std::optional<Snowflake> afk_channel_id;
    uint32_t afk_timeout = 0;
    uint8_t verification_level = 0;
    uint8_t default_message_notifications = 0;
    uint8_t explicit_content_filter = 0;
    std::vector<Role> roles;
    std::vector<Emoji> emojis;
    std::vector<std::string> features;
    uint8_t mfa_level = 0;
    std::optional<Snowflake> application_id;
    std::optional<Snowflake> system_channel_id;
    std::optional<Snowflake> rules_channel_id;
    std::optional<std::string> joined_at;
    std::optional<bool> large;
    std::optional<bool> unavailable;
    std::optional<uint32_t> member_count;
    std::vector<VoiceState> voice_states;
    std::vector<GuildMember> members;
    std::vector<Channel> channels;
    std::vector<Presence> presences;
    std::optional<uint32_t> max_members;
    std::optional<std::string> vanity_url_code;
    std::optional<std::string> description;
    std::optional<std::string> banner;
    uint8_t premium_tier = 0;
    std::optional<uint32_t> premium_subscription_count;
    std::optional<std::string> preferred_locale;

    [[nodiscard]] static json_utils::Decoded<Guild> from_json(const boost::json::value& jv);

    bool operator==(const Guild&) const = default;
};

// A guild the session cannot see yet (READY) or has lost (GUILD_DELETE).
// `unavailable` absent in GUILD_DELETE means the user was removed.
struct UnavailableGuild
{
    Snowflake id;
    std::optional<bool> unavailable;

    [[nodiscard]] static json_utils::Decoded<UnavailableGuild> from_json(const boost::json::value& jv);

    bool operator==(const UnavailableGuild&) const = default;
};

} // namespace wisteria::models
