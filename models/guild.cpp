#include "wisteria/models/guild.hpp"

namespace wisteria::models
{

using json_utils::Reader;

json_utils::Decoded<Guild> Guild::from_json(const boost::json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    Guild g;
    g.id = rd->required<Snowflake>("id");
    g.name = rd->required<std::string>("name");
    g.icon = rd->optional<std::string>("icon");
    g.splash = rd->optional<std::string>("splash");
    g.discovery_splash = rd->optional<std::string>("discovery_splash");
    g.owner_id = rd->required<Snowflake>("owner_id");
    g.region = rd->optional<std::string>("region");
    g.afk_channel_id = rd->optional<Snowflake>("afk_channel_id");
    g.afk_timeout = rd->required<uint32_t>("afk_timeout");
    g.verification_level = rd->required<uint8_t>("verification_level");
    g.default_message_notifications = rd->required<uint8_t>("default_message_notifications");
    g.explicit_content_filter = rd->required<uint8_t>("explicit_content_filter");
    g.roles = rd->required<std::vector<Role>>("roles");
    g.emojis = rd->required<std::vector<Emoji>>("emojis");
    g.features = rd->required<std::vector<std::string>>("features");
    g.mfa_level = rd->required<uint8_t>("mfa_level");
    g.application_id = rd->optional<Snowflake>("application_id");
    g.system_channel_id = rd->optional<Snowflake>("system_channel_id");
    g.rules_channel_id = rd->optional<Snowflake>("rules_channel_id");
    g.joined_at = rd->optional<std::string>("joined_at");
    g.large = rd->optional<bool>("large");
    g.unavailable = rd->optional<bool>("unavailable");
    g.member_count = rd->optional<uint32_t>("member_count");
    g.voice_states = rd->list_or_empty<VoiceState>("voice_states");
    g.members = rd->list_or_empty<GuildMember>("members");
    g.channels = rd->list_or_empty<Channel>("channels");
    g.presences = rd->list_or_empty<Presence>("presences");
    g.max_members = rd->optional<uint32_t>("max_members");
    g.vanity_url_code = rd->optional<std::string>("vanity_url_code");
    g.description = rd->optional<std::string>("description");
    g.banner = rd->optional<std::string>("banner");
    g.premium_tier = rd->required<uint8_t>("premium_tier");
    g.premium_subscription_count = rd->optional<uint32_t>("premium_subscription_count");
    g.preferred_locale = rd->optional<std::string>("preferred_locale");
    return rd->finish(std::move(g));
}

json_utils::Decoded<UnavailableGuild> UnavailableGuild::from_json(const boost::json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    UnavailableGuild g;
    g.id = rd->required<Snowflake>("id");
    g.unavailable = rd->optional<bool>("unavailable");
    return rd->finish(std::move(g));
}

} // namespace wisteria::models
