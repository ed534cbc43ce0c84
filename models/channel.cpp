#include "wisteria/models/channel.hpp"

#include <format>

namespace wisteria::models
{

using json_utils::Reader;

namespace {

ChannelType read_channel_type(Reader& rd)
{
    auto raw = rd.required<uint64_t>("type");
    if (!rd.ok())
    {
        return ChannelType::GuildText;
    }
    auto kind = channel_type_from(raw);
    if (!kind)
    {
        rd.reject("type", std::format("unknown channel type {}", raw));
        return ChannelType::GuildText;
    }
    return *kind;
}

} // namespace

std::optional<ChannelType> channel_type_from(uint64_t raw)
{
    if (raw > static_cast<uint64_t>(ChannelType::GuildMedia) || (raw >= 7 && raw <= 9))
    {
        return std::nullopt;
    }
    return static_cast<ChannelType>(raw);
}

json_utils::Decoded<Overwrite> Overwrite::from_json(const boost::json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    Overwrite o;
    o.id = rd->required<Snowflake>("id");
    o.kind = rd->required_text("type");
    o.allow = rd->required_text("allow");
    o.deny = rd->required_text("deny");
    return rd->finish(std::move(o));
}

json_utils::Decoded<Channel> Channel::from_json(const boost::json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    Channel c;
    c.id = rd->required<Snowflake>("id");
    c.kind = read_channel_type(*rd);
    c.guild_id = rd->optional<Snowflake>("guild_id");
    c.position = rd->optional<int32_t>("position");
    c.permission_overwrites = rd->list_or_empty<Overwrite>("permission_overwrites");
    c.name = rd->optional<std::string>("name");
    c.topic = rd->optional<std::string>("topic");
    c.nsfw = rd->optional<bool>("nsfw");
    c.last_message_id = rd->optional<Snowflake>("last_message_id");
    c.bitrate = rd->optional<uint32_t>("bitrate");
    c.user_limit = rd->optional<uint32_t>("user_limit");
    c.rate_limit_per_user = rd->optional<uint32_t>("rate_limit_per_user");
    c.recipients = rd->list_or_empty<User>("recipients");
    c.icon = rd->optional<std::string>("icon");
    c.owner_id = rd->optional<Snowflake>("owner_id");
    c.application_id = rd->optional<Snowflake>("application_id");
    c.parent_id = rd->optional<Snowflake>("parent_id");
    c.last_pin_timestamp = rd->optional<std::string>("last_pin_timestamp");
    c.message_count = rd->optional<uint32_t>("message_count");
    c.member_count = rd->optional<uint32_t>("member_count");
    return rd->finish(std::move(c));
}

json_utils::Decoded<ChannelMention> ChannelMention::from_json(const boost::json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    ChannelMention m;
    m.id = rd->required<Snowflake>("id");
    m.guild_id = rd->required<Snowflake>("guild_id");
    m.kind = read_channel_type(*rd);
    m.name = rd->required<std::string>("name");
    return rd->finish(std::move(m));
}

} // namespace wisteria::models
