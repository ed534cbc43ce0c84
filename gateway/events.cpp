#include "wisteria/gateway/events.hpp"

namespace wisteria::gateway::events
{

using json_utils::Reader;

namespace {

// Events whose body is exactly one model object.
template<class Ev, class Model>
Decoded<Ev> wrap(const json::value& jv, Model Ev::*member)
{
    auto m = Model::from_json(jv);
    if (!m)
    {
        return std::unexpected(m.error());
    }
    Ev ev;
    ev.*member = std::move(*m);
    return ev;
}

// {guild_id, user}
template<class Ev>
Decoded<Ev> guild_user(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    Ev ev;
    ev.guild_id = rd->required<Snowflake>("guild_id");
    ev.user = rd->required<models::User>("user");
    return rd->finish(std::move(ev));
}

// {guild_id, role}
template<class Ev>
Decoded<Ev> guild_role(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    Ev ev;
    ev.guild_id = rd->required<Snowflake>("guild_id");
    ev.role = rd->required<models::Role>("role");
    return rd->finish(std::move(ev));
}

} // namespace

Decoded<Ready> Ready::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    Ready ev;
    ev.v = rd->required<uint32_t>("v");
    ev.user = rd->required<models::User>("user");
    ev.private_channels = rd->list_or_empty<models::Channel>("private_channels");
    ev.guilds = rd->required<std::vector<models::UnavailableGuild>>("guilds");
    ev.session_id = rd->required<std::string>("session_id");
    ev.shard = rd->optional<std::vector<uint32_t>>("shard");
    return rd->finish(std::move(ev));
}

// Both bodies only carry debugging traces.
Decoded<Resumed> Resumed::from_json(const json::value&)
{
    return Resumed{};
}

Decoded<Reconnect> Reconnect::from_json(const json::value&)
{
    return Reconnect{};
}

Decoded<ChannelCreate> ChannelCreate::from_json(const json::value& jv)
{
    return wrap(jv, &ChannelCreate::channel);
}

Decoded<ChannelUpdate> ChannelUpdate::from_json(const json::value& jv)
{
    return wrap(jv, &ChannelUpdate::channel);
}

Decoded<ChannelDelete> ChannelDelete::from_json(const json::value& jv)
{
    return wrap(jv, &ChannelDelete::channel);
}

Decoded<ChannelPinsUpdate> ChannelPinsUpdate::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    ChannelPinsUpdate ev;
    ev.guild_id = rd->optional<Snowflake>("guild_id");
    ev.channel_id = rd->required<Snowflake>("channel_id");
    ev.last_pin_timestamp = rd->optional<std::string>("last_pin_timestamp");
    return rd->finish(std::move(ev));
}

Decoded<GuildCreate> GuildCreate::from_json(const json::value& jv)
{
    return wrap(jv, &GuildCreate::guild);
}

Decoded<GuildUpdate> GuildUpdate::from_json(const json::value& jv)
{
    return wrap(jv, &GuildUpdate::guild);
}

Decoded<GuildDelete> GuildDelete::from_json(const json::value& jv)
{
    return wrap(jv, &GuildDelete::guild);
}

Decoded<GuildBanAdd> GuildBanAdd::from_json(const json::value& jv)
{
    return guild_user<GuildBanAdd>(jv);
}

Decoded<GuildBanRemove> GuildBanRemove::from_json(const json::value& jv)
{
    return guild_user<GuildBanRemove>(jv);
}

Decoded<GuildEmojisUpdate> GuildEmojisUpdate::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    GuildEmojisUpdate ev;
    ev.guild_id = rd->required<Snowflake>("guild_id");
    ev.emojis = rd->required<std::vector<models::Emoji>>("emojis");
    return rd->finish(std::move(ev));
}

Decoded<GuildIntegrationsUpdate> GuildIntegrationsUpdate::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    GuildIntegrationsUpdate ev;
    ev.guild_id = rd->required<Snowflake>("guild_id");
    return rd->finish(std::move(ev));
}

Decoded<GuildMemberAdd> GuildMemberAdd::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    GuildMemberAdd ev;
    ev.guild_id = rd->required<Snowflake>("guild_id");
    if (!rd->ok())
    {
        return rd->finish(std::move(ev));
    }
    auto member = models::GuildMember::from_json(jv);
    if (!member)
    {
        return std::unexpected(member.error());
    }
    ev.member = std::move(*member);
    return ev;
}

Decoded<GuildMemberRemove> GuildMemberRemove::from_json(const json::value& jv)
{
    return guild_user<GuildMemberRemove>(jv);
}

Decoded<GuildMemberUpdate> GuildMemberUpdate::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    GuildMemberUpdate ev;
    ev.guild_id = rd->required<Snowflake>("guild_id");
    ev.roles = rd->required<std::vector<Snowflake>>("roles");
    ev.user = rd->required<models::User>("user");
    ev.nick = rd->optional<std::string>("nick");
    ev.premium_since = rd->optional<std::string>("premium_since");
    return rd->finish(std::move(ev));
}

Decoded<GuildMembersChunk> GuildMembersChunk::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    GuildMembersChunk ev;
    ev.guild_id = rd->required<Snowflake>("guild_id");
    ev.members = rd->required<std::vector<models::GuildMember>>("members");
    ev.chunk_index = rd->required<uint32_t>("chunk_index");
    ev.chunk_count = rd->required<uint32_t>("chunk_count");
    ev.not_found = rd->list_or_empty<Snowflake>("not_found");
    ev.presences = rd->list_or_empty<models::Presence>("presences");
    ev.nonce = rd->optional<std::string>("nonce");
    return rd->finish(std::move(ev));
}

Decoded<GuildRoleCreate> GuildRoleCreate::from_json(const json::value& jv)
{
    return guild_role<GuildRoleCreate>(jv);
}

Decoded<GuildRoleUpdate> GuildRoleUpdate::from_json(const json::value& jv)
{
    return guild_role<GuildRoleUpdate>(jv);
}

Decoded<GuildRoleDelete> GuildRoleDelete::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    GuildRoleDelete ev;
    ev.guild_id = rd->required<Snowflake>("guild_id");
    ev.role_id = rd->required<Snowflake>("role_id");
    return rd->finish(std::move(ev));
}

Decoded<MessageCreate> MessageCreate::from_json(const json::value& jv)
{
    return wrap(jv, &MessageCreate::message);
}

Decoded<MessageUpdate> MessageUpdate::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    MessageUpdate ev;
    ev.id = rd->required<Snowflake>("id");
    ev.channel_id = rd->required<Snowflake>("channel_id");
    ev.guild_id = rd->optional<Snowflake>("guild_id");
    ev.author = rd->optional<models::User>("author");
    ev.member = rd->optional<models::GuildMember>("member");
    ev.content = rd->optional<std::string>("content");
    ev.timestamp = rd->optional<std::string>("timestamp");
    ev.edited_timestamp = rd->optional<std::string>("edited_timestamp");
    ev.tts = rd->optional<bool>("tts");
    ev.mention_everyone = rd->optional<bool>("mention_everyone");
    ev.mentions = rd->optional<std::vector<models::User>>("mentions");
    ev.mention_roles = rd->optional<std::vector<Snowflake>>("mention_roles");
    ev.attachments = rd->optional<std::vector<models::Attachment>>("attachments");
    ev.embeds = rd->optional<std::vector<models::Embed>>("embeds");
    ev.pinned = rd->optional<bool>("pinned");
    ev.flags = rd->optional<uint64_t>("flags");
    return rd->finish(std::move(ev));
}

Decoded<MessageDelete> MessageDelete::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    MessageDelete ev;
    ev.id = rd->required<Snowflake>("id");
    ev.channel_id = rd->required<Snowflake>("channel_id");
    ev.guild_id = rd->optional<Snowflake>("guild_id");
    return rd->finish(std::move(ev));
}

Decoded<MessageDeleteBulk> MessageDeleteBulk::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    MessageDeleteBulk ev;
    ev.ids = rd->required<std::vector<Snowflake>>("ids");
    ev.channel_id = rd->required<Snowflake>("channel_id");
    ev.guild_id = rd->optional<Snowflake>("guild_id");
    return rd->finish(std::move(ev));
}

Decoded<MessageReactionAdd> MessageReactionAdd::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    MessageReactionAdd ev;
    ev.user_id = rd->required<Snowflake>("user_id");
    ev.channel_id = rd->required<Snowflake>("channel_id");
    ev.message_id = rd->required<Snowflake>("message_id");
    ev.guild_id = rd->optional<Snowflake>("guild_id");
    ev.member = rd->optional<models::GuildMember>("member");
    ev.emoji = rd->required<models::Emoji>("emoji");
    return rd->finish(std::move(ev));
}

Decoded<MessageReactionRemove> MessageReactionRemove::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    MessageReactionRemove ev;
    ev.user_id = rd->required<Snowflake>("user_id");
    ev.channel_id = rd->required<Snowflake>("channel_id");
    ev.message_id = rd->required<Snowflake>("message_id");
    ev.guild_id = rd->optional<Snowflake>("guild_id");
    ev.emoji = rd->required<models::Emoji>("emoji");
    return rd->finish(std::move(ev));
}

Decoded<MessageReactionRemoveAll> MessageReactionRemoveAll::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    MessageReactionRemoveAll ev;
    ev.channel_id = rd->required<Snowflake>("channel_id");
    ev.message_id = rd->required<Snowflake>("message_id");
    ev.guild_id = rd->optional<Snowflake>("guild_id");
    return rd->finish(std::move(ev));
}

Decoded<MessageReactionRemoveEmoji> MessageReactionRemoveEmoji::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    MessageReactionRemoveEmoji ev;
    ev.channel_id = rd->required<Snowflake>("channel_id");
    ev.guild_id = rd->optional<Snowflake>("guild_id");
    ev.message_id = rd->required<Snowflake>("message_id");
    ev.emoji = rd->required<models::Emoji>("emoji");
    return rd->finish(std::move(ev));
}

Decoded<PresenceUpdate> PresenceUpdate::from_json(const json::value& jv)
{
    return wrap(jv, &PresenceUpdate::presence);
}

Decoded<TypingStart> TypingStart::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    TypingStart ev;
    ev.channel_id = rd->required<Snowflake>("channel_id");
    ev.guild_id = rd->optional<Snowflake>("guild_id");
    ev.user_id = rd->required<Snowflake>("user_id");
    ev.timestamp = rd->required<uint64_t>("timestamp");
    ev.member = rd->optional<models::GuildMember>("member");
    return rd->finish(std::move(ev));
}

Decoded<UserUpdate> UserUpdate::from_json(const json::value& jv)
{
    return wrap(jv, &UserUpdate::user);
}

Decoded<VoiceStateUpdate> VoiceStateUpdate::from_json(const json::value& jv)
{
    return wrap(jv, &VoiceStateUpdate::state);
}

Decoded<VoiceServerUpdate> VoiceServerUpdate::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    VoiceServerUpdate ev;
    ev.token = rd->required<std::string>("token");
    ev.guild_id = rd->required<Snowflake>("guild_id");
    ev.endpoint = rd->optional<std::string>("endpoint");
    return rd->finish(std::move(ev));
}

} // namespace wisteria::gateway::events

namespace wisteria::gateway
{

std::string_view tag_of(const DispatchEvent& ev)
{
    return std::visit([](const auto& e) { return std::decay_t<decltype(e)>::tag; }, ev);
}

} // namespace wisteria::gateway
