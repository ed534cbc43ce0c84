#include "wisteria/models/message.hpp"
#include "wisteria/rest/http_client.hpp"

#include <format>

namespace wisteria::models
{

using json_utils::Reader;

std::optional<MessageKind> message_kind_from(uint64_t raw)
{
    if (raw > static_cast<uint64_t>(MessageKind::GuildDiscoveryRequalified) || raw == 13)
    {
        return std::nullopt;
    }
    return static_cast<MessageKind>(raw);
}

json_utils::Decoded<Attachment> Attachment::from_json(const boost::json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    Attachment a;
    a.id = rd->required<Snowflake>("id");
    a.filename = rd->required<std::string>("filename");
    a.size = rd->required<uint64_t>("size");
    a.url = rd->required<std::string>("url");
    a.proxy_url = rd->required<std::string>("proxy_url");
    a.height = rd->optional<uint32_t>("height");
    a.width = rd->optional<uint32_t>("width");
    return rd->finish(std::move(a));
}

json_utils::Decoded<Reaction> Reaction::from_json(const boost::json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    Reaction r;
    r.count = rd->required<uint32_t>("count");
    r.me = rd->required<bool>("me");
    r.emoji = rd->required<Emoji>("emoji");
    return rd->finish(std::move(r));
}

json_utils::Decoded<MessageReference> MessageReference::from_json(const boost::json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    MessageReference ref;
    ref.message_id = rd->optional<Snowflake>("message_id");
    ref.channel_id = rd->optional<Snowflake>("channel_id");
    ref.guild_id = rd->optional<Snowflake>("guild_id");
    return rd->finish(std::move(ref));
}

json_utils::Decoded<MessageApplication> MessageApplication::from_json(const boost::json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    MessageApplication app;
    app.id = rd->required<Snowflake>("id");
    app.cover_image = rd->optional<std::string>("cover_image");
    app.description = rd->required<std::string>("description");
    app.icon = rd->optional<std::string>("icon");
    app.name = rd->required<std::string>("name");
    return rd->finish(std::move(app));
}

json_utils::Decoded<Message> Message::from_json(const boost::json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    Message m;
    m.id = rd->required<Snowflake>("id");
    m.channel_id = rd->required<Snowflake>("channel_id");
    m.guild_id = rd->optional<Snowflake>("guild_id");
    m.author = rd->required<User>("author");
    m.member = rd->optional<GuildMember>("member");
    m.content = rd->required<std::string>("content");
    m.timestamp = rd->required<std::string>("timestamp");
    m.edited_timestamp = rd->optional<std::string>("edited_timestamp");
    m.tts = rd->required<bool>("tts");
    m.mention_everyone = rd->required<bool>("mention_everyone");
    m.mentions = rd->required<std::vector<User>>("mentions");
    m.mention_roles = rd->required<std::vector<Snowflake>>("mention_roles");
    m.mention_channels = rd->list_or_empty<ChannelMention>("mention_channels");
    m.attachments = rd->required<std::vector<Attachment>>("attachments");
    m.embeds = rd->list_or_empty<Embed>("embeds");
    m.reactions = rd->list_or_empty<Reaction>("reactions");
    m.nonce = rd->optional_text("nonce");
    m.pinned = rd->required<bool>("pinned");
    m.webhook_id = rd->optional<Snowflake>("webhook_id");
    if (auto raw = rd->optional<uint64_t>("type"))
    {
        m.kind = message_kind_from(*raw);
        if (!m.kind)
        {
            rd->reject("type", std::format("unknown message type {}", *raw));
        }
    }
    m.application = rd->optional<MessageApplication>("application");
    m.message_reference = rd->optional<MessageReference>("message_reference");
    m.flags = rd->optional<uint64_t>("flags");
    return rd->finish(std::move(m));
}

net::awaitable<std::expected<Message, Error>> Message::send(rest::HttpClient& http, std::string content) const
{
    return http.send_message(channel_id, std::move(content));
}

net::awaitable<std::expected<Message, Error>> Message::send_embed(rest::HttpClient& http, Embed embed) const
{
    return http.send_embed(channel_id, std::move(embed));
}

net::awaitable<std::expected<void, Error>> Message::add_reaction(rest::HttpClient& http, std::string emoji) const
{
    return http.add_reaction(channel_id, id, std::move(emoji));
}

net::awaitable<std::expected<void, Error>> Message::add_reaction_to_message(rest::HttpClient& http, Snowflake message_id, std::string emoji) const
{
    return http.add_reaction(channel_id, std::move(message_id), std::move(emoji));
}

net::awaitable<std::expected<void, Error>> Message::remove(rest::HttpClient& http) const
{
    return http.delete_message(channel_id, id);
}

net::awaitable<std::expected<void, Error>> Message::pin(rest::HttpClient& http) const
{
    return http.pin_message(channel_id, id);
}

net::awaitable<std::expected<void, Error>> Message::unpin(rest::HttpClient& http) const
{
    return http.unpin_message(channel_id, id);
}

} // namespace wisteria::models
