#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>

#include "wisteria/gateway/dispatch_registry.hpp"
#include "wisteria/gateway/opcode.hpp"

#include <algorithm>
#include <boost/json.hpp>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace json = boost::json;
using namespace wisteria;
using namespace wisteria::gateway;

namespace {

constexpr const char* minimal_message = R"({
    "id": "334385199974967042",
    "channel_id": "290926798999357250",
    "author": {
        "id": "53908099506183680",
        "username": "Mason",
        "discriminator": "9999",
        "avatar": null
    },
    "content": "Supa Hot",
    "timestamp": "2017-07-11T17:27:07.299000+00:00",
    "edited_timestamp": null,
    "tts": false,
    "mention_everyone": false,
    "mentions": [],
    "mention_roles": [],
    "attachments": [],
    "pinned": false
})";

std::expected<DispatchEvent, Error> decode(std::string_view tag, std::string_view body)
{
    return DispatchRegistry::instance().decode(tag, json::parse(body));
}

}

TEST_CASE("MESSAGE_CREATE decodes a minimal message")
{
    FrameEnvelope frame;
    frame.op = 0;
    frame.s = 2;
    frame.t = "MESSAGE_CREATE";
    frame.d = json::parse(minimal_message);

    auto ev = resolve(frame);

    REQUIRE(ev.has_value());
    const auto& dispatch = std::get<Dispatch>(*ev);
    CHECK(dispatch.type == "MESSAGE_CREATE");
    const auto& msg = std::get<events::MessageCreate>(dispatch.event).message;
    CHECK(msg.id == "334385199974967042");
    CHECK(msg.channel_id == "290926798999357250");
    CHECK(msg.author.id == "53908099506183680");
    CHECK(msg.author.username == "Mason");
    CHECK(msg.author.discriminator == "9999");
    CHECK(!msg.author.avatar.has_value());
    CHECK(msg.content == "Supa Hot");
    CHECK(msg.timestamp == "2017-07-11T17:27:07.299000+00:00");
    CHECK(!msg.edited_timestamp.has_value());
    CHECK(msg.tts == false);
    CHECK(msg.mention_everyone == false);
    CHECK(msg.pinned == false);
    CHECK(msg.embeds.empty());
    CHECK(msg.reactions.empty());
    CHECK(msg.mention_channels.empty());
    CHECK(!msg.guild_id.has_value());
    CHECK(!msg.kind.has_value());
}

TEST_CASE("unknown dispatch tag carries the tag")
{
    auto ev = decode("SOME_FUTURE_EVENT", "{}");

    REQUIRE(!ev.has_value());
    CHECK(ev.error() == Error::unknown_dispatch("SOME_FUTURE_EVENT"));
}

TEST_CASE("dispatch tags match case-sensitively")
{
    auto ev = decode("message_create", minimal_message);

    REQUIRE(!ev.has_value());
    CHECK(ev.error().code == Error::errc::unknown_dispatch);
    CHECK(ev.error().subject == "message_create");
}

TEST_CASE("a bad body is reported under its own tag")
{
    for (auto tag : {"CHANNEL_CREATE", "CHANNEL_UPDATE", "CHANNEL_DELETE"})
    {
        auto ev = decode(tag, R"({"id": "1"})");
        REQUIRE(!ev.has_value());
        CHECK(ev.error().code == Error::errc::invalid_format);
        CHECK(ev.error().subject == tag);
        CHECK(ev.error().detail == "\"type\": field required");
    }

    auto role = decode("GUILD_ROLE_UPDATE", R"({"guild_id": "1", "role": {"id": "2"}})");
    REQUIRE(!role.has_value());
    CHECK(role.error().subject == "GUILD_ROLE_UPDATE");
    CHECK(role.error().detail == "\"role.name\": field required");
}

TEST_CASE("a non-object body is a format error")
{
    auto ev = decode("MESSAGE_CREATE", "[]");

    REQUIRE(!ev.has_value());
    CHECK(ev.error().code == Error::errc::invalid_format);
    CHECK(ev.error().subject == "MESSAGE_CREATE");
}

TEST_CASE("message field errors carry the nested path")
{
    auto body = json::parse(minimal_message);
    body.as_object()["author"].as_object()["id"] = 5;

    auto ev = DispatchRegistry::instance().decode("MESSAGE_CREATE", body);

    REQUIRE(!ev.has_value());
    CHECK(ev.error().detail == "\"author.id\": must be a string");
}

TEST_CASE("registry holds one decoder per event type")
{
    const auto& reg = DispatchRegistry::instance();
    auto tags = reg.tags();

    CHECK(reg.size() == std::variant_size_v<DispatchEvent>);
    CHECK(tags.size() == reg.size());
    CHECK(std::ranges::is_sorted(tags));
    CHECK(std::ranges::adjacent_find(tags) == tags.end());
    CHECK(reg.contains("READY"));
    CHECK(reg.contains("GUILD_MEMBERS_CHUNK"));
    CHECK(reg.contains("VOICE_SERVER_UPDATE"));
    CHECK(!reg.contains("GUILD_MEMBER_CHUNK"));
}

TEST_CASE("tag_of reports the tag the event was decoded from")
{
    auto resumed = decode("RESUMED", "{}");
    REQUIRE(resumed.has_value());
    CHECK(tag_of(*resumed) == "RESUMED");

    auto deleted = decode("MESSAGE_DELETE", R"({"id": "1", "channel_id": "2"})");
    REQUIRE(deleted.has_value());
    CHECK(tag_of(*deleted) == "MESSAGE_DELETE");
}

TEST_CASE("GUILD_MEMBER_ADD flattens the member with its guild id")
{
    auto ev = decode("GUILD_MEMBER_ADD", R"({
        "guild_id": "41771983423143937",
        "user": {"id": "80351110224678912", "username": "Nelly", "discriminator": "1337"},
        "nick": "NOT API SUPPORT",
        "roles": ["41771983423143936"],
        "joined_at": "2015-04-26T06:26:56.936000+00:00",
        "deaf": false,
        "mute": true
    })");

    REQUIRE(ev.has_value());
    const auto& add = std::get<events::GuildMemberAdd>(*ev);
    CHECK(add.guild_id == "41771983423143937");
    REQUIRE(add.member.user.has_value());
    CHECK(add.member.user->tag() == "Nelly#1337");
    CHECK(add.member.nick == "NOT API SUPPORT");
    CHECK(add.member.roles == std::vector<models::Snowflake>{"41771983423143936"});
    CHECK(add.member.mute == true);
}

TEST_CASE("MESSAGE_UPDATE accepts a partial message")
{
    auto ev = decode("MESSAGE_UPDATE", R"({"id": "1", "channel_id": "2", "content": "edited", "embeds": []})");

    REQUIRE(ev.has_value());
    const auto& upd = std::get<events::MessageUpdate>(*ev);
    CHECK(upd.id == "1");
    CHECK(upd.content == "edited");
    CHECK(!upd.author.has_value());
    REQUIRE(upd.embeds.has_value());
    CHECK(upd.embeds->empty());
}

TEST_CASE("MESSAGE_REACTION_ADD decodes a custom emoji")
{
    auto ev = decode("MESSAGE_REACTION_ADD", R"({
        "user_id": "1", "channel_id": "2", "message_id": "3", "guild_id": "4",
        "emoji": {"id": "41771983429993937", "name": "LUL"}
    })");

    REQUIRE(ev.has_value());
    const auto& add = std::get<events::MessageReactionAdd>(*ev);
    CHECK(add.message_id == "3");
    CHECK(add.emoji.reaction_code() == "LUL:41771983429993937");
    CHECK(!add.member.has_value());
}

TEST_CASE("TYPING_START and MESSAGE_DELETE_BULK decode")
{
    auto typing = decode("TYPING_START", R"({"channel_id": "2", "user_id": "3", "timestamp": 1600000000})");
    REQUIRE(typing.has_value());
    CHECK(std::get<events::TypingStart>(*typing).timestamp == 1600000000u);

    auto bulk = decode("MESSAGE_DELETE_BULK", R"({"ids": ["1", "2"], "channel_id": "9"})");
    REQUIRE(bulk.has_value());
    CHECK(std::get<events::MessageDeleteBulk>(*bulk).ids.size() == 2);
}

using models::ChannelType;

namespace {

struct EventCase
{
    std::string_view tag;
    std::string_view body;
    std::function<void(const DispatchEvent&)> check;
};

constexpr const char* guild_body = R"({
    "id": "41771983423143937",
    "name": "Wisteria Test",
    "icon": null,
    "splash": null,
    "owner_id": "80351110224678912",
    "region": "us-east",
    "afk_channel_id": null,
    "afk_timeout": 300,
    "verification_level": 1,
    "default_message_notifications": 0,
    "explicit_content_filter": 2,
    "roles": [{"id": "41771983423143937", "name": "@everyone", "color": 0, "hoist": false,
               "position": 0, "permissions": "104324673", "managed": false, "mentionable": false}],
    "emojis": [{"id": "41771983429993937", "name": "LUL", "roles": [], "require_colons": true,
                "managed": false, "animated": false, "available": true}],
    "features": ["COMMUNITY", "NEWS"],
    "mfa_level": 0,
    "application_id": null,
    "system_channel_id": "41771983423143940",
    "joined_at": "2021-01-01T00:00:00.000000+00:00",
    "large": false,
    "member_count": 2,
    "voice_states": [{"channel_id": "41771983423143942", "user_id": "80351110224678912",
                      "session_id": "90326bd25d71d39b9ef95b299e3872ff", "deaf": false, "mute": false,
                      "self_deaf": false, "self_mute": true, "self_video": false, "suppress": false}],
    "members": [{"user": {"id": "80351110224678912", "username": "Nelly", "discriminator": "1337"},
                 "nick": null, "roles": [], "joined_at": "2015-04-26T06:26:56.936000+00:00",
                 "deaf": false, "mute": false}],
    "channels": [
        {"id": "41771983423143940", "type": 0, "name": "general", "position": 0,
         "permission_overwrites": [{"id": "41771983423143937", "type": 0, "allow": "0", "deny": "2048"}]},
        {"id": "41771983423143941", "type": 13, "name": "stage", "position": 1, "bitrate": 64000},
        {"id": "41771983423143943", "type": 15, "name": "forum", "position": 2},
        {"id": "41771983423143944", "type": 11, "name": "a thread", "parent_id": "41771983423143943",
         "message_count": 4, "member_count": 2}
    ],
    "presences": [{"user": {"id": "80351110224678912"}, "status": "online",
                   "activities": [{"name": "Rocket League", "type": 0}],
                   "client_status": {"desktop": "online"}}],
    "premium_tier": 1,
    "premium_subscription_count": 3,
    "preferred_locale": "en-US"
})";

constexpr const char* role_body = R"({"guild_id": "1", "role": {"id": "9", "name": "mods",
    "color": 3447003, "hoist": true, "position": 2, "permissions": 8, "managed": false, "mentionable": true}})";

constexpr const char* user_body = R"({"id": "80351110224678912", "username": "Nelly", "discriminator": "1337",
    "avatar": "8342729096ea3675442027381ff50dfe", "verified": true, "email": "nelly@example.com", "flags": 64})";

std::vector<EventCase> event_cases()
{
    return {
        {"READY", R"({"v": 8, "user": {"id": "1", "username": "bot", "discriminator": "0001", "bot": true},
                     "private_channels": [], "guilds": [{"id": "2", "unavailable": true}],
                     "session_id": "abc123", "shard": [0, 1]})",
         [](const DispatchEvent& ev)
         {
             const auto& ready = std::get<events::Ready>(ev);
             CHECK(ready.v == 8);
             CHECK(ready.user.bot == true);
             REQUIRE(ready.guilds.size() == 1);
             CHECK(ready.guilds[0].unavailable == true);
             CHECK(ready.session_id == "abc123");
             CHECK(ready.shard == std::vector<uint32_t>{0, 1});
         }},
        {"RECONNECT", "null",
         [](const DispatchEvent& ev) { CHECK(std::holds_alternative<events::Reconnect>(ev)); }},
        {"CHANNEL_CREATE", R"({"id": "5", "type": 1, "last_message_id": "6",
                              "recipients": [{"id": "7", "username": "a", "discriminator": "0002"}]})",
         [](const DispatchEvent& ev)
         {
             const auto& channel = std::get<events::ChannelCreate>(ev).channel;
             CHECK(channel.kind == ChannelType::DM);
             CHECK(channel.is_private());
             REQUIRE(channel.recipients.size() == 1);
             CHECK(channel.recipients[0].tag() == "a#0002");
         }},
        {"CHANNEL_UPDATE", R"({"id": "5", "guild_id": "3", "type": 0, "name": "general", "topic": "hi",
                              "nsfw": false, "rate_limit_per_user": 10})",
         [](const DispatchEvent& ev)
         {
             const auto& channel = std::get<events::ChannelUpdate>(ev).channel;
             CHECK(channel.topic == "hi");
             CHECK(channel.rate_limit_per_user == 10u);
         }},
        {"CHANNEL_DELETE", R"({"id": "5", "guild_id": "3", "type": 12, "parent_id": "4"})",
         [](const DispatchEvent& ev)
         {
             const auto& channel = std::get<events::ChannelDelete>(ev).channel;
             CHECK(channel.kind == ChannelType::PrivateThread);
             CHECK(channel.is_thread());
             CHECK(channel.parent_id == "4");
         }},
        {"CHANNEL_PINS_UPDATE", R"({"channel_id": "5", "last_pin_timestamp": "2020-01-01T00:00:00+00:00"})",
         [](const DispatchEvent& ev)
         {
             const auto& pins = std::get<events::ChannelPinsUpdate>(ev);
             CHECK(pins.channel_id == "5");
             CHECK(!pins.guild_id.has_value());
             CHECK(pins.last_pin_timestamp == "2020-01-01T00:00:00+00:00");
         }},
        {"GUILD_CREATE", guild_body,
         [](const DispatchEvent& ev)
         {
             const auto& guild = std::get<events::GuildCreate>(ev).guild;
             CHECK(guild.name == "Wisteria Test");
             CHECK(guild.afk_timeout == 300);
             CHECK(guild.features == std::vector<std::string>{"COMMUNITY", "NEWS"});
             REQUIRE(guild.roles.size() == 1);
             CHECK(guild.roles[0].permissions == "104324673");
             REQUIRE(guild.emojis.size() == 1);
             CHECK(guild.emojis[0].reaction_code() == "LUL:41771983429993937");
             REQUIRE(guild.channels.size() == 4);
             CHECK(guild.channels[0].permission_overwrites.at(0).deny == "2048");
             CHECK(guild.channels[1].kind == ChannelType::GuildStageVoice);
             CHECK(guild.channels[2].kind == ChannelType::GuildForum);
             CHECK(guild.channels[3].message_count == 4u);
             REQUIRE(guild.voice_states.size() == 1);
             CHECK(guild.voice_states[0].self_mute == true);
             REQUIRE(guild.members.size() == 1);
             CHECK(!guild.members[0].nick.has_value());
             REQUIRE(guild.presences.size() == 1);
             CHECK(guild.presences[0].activities.at(0).name == "Rocket League");
             CHECK(guild.presences[0].client_status->desktop == "online");
             CHECK(guild.premium_tier == 1);
         }},
        {"GUILD_UPDATE", guild_body,
         [](const DispatchEvent& ev)
         {
             const auto& guild = std::get<events::GuildUpdate>(ev).guild;
             CHECK(guild.owner_id == "80351110224678912");
             CHECK(guild.preferred_locale == "en-US");
         }},
        {"GUILD_DELETE", R"({"id": "41771983423143937", "unavailable": true})",
         [](const DispatchEvent& ev)
         {
             const auto& guild = std::get<events::GuildDelete>(ev).guild;
             CHECK(guild.id == "41771983423143937");
             CHECK(guild.unavailable == true);
         }},
        {"GUILD_BAN_ADD", R"({"guild_id": "1", "user": {"id": "2", "username": "spam", "discriminator": "6666"}})",
         [](const DispatchEvent& ev)
         {
             const auto& ban = std::get<events::GuildBanAdd>(ev);
             CHECK(ban.guild_id == "1");
             CHECK(ban.user.username == "spam");
         }},
        {"GUILD_BAN_REMOVE", R"({"guild_id": "1", "user": {"id": "2", "username": "spam", "discriminator": "6666"}})",
         [](const DispatchEvent& ev) { CHECK(std::get<events::GuildBanRemove>(ev).user.id == "2"); }},
        {"GUILD_EMOJIS_UPDATE", R"({"guild_id": "1", "emojis": [{"id": "3", "name": "blob", "animated": true}]})",
         [](const DispatchEvent& ev)
         {
             const auto& upd = std::get<events::GuildEmojisUpdate>(ev);
             REQUIRE(upd.emojis.size() == 1);
             CHECK(upd.emojis[0].animated == true);
         }},
        {"GUILD_INTEGRATIONS_UPDATE", R"({"guild_id": "1"})",
         [](const DispatchEvent& ev) { CHECK(std::get<events::GuildIntegrationsUpdate>(ev).guild_id == "1"); }},
        {"GUILD_MEMBER_REMOVE", R"({"guild_id": "1", "user": {"id": "2", "username": "gone", "discriminator": "0003"}})",
         [](const DispatchEvent& ev) { CHECK(std::get<events::GuildMemberRemove>(ev).user.username == "gone"); }},
        {"GUILD_MEMBER_UPDATE", R"({"guild_id": "1", "roles": ["4", "5"], "nick": "new nick",
                                   "user": {"id": "2", "username": "n", "discriminator": "0004"}})",
         [](const DispatchEvent& ev)
         {
             const auto& upd = std::get<events::GuildMemberUpdate>(ev);
             CHECK(upd.roles.size() == 2);
             CHECK(upd.nick == "new nick");
             CHECK(!upd.premium_since.has_value());
         }},
        {"GUILD_MEMBERS_CHUNK", R"({"guild_id": "1", "chunk_index": 0, "chunk_count": 2, "not_found": ["9"],
                                   "nonce": "req-1",
                                   "members": [{"user": {"id": "2", "username": "m", "discriminator": "0005"},
                                                "roles": [], "joined_at": "2020-01-01T00:00:00+00:00",
                                                "deaf": false, "mute": false}]})",
         [](const DispatchEvent& ev)
         {
             const auto& chunk = std::get<events::GuildMembersChunk>(ev);
             CHECK(chunk.chunk_count == 2);
             CHECK(chunk.members.size() == 1);
             CHECK(chunk.not_found == std::vector<models::Snowflake>{"9"});
             CHECK(chunk.presences.empty());
             CHECK(chunk.nonce == "req-1");
         }},
        {"GUILD_ROLE_CREATE", role_body,
         [](const DispatchEvent& ev)
         {
             const auto& role = std::get<events::GuildRoleCreate>(ev).role;
             CHECK(role.name == "mods");
             CHECK(role.color == 3447003u);
             CHECK(role.permissions == "8");
         }},
        {"GUILD_ROLE_UPDATE", role_body,
         [](const DispatchEvent& ev) { CHECK(std::get<events::GuildRoleUpdate>(ev).role.hoist == true); }},
        {"GUILD_ROLE_DELETE", R"({"guild_id": "1", "role_id": "9"})",
         [](const DispatchEvent& ev) { CHECK(std::get<events::GuildRoleDelete>(ev).role_id == "9"); }},
        {"MESSAGE_REACTION_REMOVE", R"({"user_id": "1", "channel_id": "2", "message_id": "3",
                                       "emoji": {"id": null, "name": "❤"}})",
         [](const DispatchEvent& ev)
         {
             const auto& rm = std::get<events::MessageReactionRemove>(ev);
             CHECK(rm.emoji.reaction_code() == "\xE2\x9D\xA4");
             CHECK(!rm.guild_id.has_value());
         }},
        {"MESSAGE_REACTION_REMOVE_ALL", R"({"channel_id": "2", "message_id": "3", "guild_id": "4"})",
         [](const DispatchEvent& ev) { CHECK(std::get<events::MessageReactionRemoveAll>(ev).guild_id == "4"); }},
        {"MESSAGE_REACTION_REMOVE_EMOJI", R"({"channel_id": "2", "message_id": "3",
                                             "emoji": {"id": "5", "name": "blob"}})",
         [](const DispatchEvent& ev)
         {
             CHECK(std::get<events::MessageReactionRemoveEmoji>(ev).emoji.reaction_code() == "blob:5");
         }},
        {"PRESENCE_UPDATE", R"({"user": {"id": "2"}, "guild_id": "1", "status": "dnd",
                               "activities": [{"name": "Twitch", "type": 1, "url": "https://twitch.tv/x"}],
                               "client_status": {"mobile": "dnd"}})",
         [](const DispatchEvent& ev)
         {
             const auto& presence = std::get<events::PresenceUpdate>(ev).presence;
             CHECK(presence.user.id == "2");
             CHECK(!presence.user.username.has_value());
             CHECK(presence.status == "dnd");
             REQUIRE(presence.activities.size() == 1);
             CHECK(presence.activities[0].kind == 1);
             CHECK(presence.activities[0].url == "https://twitch.tv/x");
             CHECK(presence.client_status->mobile == "dnd");
         }},
        {"USER_UPDATE", user_body,
         [](const DispatchEvent& ev)
         {
             const auto& user = std::get<events::UserUpdate>(ev).user;
             CHECK(user.tag() == "Nelly#1337");
             CHECK(user.verified == true);
             CHECK(user.flags == 64u);
         }},
        {"VOICE_STATE_UPDATE", R"({"guild_id": "1", "channel_id": null, "user_id": "2", "session_id": "s",
                                  "deaf": false, "mute": false, "self_deaf": true, "self_mute": true,
                                  "self_stream": false, "self_video": false, "suppress": false})",
         [](const DispatchEvent& ev)
         {
             const auto& state = std::get<events::VoiceStateUpdate>(ev).state;
             CHECK(!state.channel_id.has_value());
             CHECK(state.self_deaf == true);
             CHECK(state.self_stream == false);
         }},
        {"VOICE_SERVER_UPDATE", R"({"token": "my_token", "guild_id": "1", "endpoint": null})",
         [](const DispatchEvent& ev)
         {
             const auto& server = std::get<events::VoiceServerUpdate>(ev);
             CHECK(server.token == "my_token");
             CHECK(!server.endpoint.has_value());
         }},
    };
}

}

TEST_CASE("every dispatch tag decodes a platform-shaped body")
{
    std::set<std::string_view> covered;
    for (const auto& c : event_cases())
    {
        INFO("tag " << c.tag);
        auto ev = DispatchRegistry::instance().decode(c.tag, json::parse(c.body));
        REQUIRE(ev.has_value());
        CHECK(tag_of(*ev) == c.tag);
        c.check(*ev);
        covered.insert(c.tag);
    }
    CHECK(covered.size() == event_cases().size());
}

TEST_CASE("channel types sent by newer API versions decode")
{
    auto decode_kind = [](int kind)
    {
        json::object body;
        body["id"] = "1";
        body["type"] = kind;
        return models::Channel::from_json(json::value(body));
    };

    for (int kind : {10, 11, 12, 13, 14, 15, 16})
    {
        auto channel = decode_kind(kind);
        REQUIRE(channel.has_value());
        CHECK(static_cast<int>(channel->kind) == kind);
    }
    for (int kind : {7, 8, 9, 17})
    {
        auto channel = decode_kind(kind);
        REQUIRE(!channel.has_value());
        CHECK(channel.error().path == "type");
    }
}

TEST_CASE("GUILD_CREATE with a stage channel is not rejected")
{
    auto body = json::parse(R"({"id": "1", "name": "g", "owner_id": "2", "afk_timeout": 60,
        "verification_level": 0, "default_message_notifications": 0, "explicit_content_filter": 0,
        "roles": [], "emojis": [], "features": [], "mfa_level": 0, "premium_tier": 0,
        "channels": [{"id": "1", "type": 13}]})");

    auto ev = DispatchRegistry::instance().decode("GUILD_CREATE", body);

    REQUIRE(ev.has_value());
    CHECK(std::get<events::GuildCreate>(ev.value()).guild.channels.at(0).kind == ChannelType::GuildStageVoice);
}
