#pragma once

#include "wisteria/fundamentals/json_utils.hpp"
#include "wisteria/models/channel.hpp"
#include "wisteria/models/emoji.hpp"
#include "wisteria/models/guild.hpp"
#include "wisteria/models/member.hpp"
#include "wisteria/models/message.hpp"
#include "wisteria/models/presence.hpp"
#include "wisteria/models/role.hpp"
#include "wisteria/models/snowflake.hpp"
#include "wisteria/models/user.hpp"
#include "wisteria/models/voice.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Payloads of dispatch (op 0) frames. Every type names the event-type tag
// it is decoded from; the dispatch registry is built from these tags.
namespace wisteria::gateway::events
{

namespace json = boost::json;
using json_utils::Decoded;
using models::Snowflake;

struct Ready
{
    static constexpr std::string_view tag = "READY";

    uint32_t v = 0;
    models::User user;
    std::vector<models::Channel> private_channels;
    std::vector<models::UnavailableGuild> guilds;
    std::string session_id;
    std::optional<std::vector<uint32_t>> shard;   // [shard_id, num_shards]

    [[nodiscard]] static Decoded<Ready> from_json(const json::value& jv);
    bool operator==(const Ready&) const = default;
};

struct Resumed
{
    static constexpr std::string_view tag = "RESUMED";

    [[nodiscard]] static Decoded<Resumed> from_json(const json::value& jv);
    bool operator==(const Resumed&) const = default;
};

struct Reconnect
{
    static constexpr std::string_view tag = "RECONNECT";

    [[nodiscard]] static Decoded<Reconnect> from_json(const json::value& jv);
    bool operator==(const Reconnect&) const = default;
};

// Channel

struct ChannelCreate
{
    static constexpr std::string_view tag = "CHANNEL_CREATE";

    models::Channel channel;

    [[nodiscard]] static Decoded<ChannelCreate> from_json(const json::value& jv);
    bool operator==(const ChannelCreate&) const = default;
};

struct ChannelUpdate
{
    static constexpr std::string_view tag = "CHANNEL_UPDATE";

    models::Channel channel;

    [[nodiscard]] static Decoded<ChannelUpdate> from_json(const json::value& jv);
    bool operator==(const ChannelUpdate&) const = default;
};

struct ChannelDelete
{
    static constexpr std::string_view tag = "CHANNEL_DELETE";

    models::Channel channel;

    [[nodiscard]] static Decoded<ChannelDelete> from_json(const json::value& jv);
    bool operator==(const ChannelDelete&) const = default;
};

struct ChannelPinsUpdate
{
    static constexpr std::string_view tag = "CHANNEL_PINS_UPDATE";

    std::optional<Snowflake> guild_id;
    Snowflake channel_id;
    std::optional<std::string> last_pin_timestamp;

    [[nodiscard]] static Decoded<ChannelPinsUpdate> from_json(const json::value& jv);
    bool operator==(const ChannelPinsUpdate&) const = default;
};

// Guild

struct GuildCreate
{
    static constexpr std::string_view tag = "GUILD_CREATE";

    models::Guild guild;

    [[nodiscard]] static Decoded<GuildCreate> from_json(const json::value& jv);
    bool operator==(const GuildCreate&) const = default;
};

struct GuildUpdate
{
    static constexpr std::string_view tag = "GUILD_UPDATE";

    models::Guild guild;

    [[nodiscard]] static Decoded<GuildUpdate> from_json(const json::value& jv);
    bool operator==(const GuildUpdate&) const = default;
};

struct GuildDelete
{
    static constexpr std::string_view tag = "GUILD_DELETE";

    models::UnavailableGuild guild;

    [[nodiscard]] static Decoded<GuildDelete> from_json(const json::value& jv);
    bool operator==(const GuildDelete&) const = default;
};

struct GuildBanAdd
{
    static constexpr std::string_view tag = "GUILD_BAN_ADD";

    Snowflake guild_id;
    models::User user;

    [[nodiscard]] static Decoded<GuildBanAdd> from_json(const json::value& jv);
    bool operator==(const GuildBanAdd&) const = default;
};

struct GuildBanRemove
{
    static constexpr std::string_view tag = "GUILD_BAN_REMOVE";

    Snowflake guild_id;
    models::User user;

    [[nodiscard]] static Decoded<GuildBanRemove> from_json(const json::value& jv);
    bool operator==(const GuildBanRemove&) const = default;
};

struct GuildEmojisUpdate
{
    static constexpr std::string_view tag = "GUILD_EMOJIS_UPDATE";

    Snowflake guild_id;
    std::vector<models::Emoji> emojis;

    [[nodiscard]] static Decoded<GuildEmojisUpdate> from_json(const json::value& jv);
    bool operator==(const GuildEmojisUpdate&) const = default;
};

struct GuildIntegrationsUpdate
{
    static constexpr std::string_view tag = "GUILD_INTEGRATIONS_UPDATE";

    Snowflake guild_id;

    [[nodiscard]] static Decoded<GuildIntegrationsUpdate> from_json(const json::value& jv);
    bool operator==(const GuildIntegrationsUpdate&) const = default;
};

// The member object with an extra guild_id key.
struct GuildMemberAdd
{
    static constexpr std::string_view tag = "GUILD_MEMBER_ADD";

    Snowflake guild_id;
    models::GuildMember member;

    [[nodiscard]] static Decoded<GuildMemberAdd> from_json(const json::value& jv);
    bool operator==(const GuildMemberAdd&) const = default;
};

struct GuildMemberRemove
{
    static constexpr std::string_view tag = "GUILD_MEMBER_REMOVE";

    Snowflake guild_id;
    models::User user;

    [[nodiscard]] static Decoded<GuildMemberRemove> from_json(const json::value& jv);
    bool operator==(const GuildMemberRemove&) const = default;
};

struct GuildMemberUpdate
{
    static constexpr std::string_view tag = "GUILD_MEMBER_UPDATE";

    Snowflake guild_id;
    std::vector<Snowflake> roles;
    models::User user;
    std::optional<std::string> nick;
    std::optional<std::string> premium_since;

    [[nodiscard]] static Decoded<GuildMemberUpdate> from_json(const json::value& jv);
    bool operator==(const GuildMemberUpdate&) const = default;
};

struct GuildMembersChunk
{
    static constexpr std::string_view tag = "GUILD_MEMBERS_CHUNK";

    Snowflake guild_id;
    std::vector<models::GuildMember> members;
    uint32_t chunk_index = 0;
    uint32_t chunk_count = 0;
    std::vector<Snowflake> not_found;
    std::vector<models::Presence> presences;
    std::optional<std::string> nonce;

    [[nodiscard]] static Decoded<GuildMembersChunk> from_json(const json::value& jv);
    bool operator==(const GuildMembersChunk&) const = default;
};

struct GuildRoleCreate
{
    static constexpr std::string_view tag = "GUILD_ROLE_CREATE";

    Snowflake guild_id;
    models::Role role;

    [[nodiscard]] static Decoded<GuildRoleCreate> from_json(const json::value& jv);
    bool operator==(const GuildRoleCreate&) const = default;
};

struct GuildRoleUpdate
{
    static constexpr std::string_view tag = "GUILD_ROLE_UPDATE";

    Snowflake guild_id;
    models::Role role;

    [[nodiscard]] static Decoded<GuildRoleUpdate> from_json(const json::value& jv);
    bool operator==(const GuildRoleUpdate&) const = default;
};

struct GuildRoleDelete
{
    static constexpr std::string_view tag = "GUILD_ROLE_DELETE";

    Snowflake guild_id;
    Snowflake role_id;

    [[nodiscard]] static Decoded<GuildRoleDelete> from_json(const json::value& jv);
    bool operator==(const GuildRoleDelete&) const = default;
};

// Message

struct MessageCreate
{
    static constexpr std::string_view tag = "MESSAGE_CREATE";

    models::Message message;

    [[nodiscard]] static Decoded<MessageCreate> from_json(const json::value& jv);
    bool operator==(const MessageCreate&) const = default;
};

// Edits may carry only the fields that changed, so everything but the
// identity is optional here.
struct MessageUpdate
{
    static constexpr std::string_view tag = "MESSAGE_UPDATE";

    Snowflake id;
    Snowflake channel_id;
    std::optional<Snowflake> guild_id;
    std::optional<models::User> author;
    std::optional<models::GuildMember> member;
    std::optional<std::string> content;
    std::optional<std::string> timestamp;
    std::optional<std::string> edited_timestamp;
    std::optional<bool> tts;
    std::optional<bool> mention_everyone;
    std::optional<std::vector<models::User>> mentions;
    std::optional<std::vector<Snowflake>> mention_roles;
    std::optional<std::vector<models::Attachment>> attachments;
    std::optional<std::vector<models::Embed>> embeds;
    std::optional<bool> pinned;
    std::optional<uint64_t> flags;

    [[nodiscard]] static Decoded<MessageUpdate> from_json(const json::value& jv);
    bool operator==(const MessageUpdate&) const = default;
};

struct MessageDelete
{
    static constexpr std::string_view tag = "MESSAGE_DELETE";

    Snowflake id;
    Snowflake channel_id;
    std::optional<Snowflake> guild_id;

    [[nodiscard]] static Decoded<MessageDelete> from_json(const json::value& jv);
    bool operator==(const MessageDelete&) const = default;
};

struct MessageDeleteBulk
{
    static constexpr std::string_view tag = "MESSAGE_DELETE_BULK";

    std::vector<Snowflake> ids;
    Snowflake channel_id;
    std::optional<Snowflake> guild_id;

    [[nodiscard]] static Decoded<MessageDeleteBulk> from_json(const json::value& jv);
    bool operator==(const MessageDeleteBulk&) const = default;
};

struct MessageReactionAdd
{
    static constexpr std::string_view tag = "MESSAGE_REACTION_ADD";

    Snowflake user_id;
    Snowflake channel_id;
    Snowflake message_id;
    std::optional<Snowflake> guild_id;
    std::optional<models::GuildMember> member;
    models::Emoji emoji;

    [[nodiscard]] static Decoded<MessageReactionAdd> from_json(const json::value& jv);
    bool operator==(const MessageReactionAdd&) const = default;
};

struct MessageReactionRemove
{
    static constexpr std::string_view tag = "MESSAGE_REACTION_REMOVE";

    Snowflake user_id;
    Snowflake channel_id;
    Snowflake message_id;
    std::optional<Snowflake> guild_id;
    models::Emoji emoji;

    [[nodiscard]] static Decoded<MessageReactionRemove> from_json(const json::value& jv);
    bool operator==(const MessageReactionRemove&) const = default;
};

struct MessageReactionRemoveAll
{
    static constexpr std::string_view tag = "MESSAGE_REACTION_REMOVE_ALL";

    Snowflake channel_id;
    Snowflake message_id;
    std::optional<Snowflake> guild_id;

    [[nodiscard]] static Decoded<MessageReactionRemoveAll> from_json(const json::value& jv);
    bool operator==(const MessageReactionRemoveAll&) const = default;
};

struct MessageReactionRemoveEmoji
{
    static constexpr std::string_view tag = "MESSAGE_REACTION_REMOVE_EMOJI";

    Snowflake channel_id;
    std::optional<Snowflake> guild_id;
    Snowflake message_id;
    models::Emoji emoji;

    [[nodiscard]] static Decoded<MessageReactionRemoveEmoji> from_json(const json::value& jv);
    bool operator==(const MessageReactionRemoveEmoji&) const = default;
};

// Presence

struct PresenceUpdate
{
    static constexpr std::string_view tag = "PRESENCE_UPDATE";

    models::Presence presence;

    [[nodiscard]] static Decoded<PresenceUpdate> from_json(const json::value& jv);
    bool operator==(const PresenceUpdate&) const = default;
};

struct TypingStart
{
    static constexpr std::string_view tag = "TYPING_START";

    Snowflake channel_id;
    std::optional<Snowflake> guild_id;
    Snowflake user_id;
    uint64_t timestamp = 0;   // unix seconds
    std::optional<models::GuildMember> member;

    [[nodiscard]] static Decoded<TypingStart> from_json(const json::value& jv);
    bool operator==(const TypingStart&) const = default;
};

struct UserUpdate
{
    static constexpr std::string_view tag = "USER_UPDATE";

    models::User user;

    [[nodiscard]] static Decoded<UserUpdate> from_json(const json::value& jv);
    bool operator==(const UserUpdate&) const = default;
};

// Voice

struct VoiceStateUpdate
{
    static constexpr std::string_view tag = "VOICE_STATE_UPDATE";

    models::VoiceState state;

    [[nodiscard]] static Decoded<VoiceStateUpdate> from_json(const json::value& jv);
    bool operator==(const VoiceStateUpdate&) const = default;
};

struct VoiceServerUpdate
{
    static constexpr std::string_view tag = "VOICE_SERVER_UPDATE";

    std::string token;
    Snowflake guild_id;
    std::optional<std::string> endpoint;   // null while the voice server is being allocated

    [[nodiscard]] static Decoded<VoiceServerUpdate> from_json(const json::value& jv);
    bool operator==(const VoiceServerUpdate&) const = default;
};

} // namespace wisteria::gateway::events

namespace wisteria::gateway
{

using DispatchEvent = std::variant<
    events::Ready,
    events::Resumed,
    events::Reconnect,
    events::ChannelCreate,
    events::ChannelUpdate,
    events::ChannelDelete,
    events::ChannelPinsUpdate,
    events::GuildCreate,
    events::GuildUpdate,
    events::GuildDelete,
    events::GuildBanAdd,
    events::GuildBanRemove,
    events::GuildEmojisUpdate,
    events::GuildIntegrationsUpdate,
    events::GuildMemberAdd,
    events::GuildMemberRemove,
    events::GuildMemberUpdate,
    events::GuildMembersChunk,
    events::GuildRoleCreate,
    events::GuildRoleUpdate,
    events::GuildRoleDelete,
    events::MessageCreate,
    events::MessageUpdate,
    events::MessageDelete,
    events::MessageDeleteBulk,
    events::MessageReactionAdd,
    events::MessageReactionRemove,
    events::MessageReactionRemoveAll,
    events::MessageReactionRemoveEmoji,
    events::PresenceUpdate,
    events::TypingStart,
    events::UserUpdate,
    events::VoiceStateUpdate,
    events::VoiceServerUpdate>;

[[nodiscard]] std::string_view tag_of(const DispatchEvent& ev);

} // namespace wisteria::gateway
