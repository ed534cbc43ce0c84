#pragma once

#include "wisteria/error.hpp"
#include "wisteria/fundamentals/json_utils.hpp"
#include "wisteria/models/channel.hpp"
#include "wisteria/models/embed.hpp"
#include "wisteria/models/emoji.hpp"
#include "wisteria/models/member.hpp"
#include "wisteria/models/snowflake.hpp"
#include "wisteria/models/user.hpp"

#include <boost/asio.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace wisteria::rest
{
class HttpClient;
}

namespace wisteria::models
{

namespace net = boost::asio;

enum class MessageKind : uint8_t
{
    Regular                    = 0,
    RecipientAdd               = 1,
    RecipientRemove            = 2,
    Call                       = 3,
    ChannelNameChange          = 4,
    ChannelIconChange          = 5,
    ChannelPinnedMessage       = 6,
    GuildMemberJoin            = 7,
    UserPremiumGuildSub        = 8,
    UserPremiumGuildSubTier1   = 9,
    UserPremiumGuildSubTier2   = 10,
    UserPremiumGuildSubTier3   = 11,
    ChannelFollowAdd           = 12,
    GuildDiscoveryDisqualified = 14,
    GuildDiscoveryRequalified  = 15,
};

// 13 is unassigned; anything outside the table is rejected.
[[nodiscard]] std::optional<MessageKind> message_kind_from(uint64_t raw);

struct Attachment
{
    Snowflake id;
    std::string filename;
    uint64_t size = 0;
    std::string url;
    std::string proxy_url;
    std::optional<uint32_t> height;
    std::optional<uint32_t> width;

    [[nodiscard]] static json_utils::Decoded<Attachment> from_json(const boost::json::value& jv);

    bool operator==(const Attachment&) const = default;
};

struct Reaction
{
    uint32_t count = 0;
    bool me = false;
    Emoji emoji;

    [[nodiscard]] static json_utils::Decoded<Reaction> from_json(const boost::json::value& jv);

    bool operator==(const Reaction&) const = default;
};

// Link back to the origin of a crossposted message.
struct MessageReference
{
    std::optional<Snowflake> message_id;
    std::optional<Snowflake> channel_id;
    std::optional<Snowflake> guild_id;

    [[nodiscard]] static json_utils::Decoded<MessageReference> from_json(const boost::json::value& jv);

    bool operator==(const MessageReference&) const = default;
};

// Rich Presence application attached to a message.
struct MessageApplication
{
    Snowflake id;
    std::optional<std::string> cover_image;
    std::string description;
    std::optional<std::string> icon;
    std::string name;

    [[nodiscard]] static json_utils::Decoded<MessageApplication> from_json(const boost::json::value& jv);

    bool operator==(const MessageApplication&) const = default;
};

/**
 * A message sent in a channel.
 *
 * Values only come out of from_json (gateway events or REST responses) and
 * are never modified afterwards: an edit arrives as a separate
 * MESSAGE_UPDATE event. The action members below hand a request to the
 * HttpClient they are given and leave this value untouched, so a Message
 * may be shared by concurrently running actions. The ids are copied into
 * the returned awaitable; only the client has to outlive it.
 */
struct Message
{
    Snowflake id;
    Snowflake channel_id;
    std::optional<Snowflake> guild_id;
    User author;
    std::optional<GuildMember> member;
    std::string content;
    std::string timestamp;
    std::optional<std::string> edited_timestamp;
    bool tts = false;
    bool mention_everyone = false;
    std::vector<User> mentions;
    std::vector<Snowflake> mention_roles;
    std::vector<ChannelMention> mention_channels;
    std::vector<Attachment> attachments;
    std::vector<Embed> embeds;
    std::vector<Reaction> reactions;
    std::optional<std::string> nonce;
    bool pinned = false;
    std::optional<Snowflake> webhook_id;
    std::optional<MessageKind> kind;
    std::optional<MessageApplication> application;
    std::optional<MessageReference> message_reference;
    std::optional<uint64_t> flags;

    [[nodiscard]] static json_utils::Decoded<Message> from_json(const boost::json::value& jv);

    // Posts `content` to this message's channel.
    [[nodiscard]] net::awaitable<std::expected<Message, Error>> send(rest::HttpClient& http, std::string content) const;
    [[nodiscard]] net::awaitable<std::expected<Message, Error>> send_embed(rest::HttpClient& http, Embed embed) const;

    [[nodiscard]] net::awaitable<std::expected<void, Error>> add_reaction(rest::HttpClient& http, std::string emoji) const;
    // Reacts to another message of the same channel.
    [[nodiscard]] net::awaitable<std::expected<void, Error>> add_reaction_to_message(rest::HttpClient& http, Snowflake message_id, std::string emoji) const;

    [[nodiscard]] net::awaitable<std::expected<void, Error>> remove(rest::HttpClient& http) const;
    [[nodiscard]] net::awaitable<std::expected<void, Error>> pin(rest::HttpClient& http) const;
    [[nodiscard]] net::awaitable<std::expected<void, Error>> unpin(rest::HttpClient& http) const;

    bool operator==(const Message&) const = default;
};

} // namespace wisteria::models
