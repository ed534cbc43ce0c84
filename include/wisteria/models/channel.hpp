#pragma once

#include "wisteria/fundamentals/json_utils.hpp"
#include "wisteria/models/snowflake.hpp"
#include "wisteria/models/user.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wisteria::models
{

enum class ChannelType : uint8_t
{
    GuildText     = 0,
    DM            = 1,
    GuildVoice    = 2,
    GroupDM       = 3,
    GuildCategory = 4,
    GuildNews     = 5,
    GuildStore    = 6,
    // 7-9 unassigned; the rest arrive from API v9 on.
    NewsThread       = 10,
    PublicThread     = 11,
    PrivateThread    = 12,
    GuildStageVoice  = 13,
    GuildDirectory   = 14,
    GuildForum       = 15,
    GuildMedia       = 16,
};

[[nodiscard]] std::optional<ChannelType> channel_type_from(uint64_t raw);

struct Overwrite
{
    Snowflake id;
    std::string kind;    // "role"/"member", or 0/1 on newer API versions
    std::string allow;
    std::string deny;

    [[nodiscard]] static json_utils::Decoded<Overwrite> from_json(const boost::json::value& jv);

    bool operator==(const Overwrite&) const = default;
};

struct Channel
{
    Snowflake id;
    ChannelType kind = ChannelType::GuildText;
    std::optional<Snowflake> guild_id;
    std::optional<int32_t> position;
    std::vector<Overwrite> permission_overwrites;
    std::optional<std::string> name;
    std::optional<std::string> topic;
    std::optional<bool> nsfw;
    std::optional<Snowflake> last_message_id;
    std::optional<uint32_t> bitrate;
    std::optional<uint32_t> user_limit;
    std::optional<uint32_t> rate_limit_per_user;
    std::vector<User> recipients;
    std::optional<std::string> icon;
    std::optional<Snowflake> owner_id;
    std::optional<Snowflake> application_id;
    std::optional<Snowflake> parent_id;
    std::optional<std::string> last_pin_timestamp;
    std::optional<uint32_t> message_count;   // threads only
    std::optional<uint32_t> member_count;    // threads only

    [[nodiscard]] static json_utils::Decoded<Channel> from_json(const boost::json::value& jv);

    [[nodiscard]] bool is_private() const { return kind == ChannelType::DM || kind == ChannelType::GroupDM; }
    [[nodiscard]] bool is_thread() const
    {
        return kind == ChannelType::NewsThread || kind == ChannelType::PublicThread || kind == ChannelType::PrivateThread;
    }

    bool operator==(const Channel&) const = default;
};

// A channel mentioned by a cross-posted message.
struct ChannelMention
{
    Snowflake id;
    Snowflake guild_id;
    ChannelType kind = ChannelType::GuildText;
    std::string name;

    [[nodiscard]] static json_utils::Decoded<ChannelMention> from_json(const boost::json::value& jv);

    bool operator==(const ChannelMention&) const = default;
};

} // namespace wisteria::models
