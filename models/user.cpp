#include "wisteria/models/user.hpp"

#include <format>

namespace wisteria::models
{

using json_utils::Reader;

json_utils::Decoded<User> User::from_json(const boost::json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    User u;
    u.id = rd->required<Snowflake>("id");
    u.username = rd->required<std::string>("username");
    u.discriminator = rd->required<std::string>("discriminator");
    u.avatar = rd->optional<std::string>("avatar");
    u.bot = rd->optional<bool>("bot");
    u.system = rd->optional<bool>("system");
    u.mfa_enabled = rd->optional<bool>("mfa_enabled");
    u.locale = rd->optional<std::string>("locale");
    u.verified = rd->optional<bool>("verified");
    u.email = rd->optional<std::string>("email");
    u.flags = rd->optional<uint64_t>("flags");
    u.premium_type = rd->optional<uint8_t>("premium_type");
    u.public_flags = rd->optional<uint64_t>("public_flags");
    return rd->finish(std::move(u));
}

std::string User::tag() const
{
    return std::format("{}#{}", username, discriminator);
}

json_utils::Decoded<PartialUser> PartialUser::from_json(const boost::json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    PartialUser u;
    u.id = rd->required<Snowflake>("id");
    u.username = rd->optional<std::string>("username");
    u.discriminator = rd->optional<std::string>("discriminator");
    u.avatar = rd->optional<std::string>("avatar");
    return rd->finish(std::move(u));
}

} // namespace wisteria::models
