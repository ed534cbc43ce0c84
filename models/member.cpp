#include "wisteria/models/member.hpp"

namespace wisteria::models
{

json_utils::Decoded<GuildMember> GuildMember::from_json(const boost::json::value& jv)
{
    auto rd = json_utils::Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    GuildMember m;
    m.user = rd->optional<User>("user");
    m.nick = rd->optional<std::string>("nick");
    m.roles = rd->required<std::vector<Snowflake>>("roles");
    m.joined_at = rd->required<std::string>("joined_at");
    m.premium_since = rd->optional<std::string>("premium_since");
    m.deaf = rd->required<bool>("deaf");
    m.mute = rd->required<bool>("mute");
    return rd->finish(std::move(m));
}

} // namespace wisteria::models
