#include "wisteria/models/presence.hpp"

namespace wisteria::models
{

using json_utils::Reader;

json_utils::Decoded<Activity> Activity::from_json(const boost::json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    Activity a;
    a.name = rd->required<std::string>("name");
    a.kind = rd->required<uint8_t>("type");
    a.url = rd->optional<std::string>("url");
    a.created_at = rd->optional<uint64_t>("created_at");
    a.application_id = rd->optional<Snowflake>("application_id");
    a.details = rd->optional<std::string>("details");
    a.state = rd->optional<std::string>("state");
    return rd->finish(std::move(a));
}

json_utils::Decoded<ClientStatus> ClientStatus::from_json(const boost::json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    ClientStatus cs;
    cs.desktop = rd->optional<std::string>("desktop");
    cs.mobile = rd->optional<std::string>("mobile");
    cs.web = rd->optional<std::string>("web");
    return rd->finish(std::move(cs));
}

json_utils::Decoded<Presence> Presence::from_json(const boost::json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    Presence p;
    p.user = rd->required<PartialUser>("user");
    p.guild_id = rd->optional<Snowflake>("guild_id");
    p.status = rd->required<std::string>("status");
    p.activities = rd->list_or_empty<Activity>("activities");
    p.client_status = rd->optional<ClientStatus>("client_status");
    return rd->finish(std::move(p));
}

} // namespace wisteria::models
