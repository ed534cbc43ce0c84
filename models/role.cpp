#include "wisteria/models/role.hpp"

namespace wisteria::models
{

json_utils::Decoded<Role> Role::from_json(const boost::json::value& jv)
{
    auto rd = json_utils::Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    Role r;
    r.id = rd->required<Snowflake>("id");
    r.name = rd->required<std::string>("name");
    r.color = rd->required<uint32_t>("color");
    r.hoist = rd->required<bool>("hoist");
    r.position = rd->required<int32_t>("position");
    r.permissions = rd->required_text("permissions");
    r.managed = rd->required<bool>("managed");
    r.mentionable = rd->required<bool>("mentionable");
    return rd->finish(std::move(r));
}

} // namespace wisteria::models
