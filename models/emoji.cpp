#include "wisteria/models/emoji.hpp"

#include <format>

namespace wisteria::models
{

json_utils::Decoded<Emoji> Emoji::from_json(const boost::json::value& jv)
{
    auto rd = json_utils::Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    Emoji e;
    e.id = rd->optional<Snowflake>("id");
    e.name = rd->optional<std::string>("name");
    e.roles = rd->list_or_empty<Snowflake>("roles");
    e.user = rd->optional<User>("user");
    e.require_colons = rd->optional<bool>("require_colons");
    e.managed = rd->optional<bool>("managed");
    e.animated = rd->optional<bool>("animated");
    e.available = rd->optional<bool>("available");
    return rd->finish(std::move(e));
}

std::string Emoji::reaction_code() const
{
    if (id)
    {
        return std::format("{}:{}", name.value_or(""), *id);
    }
    return name.value_or("");
}

} // namespace wisteria::models
