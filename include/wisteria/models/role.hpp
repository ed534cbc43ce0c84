#pragma once

#include "wisteria/fundamentals/json_utils.hpp"
#include "wisteria/models/snowflake.hpp"

#include <cstdint>
#include <string>

namespace wisteria::models
{

struct Role
{
    Snowflake id;
    std::string name;
    uint32_t color = 0;
    bool hoist = false;
    int32_t position = 0;
    std::string permissions;   // bit set, decimal text
    bool managed = false;
    bool mentionable = false;

    [[nodiscard]] static json_utils::Decoded<Role> from_json(const boost::json::value& jv);

    bool operator==(const Role&) const = default;
};

} // namespace wisteria::models
