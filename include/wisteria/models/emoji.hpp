#pragma once

#include "wisteria/fundamentals/json_utils.hpp"
#include "wisteria/models/snowflake.hpp"
#include "wisteria/models/user.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wisteria::models
{

// Unicode emoji have no id; reaction emoji may lose their name when the
// custom emoji was deleted.
struct Emoji
{
    std::optional<Snowflake> id;
    std::optional<std::string> name;
    std::vector<Snowflake> roles;
    std::optional<User> user;
    std::optional<bool> require_colons;
    std::optional<bool> managed;
    std::optional<bool> animated;
    std::optional<bool> available;

    [[nodiscard]] static json_utils::Decoded<Emoji> from_json(const boost::json::value& jv);

    // Form used in reaction routes: the unicode text, or "name:id".
    [[nodiscard]] std::string reaction_code() const;

    bool operator==(const Emoji&) const = default;
};

} // namespace wisteria::models
