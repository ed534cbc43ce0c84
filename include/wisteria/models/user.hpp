#pragma once

#include "wisteria/fundamentals/json_utils.hpp"
#include "wisteria/models/snowflake.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wisteria::models
{

struct User
{
    Snowflake id;
    std::string username;
    std::string discriminator;
    std::optional<std::string> avatar;
    std::optional<bool> bot;
    std::optional<bool> system;
    std::optional<bool> mfa_enabled;
    std::optional<std::string> locale;
    std::optional<bool> verified;
    std::optional<std::string> email;
    std::optional<uint64_t> flags;
    std::optional<uint8_t> premium_type;
    std::optional<uint64_t> public_flags;

    [[nodiscard]] static json_utils::Decoded<User> from_json(const boost::json::value& jv);

    // "username#discriminator"
    [[nodiscard]] std::string tag() const;

    bool operator==(const User&) const = default;
};

// Presence payloads only guarantee the id; the rest is sent when it changed.
struct PartialUser
{
    Snowflake id;
    std::optional<std::string> username;
    std::optional<std::string> discriminator;
    std::optional<std::string> avatar;

    [[nodiscard]] static json_utils::Decoded<PartialUser> from_json(const boost::json::value& jv);

    bool operator==(const PartialUser&) const = default;
};

} // namespace wisteria::models
