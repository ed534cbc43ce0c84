#pragma once

#include "wisteria/fundamentals/json_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wisteria::models
{

struct EmbedFooter
{
    std::string text;
    std::optional<std::string> icon_url;
    std::optional<std::string> proxy_icon_url;

    [[nodiscard]] static json_utils::Decoded<EmbedFooter> from_json(const boost::json::value& jv);
    [[nodiscard]] boost::json::object to_json() const;

    bool operator==(const EmbedFooter&) const = default;
};

// Shared shape of image, thumbnail and video.
struct EmbedMedia
{
    std::optional<std::string> url;
    std::optional<std::string> proxy_url;
    std::optional<uint32_t> height;
    std::optional<uint32_t> width;

    [[nodiscard]] static json_utils::Decoded<EmbedMedia> from_json(const boost::json::value& jv);
    [[nodiscard]] boost::json::object to_json() const;

    bool operator==(const EmbedMedia&) const = default;
};

struct EmbedProvider
{
    std::optional<std::string> name;
    std::optional<std::string> url;

    [[nodiscard]] static json_utils::Decoded<EmbedProvider> from_json(const boost::json::value& jv);
    [[nodiscard]] boost::json::object to_json() const;

    bool operator==(const EmbedProvider&) const = default;
};

struct EmbedAuthor
{
    std::optional<std::string> name;
    std::optional<std::string> url;
    std::optional<std::string> icon_url;
    std::optional<std::string> proxy_icon_url;

    [[nodiscard]] static json_utils::Decoded<EmbedAuthor> from_json(const boost::json::value& jv);
    [[nodiscard]] boost::json::object to_json() const;

    bool operator==(const EmbedAuthor&) const = default;
};

struct EmbedField
{
    std::string name;
    std::string value;
    std::optional<bool> inline_;

    [[nodiscard]] static json_utils::Decoded<EmbedField> from_json(const boost::json::value& jv);
    [[nodiscard]] boost::json::object to_json() const;

    bool operator==(const EmbedField&) const = default;
};

struct Embed
{
    std::optional<std::string> title;
    std::optional<std::string> kind;
    std::optional<std::string> description;
    std::optional<std::string> url;
    std::optional<std::string> timestamp;
    std::optional<uint32_t> color;
    std::optional<EmbedFooter> footer;
    std::optional<EmbedMedia> image;
    std::optional<EmbedMedia> thumbnail;
    std::optional<EmbedMedia> video;
    std::optional<EmbedProvider> provider;
    std::optional<EmbedAuthor> author;
    std::vector<EmbedField> fields;

    [[nodiscard]] static json_utils::Decoded<Embed> from_json(const boost::json::value& jv);
    [[nodiscard]] boost::json::object to_json() const;

    bool operator==(const Embed&) const = default;
};

} // namespace wisteria::models
