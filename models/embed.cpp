#include "wisteria/models/embed.hpp"

namespace wisteria::models
{

namespace json = boost::json;
using json_utils::Reader;
using json_utils::put_optional;

namespace {

template<class T>
void put_object(json::object& obj, std::string_view key, const std::optional<T>& val)
{
    if (val)
    {
        obj[key] = val->to_json();
    }
}

} // namespace

json_utils::Decoded<EmbedFooter> EmbedFooter::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    EmbedFooter f;
    f.text = rd->required<std::string>("text");
    f.icon_url = rd->optional<std::string>("icon_url");
    f.proxy_icon_url = rd->optional<std::string>("proxy_icon_url");
    return rd->finish(std::move(f));
}

json::object EmbedFooter::to_json() const
{
    json::object obj{{"text", text}};
    put_optional(obj, "icon_url", icon_url);
    put_optional(obj, "proxy_icon_url", proxy_icon_url);
    return obj;
}

json_utils::Decoded<EmbedMedia> EmbedMedia::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    EmbedMedia m;
    m.url = rd->optional<std::string>("url");
    m.proxy_url = rd->optional<std::string>("proxy_url");
    m.height = rd->optional<uint32_t>("height");
    m.width = rd->optional<uint32_t>("width");
    return rd->finish(std::move(m));
}

json::object EmbedMedia::to_json() const
{
    json::object obj;
    put_optional(obj, "url", url);
    put_optional(obj, "proxy_url", proxy_url);
    put_optional(obj, "height", height);
    put_optional(obj, "width", width);
    return obj;
}

json_utils::Decoded<EmbedProvider> EmbedProvider::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    EmbedProvider p;
    p.name = rd->optional<std::string>("name");
    p.url = rd->optional<std::string>("url");
    return rd->finish(std::move(p));
}

json::object EmbedProvider::to_json() const
{
    json::object obj;
    put_optional(obj, "name", name);
    put_optional(obj, "url", url);
    return obj;
}

json_utils::Decoded<EmbedAuthor> EmbedAuthor::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    EmbedAuthor a;
    a.name = rd->optional<std::string>("name");
    a.url = rd->optional<std::string>("url");
    a.icon_url = rd->optional<std::string>("icon_url");
    a.proxy_icon_url = rd->optional<std::string>("proxy_icon_url");
    return rd->finish(std::move(a));
}

json::object EmbedAuthor::to_json() const
{
    json::object obj;
    put_optional(obj, "name", name);
    put_optional(obj, "url", url);
    put_optional(obj, "icon_url", icon_url);
    put_optional(obj, "proxy_icon_url", proxy_icon_url);
    return obj;
}

json_utils::Decoded<EmbedField> EmbedField::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    EmbedField f;
    f.name = rd->required<std::string>("name");
    f.value = rd->required<std::string>("value");
    f.inline_ = rd->optional<bool>("inline");
    return rd->finish(std::move(f));
}

json::object EmbedField::to_json() const
{
    json::object obj{{"name", name}, {"value", value}};
    put_optional(obj, "inline", inline_);
    return obj;
}

json_utils::Decoded<Embed> Embed::from_json(const json::value& jv)
{
    auto rd = Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(rd.error());
    }
    Embed e;
    e.title = rd->optional<std::string>("title");
    e.kind = rd->optional<std::string>("type");
    e.description = rd->optional<std::string>("description");
    e.url = rd->optional<std::string>("url");
    e.timestamp = rd->optional<std::string>("timestamp");
    e.color = rd->optional<uint32_t>("color");
    e.footer = rd->optional<EmbedFooter>("footer");
    e.image = rd->optional<EmbedMedia>("image");
    e.thumbnail = rd->optional<EmbedMedia>("thumbnail");
    e.video = rd->optional<EmbedMedia>("video");
    e.provider = rd->optional<EmbedProvider>("provider");
    e.author = rd->optional<EmbedAuthor>("author");
    e.fields = rd->list_or_empty<EmbedField>("fields");
    return rd->finish(std::move(e));
}

json::object Embed::to_json() const
{
    json::object obj;
    put_optional(obj, "title", title);
    put_optional(obj, "type", kind);
    put_optional(obj, "description", description);
    put_optional(obj, "url", url);
    put_optional(obj, "timestamp", timestamp);
    put_optional(obj, "color", color);
    put_object(obj, "footer", footer);
    put_object(obj, "image", image);
    put_object(obj, "thumbnail", thumbnail);
    put_object(obj, "video", video);
    put_object(obj, "provider", provider);
    put_object(obj, "author", author);
    if (!fields.empty())
    {
        json::array arr;
        for (const auto& f : fields)
        {
            arr.push_back(f.to_json());
        }
        obj["fields"] = std::move(arr);
    }
    return obj;
}

} // namespace wisteria::models
