#include "wisteria/rest/http_client.hpp"
#include "wisteria/logger.hpp"

#include <format>

namespace wisteria::rest
{

namespace json = boost::json;
using models::Message;

HttpClient::HttpClient(Requester& req, unsigned api_version)
    : requester(req)
    , version(api_version)
{
}

HttpClient::HttpClient(Requester& req, const Config& config)
    : HttpClient(req, config.rest().api_version)
{
}

std::string HttpClient::route(std::string_view path) const
{
    return std::format("/api/v{}{}", version, path);
}

net::awaitable<std::expected<Message, Error>> HttpClient::post_message(Snowflake channel_id, json::object body)
{
    Request req{Method::Post, route(std::format("/channels/{}/messages", channel_id)), json::value(std::move(body))};
    WISTERIA_LOG_DEBUG("{} {}", to_string(req.method), req.path);

    auto resp = co_await requester.get().execute(std::move(req));
    if (!resp)
    {
        co_return std::unexpected(std::move(resp.error()));
    }

    auto msg = Message::from_json(*resp);
    if (!msg)
    {
        WISTERIA_LOG_WARN("Malformed message in response for channel {}: {}", channel_id, msg.error().message());
        co_return std::unexpected(Error::invalid_format("message", msg.error().message()));
    }
    co_return std::move(*msg);
}

net::awaitable<std::expected<void, Error>> HttpClient::call(Method m, std::string path)
{
    Request req{m, route(path), std::nullopt};
    WISTERIA_LOG_DEBUG("{} {}", to_string(req.method), req.path);

    auto resp = co_await requester.get().execute(std::move(req));
    if (!resp)
    {
        co_return std::unexpected(std::move(resp.error()));
    }
    co_return std::expected<void, Error>{};
}

net::awaitable<std::expected<Message, Error>> HttpClient::send_message(Snowflake channel_id, std::string content)
{
    json::object body;
    body["content"] = std::move(content);
    return post_message(std::move(channel_id), std::move(body));
}

net::awaitable<std::expected<Message, Error>> HttpClient::send_embed(Snowflake channel_id, models::Embed embed)
{
    json::object body;
    body["embed"] = embed.to_json();
    return post_message(std::move(channel_id), std::move(body));
}

net::awaitable<std::expected<void, Error>> HttpClient::add_reaction(Snowflake channel_id, Snowflake message_id, std::string emoji)
{
    return call(Method::Put, std::format("/channels/{}/messages/{}/reactions/{}/@me",
                                         channel_id, message_id, encode_path_segment(emoji)));
}

net::awaitable<std::expected<void, Error>> HttpClient::delete_message(Snowflake channel_id, Snowflake message_id)
{
    return call(Method::Delete, std::format("/channels/{}/messages/{}", channel_id, message_id));
}

net::awaitable<std::expected<void, Error>> HttpClient::pin_message(Snowflake channel_id, Snowflake message_id)
{
    return call(Method::Put, std::format("/channels/{}/pins/{}", channel_id, message_id));
}

net::awaitable<std::expected<void, Error>> HttpClient::unpin_message(Snowflake channel_id, Snowflake message_id)
{
    return call(Method::Delete, std::format("/channels/{}/pins/{}", channel_id, message_id));
}

} // namespace wisteria::rest
