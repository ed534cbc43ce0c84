#pragma once

#include "wisteria/config.hpp"
#include "wisteria/error.hpp"
#include "wisteria/models/embed.hpp"
#include "wisteria/models/message.hpp"
#include "wisteria/models/snowflake.hpp"
#include "wisteria/rest/requester.hpp"

#include <boost/asio.hpp>
#include <expected>
#include <functional>
#include <string>

namespace wisteria::rest
{

namespace net = boost::asio;
using models::Snowflake;

// Typed channel/message endpoints on top of a Requester. Never retries,
// never rewrites collaborator errors.
class HttpClient
{
public:
    static constexpr unsigned default_api_version = 8;

    explicit HttpClient(Requester& req, unsigned api_version = default_api_version);
    HttpClient(Requester& req, const Config& config);

    [[nodiscard]] net::awaitable<std::expected<models::Message, Error>> send_message(Snowflake channel_id, std::string content);
    [[nodiscard]] net::awaitable<std::expected<models::Message, Error>> send_embed(Snowflake channel_id, models::Embed embed);
    [[nodiscard]] net::awaitable<std::expected<void, Error>> add_reaction(Snowflake channel_id, Snowflake message_id, std::string emoji);
    [[nodiscard]] net::awaitable<std::expected<void, Error>> delete_message(Snowflake channel_id, Snowflake message_id);
    [[nodiscard]] net::awaitable<std::expected<void, Error>> pin_message(Snowflake channel_id, Snowflake message_id);
    [[nodiscard]] net::awaitable<std::expected<void, Error>> unpin_message(Snowflake channel_id, Snowflake message_id);

    [[nodiscard]] std::string route(std::string_view path) const;

private:
    net::awaitable<std::expected<models::Message, Error>> post_message(Snowflake channel_id, boost::json::object body);
    net::awaitable<std::expected<void, Error>> call(Method m, std::string path);

    std::reference_wrapper<Requester> requester;
    unsigned version;
};

} // namespace wisteria::rest
