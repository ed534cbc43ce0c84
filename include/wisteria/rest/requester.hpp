#pragma once

#include "wisteria/error.hpp"
#include "wisteria/rest/request.hpp"

#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <expected>

namespace wisteria::rest
{

namespace net = boost::asio;

/**
 * The HTTP collaborator. Implementations own the connection, headers,
 * authentication, rate limiting and retries. A failed call completes with
 * Error::errc::http (or whatever the implementation reports), which callers
 * pass on untouched. Responses without a body complete with a null value.
 */
class Requester
{
public:
    virtual ~Requester() = default;

    [[nodiscard]] virtual net::awaitable<std::expected<boost::json::value, Error>> execute(Request req) = 0;
};

} // namespace wisteria::rest
