#include "wisteria/error.hpp"

namespace wisteria
{

Error Error::invalid_format(std::string subject, std::string detail)
{
    return Error{errc::invalid_format, std::move(subject), std::move(detail), std::nullopt};
}

Error Error::unknown_dispatch(std::string tag)
{
    return Error{errc::unknown_dispatch, std::move(tag), {}, std::nullopt};
}

Error Error::unexpected_opcode(int64_t op)
{
    return Error{errc::unexpected_opcode, std::to_string(op), {}, std::nullopt};
}

Error Error::http(std::string route, unsigned status, std::string detail)
{
    return Error{errc::http, std::move(route), std::move(detail), status};
}

std::string_view to_string(Error::errc code)
{
    switch (code)
    {
        case Error::errc::invalid_format:    return "invalid payload format";
        case Error::errc::unknown_dispatch:  return "unrecognized dispatch type";
        case Error::errc::unexpected_opcode: return "unexpected opcode";
        case Error::errc::http:              return "http request failed";
    }
    return "unknown error";
}

std::string Error::message() const
{
    std::string ret = std::format("{}: {}", to_string(code), subject);
    if (status)
    {
        ret += std::format(" (status {})", *status);
    }
    if (!detail.empty())
    {
        ret += std::format(" ({})", detail);
    }
    return ret;
}

} // namespace wisteria
