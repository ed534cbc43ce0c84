#include "wisteria/fundamentals/json_utils.hpp"

#include <format>

namespace wisteria::json_utils
{

DecodeError DecodeError::prepend(std::string_view key) const
{
    if (path.empty())
    {
        return DecodeError{std::string(key), problem};
    }
    if (path.front() == '[')
    {
        return DecodeError{std::format("{}{}", key, path), problem};
    }
    return DecodeError{std::format("{}.{}", key, path), problem};
}

DecodeError DecodeError::prepend_index(size_t idx) const
{
    if (path.empty() || path.front() == '[')
    {
        return DecodeError{std::format("[{}]{}", idx, path), problem};
    }
    return DecodeError{std::format("[{}].{}", idx, path), problem};
}

std::string DecodeError::message() const
{
    if (path.empty())
    {
        return problem;
    }
    return std::format("\"{}\": {}", path, problem);
}

Decoded<std::string> decode_string(const json::value& jv)
{
    if (!jv.is_string())
    {
        return std::unexpected(DecodeError{{}, "must be a string"});
    }
    return std::string(jv.as_string());
}

Decoded<bool> decode_bool(const json::value& jv)
{
    if (!jv.is_bool())
    {
        return std::unexpected(DecodeError{{}, "must be a boolean"});
    }
    return jv.as_bool();
}

Decoded<uint64_t> decode_uint(const json::value& jv, uint64_t max_val)
{
    uint64_t val = 0;
    if (jv.is_uint64())
    {
        val = jv.get_uint64();
    }
    else if (jv.is_int64() && jv.get_int64() >= 0)
    {
        val = static_cast<uint64_t>(jv.get_int64());
    }
    else
    {
        return std::unexpected(DecodeError{{}, "must be an unsigned integer"});
    }
    if (val > max_val)
    {
        return std::unexpected(DecodeError{{}, std::format("must not exceed {}", max_val)});
    }
    return val;
}

Decoded<int64_t> decode_int(const json::value& jv, int64_t min_val, int64_t max_val)
{
    int64_t val = 0;
    if (jv.is_int64())
    {
        val = jv.get_int64();
    }
    else if (jv.is_uint64() && jv.get_uint64() <= static_cast<uint64_t>(max_val))
    {
        val = static_cast<int64_t>(jv.get_uint64());
    }
    else
    {
        return std::unexpected(DecodeError{{}, "must be an integer"});
    }
    if (val < min_val || val > max_val)
    {
        return std::unexpected(DecodeError{{}, std::format("must be between {} and {}", min_val, max_val)});
    }
    return val;
}

Decoded<double> decode_double(const json::value& jv)
{
    switch (jv.kind())
    {
        case json::kind::double_: return jv.get_double();
        case json::kind::int64:   return static_cast<double>(jv.get_int64());
        case json::kind::uint64:  return static_cast<double>(jv.get_uint64());
        default:
            return std::unexpected(DecodeError{{}, "must be a number"});
    }
}

Decoded<std::string> decode_scalar_text(const json::value& jv)
{
    switch (jv.kind())
    {
        case json::kind::string: return std::string(jv.get_string());
        case json::kind::int64:  return std::to_string(jv.get_int64());
        case json::kind::uint64: return std::to_string(jv.get_uint64());
        default:
            return std::unexpected(DecodeError{{}, "must be a string or an integer"});
    }
}

Decoded<Reader> Reader::open(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected(DecodeError{{}, "must be an object"});
    }
    return Reader(jv.as_object());
}

std::string Reader::required_text(std::string_view key)
{
    auto raw = required<json::value>(key);
    if (!ok())
    {
        return {};
    }
    auto ret = decode_scalar_text(raw);
    if (!ret)
    {
        err = ret.error().prepend(key);
        return {};
    }
    return std::move(*ret);
}

std::optional<std::string> Reader::optional_text(std::string_view key)
{
    auto raw = optional<json::value>(key);
    if (!raw)
    {
        return std::nullopt;
    }
    auto ret = decode_scalar_text(*raw);
    if (!ret)
    {
        err = ret.error().prepend(key);
        return std::nullopt;
    }
    return std::move(*ret);
}

void Reader::reject(std::string_view key, std::string problem)
{
    if (!err)
    {
        err = DecodeError{std::string(key), std::move(problem)};
    }
}

} // namespace wisteria::json_utils
