#include "wisteria/gateway/frame.hpp"
#include "wisteria/fundamentals/json_utils.hpp"
#include "wisteria/gateway/opcode.hpp"

#include <format>

namespace wisteria::gateway
{

namespace json = boost::json;

std::expected<FrameEnvelope, Error> FrameEnvelope::parse(std::string_view text, size_t max_size)
{
    if (text.size() > max_size)
    {
        return std::unexpected(Error::invalid_format("frame",
            std::format("{} bytes exceeds limit of {}", text.size(), max_size)));
    }

    boost::system::error_code ec;
    json::value jv = json::parse(text, ec);
    if (ec)
    {
        return std::unexpected(Error::invalid_format("frame", std::format("JSON parse error: {}", ec.message())));
    }
    return from_json(jv);
}

std::expected<FrameEnvelope, Error> FrameEnvelope::from_json(const json::value& jv)
{
    auto rd = json_utils::Reader::open(jv);
    if (!rd)
    {
        return std::unexpected(Error::invalid_format("frame", rd.error().problem));
    }
    FrameEnvelope frame;
    frame.op = rd->required<int64_t>("op");
    frame.d = rd->optional<json::value>("d");
    frame.s = rd->optional<uint64_t>("s");
    frame.t = rd->optional<std::string>("t");

    auto ret = rd->finish(std::move(frame));
    if (!ret)
    {
        return std::unexpected(Error::invalid_format(ret.error().path, ret.error().problem));
    }
    return std::move(*ret);
}

json::object FrameEnvelope::to_json() const
{
    json::object obj;
    obj["op"] = op;
    obj["d"] = d.value_or(json::value(nullptr));
    if (s)
    {
        obj["s"] = *s;
    }
    if (t)
    {
        obj["t"] = *t;
    }
    return obj;
}

std::string FrameEnvelope::serialize() const
{
    return json::serialize(to_json());
}

FrameEnvelope FrameEnvelope::heartbeat(std::optional<uint64_t> last_seq)
{
    FrameEnvelope frame;
    frame.op = static_cast<int64_t>(Opcode::Heartbeat);
    if (last_seq)
    {
        frame.d = json::value(*last_seq);
    }
    return frame;
}

FrameEnvelope FrameEnvelope::identify(std::string_view token, uint64_t intents,
                                      std::string_view os, std::string_view library)
{
    json::object props;
    props["$os"] = os;
    props["$browser"] = library;
    props["$device"] = library;

    json::object body;
    body["token"] = token;
    body["intents"] = intents;
    body["properties"] = std::move(props);

    FrameEnvelope frame;
    frame.op = static_cast<int64_t>(Opcode::Identify);
    frame.d = json::value(std::move(body));
    return frame;
}

FrameEnvelope FrameEnvelope::resume(std::string_view token, std::string_view session_id, uint64_t seq)
{
    json::object body;
    body["token"] = token;
    body["session_id"] = session_id;
    body["seq"] = seq;

    FrameEnvelope frame;
    frame.op = static_cast<int64_t>(Opcode::Resume);
    frame.d = json::value(std::move(body));
    return frame;
}

} // namespace wisteria::gateway
