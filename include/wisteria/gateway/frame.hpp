#pragma once

#include "wisteria/error.hpp"

#include <boost/json.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace wisteria::gateway
{

/**
 * One gateway frame as handed over by the transport:
 * {"op": int, "d": any, "s": int, "t": string}.
 *
 * A JSON null for d, s or t is stored as absent. Whether the combination of
 * fields is valid for the opcode is checked by resolve(), not here.
 */
struct FrameEnvelope
{
    int64_t op = 0;
    std::optional<boost::json::value> d;
    std::optional<uint64_t> s;
    std::optional<std::string> t;

    static constexpr size_t default_max_size = 4 * 1024 * 1024;

    [[nodiscard]] static std::expected<FrameEnvelope, Error> parse(std::string_view text, size_t max_size = default_max_size);
    [[nodiscard]] static std::expected<FrameEnvelope, Error> from_json(const boost::json::value& jv);

    [[nodiscard]] boost::json::object to_json() const;
    [[nodiscard]] std::string serialize() const;

    // Client frames
    [[nodiscard]] static FrameEnvelope heartbeat(std::optional<uint64_t> last_seq);
    [[nodiscard]] static FrameEnvelope identify(std::string_view token, uint64_t intents,
                                                std::string_view os, std::string_view library);
    [[nodiscard]] static FrameEnvelope resume(std::string_view token, std::string_view session_id, uint64_t seq);

    bool operator==(const FrameEnvelope&) const = default;
};

} // namespace wisteria::gateway
