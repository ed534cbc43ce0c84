#pragma once

#include "wisteria/error.hpp"
#include "wisteria/fundamentals/json_utils.hpp"
#include "wisteria/gateway/events.hpp"

#include <boost/json.hpp>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace wisteria::gateway
{

/**
 * Event-type tag -> decoder table for dispatch frames.
 *
 * Built once from the alternatives of DispatchEvent and immutable
 * afterwards, so lookups need no synchronization. Tags match exactly and
 * case-sensitively.
 */
class DispatchRegistry
{
public:
    using Decoder = std::function<json_utils::Decoded<DispatchEvent>(const boost::json::value&)>;

    [[nodiscard]] static const DispatchRegistry& instance();

    // unknown_dispatch carries `tag`; a body that does not decode is
    // invalid_format with `tag` as subject and the failing field as detail.
    [[nodiscard]] std::expected<DispatchEvent, Error> decode(std::string_view tag, const boost::json::value& d) const;

    [[nodiscard]] bool contains(std::string_view tag) const;
    [[nodiscard]] std::vector<std::string_view> tags() const;
    [[nodiscard]] size_t size() const { return decoders.size(); }

    DispatchRegistry(const DispatchRegistry&) = delete;
    DispatchRegistry& operator=(const DispatchRegistry&) = delete;

private:
    struct TagHash
    {
        using is_transparent = void;
        size_t operator()(std::string_view sv) const { return std::hash<std::string_view>{}(sv); }
    };

    DispatchRegistry();

    template<class Ev>
    void add();

    template<class... Evs>
    void add_all(std::type_identity<std::variant<Evs...>>);

    std::unordered_map<std::string, Decoder, TagHash, std::equal_to<>> decoders;
};

} // namespace wisteria::gateway
