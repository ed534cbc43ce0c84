#include "wisteria/gateway/dispatch_registry.hpp"

#include <algorithm>

namespace wisteria::gateway
{

template<class Ev>
void DispatchRegistry::add()
{
    decoders.emplace(std::string(Ev::tag), [](const boost::json::value& d) -> json_utils::Decoded<DispatchEvent>
    {
        return Ev::from_json(d).transform([](Ev ev) { return DispatchEvent(std::move(ev)); });
    });
}

template<class... Evs>
void DispatchRegistry::add_all(std::type_identity<std::variant<Evs...>>)
{
    (add<Evs>(), ...);
}

DispatchRegistry::DispatchRegistry()
{
    add_all(std::type_identity<DispatchEvent>{});
}

const DispatchRegistry& DispatchRegistry::instance()
{
    static const DispatchRegistry reg;
    return reg;
}

std::expected<DispatchEvent, Error> DispatchRegistry::decode(std::string_view tag, const boost::json::value& d) const
{
    auto it = decoders.find(tag);
    if (it == decoders.end())
    {
        return std::unexpected(Error::unknown_dispatch(std::string(tag)));
    }

    auto ev = it->second(d);
    if (!ev)
    {
        return std::unexpected(Error::invalid_format(it->first, ev.error().message()));
    }
    return std::move(*ev);
}

bool DispatchRegistry::contains(std::string_view tag) const
{
    return decoders.find(tag) != decoders.end();
}

std::vector<std::string_view> DispatchRegistry::tags() const
{
    std::vector<std::string_view> ret;
    ret.reserve(decoders.size());
    for (const auto& [tag, _] : decoders)
    {
        ret.push_back(tag);
    }
    std::ranges::sort(ret);
    return ret;
}

} // namespace wisteria::gateway
