#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace wisteria
{

struct Error
{
    enum class errc
    {
        invalid_format = 1,
        unknown_dispatch = 2,
        unexpected_opcode = 3,
        http = 4
    };

    errc code;
    std::string subject;   // field, dispatch tag, opcode or route
    std::string detail;
    std::optional<unsigned> status;

    [[nodiscard]] static Error invalid_format(std::string subject, std::string detail = {});
    [[nodiscard]] static Error unknown_dispatch(std::string tag);
    [[nodiscard]] static Error unexpected_opcode(int64_t op);
    [[nodiscard]] static Error http(std::string route, unsigned status, std::string detail);

    [[nodiscard]] std::string message() const;

    bool operator==(const Error&) const = default;
};

std::string_view to_string(Error::errc code);

} // namespace wisteria

template<>
struct std::formatter<wisteria::Error>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const wisteria::Error& e, std::format_context& fc) const
    {
        return std::format_to(fc.out(), "{}", e.message());
    }
};
