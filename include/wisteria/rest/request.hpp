#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wisteria::rest
{

enum class Method : uint8_t
{
    Get,
    Post,
    Put,
    Patch,
    Delete,
};

std::string_view to_string(Method m);

// One outbound API call. `path` is relative to the API host and already
// carries the version prefix; `body` is sent as JSON when present.
struct Request
{
    Method method = Method::Get;
    std::string path;
    std::optional<boost::json::value> body;

    bool operator==(const Request&) const = default;
};

// Percent-encodes everything outside the unreserved set, plus ':' kept
// as-is so custom emoji ("name:id") stay readable in routes.
std::string encode_path_segment(std::string_view seg);

} // namespace wisteria::rest
