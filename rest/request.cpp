#include "wisteria/rest/request.hpp"

#include <format>

namespace wisteria::rest
{

std::string_view to_string(Method m)
{
    switch (m)
    {
        case Method::Get:    return "GET";
        case Method::Post:   return "POST";
        case Method::Put:    return "PUT";
        case Method::Patch:  return "PATCH";
        case Method::Delete: return "DELETE";
    }
    return "GET";
}

std::string encode_path_segment(std::string_view seg)
{
    std::string ret;
    ret.reserve(seg.size() * 3);
    for (unsigned char ch : seg)
    {
        bool unreserved = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')
                       || ch == '-' || ch == '.' || ch == '_' || ch == '~' || ch == ':';
        if (unreserved)
        {
            ret.push_back(static_cast<char>(ch));
        }
        else
        {
            ret += std::format("%{:02X}", ch);
        }
    }
    return ret;
}

} // namespace wisteria::rest
