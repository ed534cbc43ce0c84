#include "wisteria/config.hpp"

#include <concepts>
#include <format>
#include <fstream>
#include <sstream>

namespace wisteria
{

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_uint64() && !(it->value().is_int64() && it->value().get_int64() >= 0))
    {
        return std::unexpected(std::format("'{}' must be a non-negative integer", key));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::expected<std::string, std::string> get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::string(default_val);
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("'{}' must be a string", key));
    }
    return std::string(it->value().as_string());
}

std::expected<bool, std::string> get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_bool())
    {
        return std::unexpected(std::format("'{}' must be a boolean", key));
    }
    return it->value().as_bool();
}

const json::object* section(const json::object& root, std::string_view name)
{
    auto it = root.find(name);
    if (it == root.end() || !it->value().is_object())
    {
        return nullptr;
    }
    return &it->value().as_object();
}

} // namespace

std::expected<Config, std::string> Config::load(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    boost::system::error_code ec;
    json::value jv = json::parse(buffer.str(), ec);
    if (ec)
    {
        return std::unexpected(std::format("JSON parse error: {}", ec.message()));
    }
    return parse(jv);
}

Config Config::load_defaults()
{
    return Config{};
}

Config Config::load_or_defaults(const std::string& filepath)
{
    auto result = load(filepath);
    if (result)
    {
        return *result;
    }
    return load_defaults();
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;

    if (const auto* gw = section(root, "gateway"))
    {
        if (auto ignore = get_bool(*gw, "ignore_unknown_dispatch", true); ignore)
        {
            config.gw.ignore_unknown_dispatch = *ignore;
        }
        else
        {
            return std::unexpected(ignore.error());
        }
        if (auto max_frame = get_uint<size_t>(*gw, "max_frame_size", 1024, 64 * 1024 * 1024, 4 * 1024 * 1024); max_frame)
        {
            config.gw.max_frame_size = *max_frame;
        }
        else
        {
            return std::unexpected(max_frame.error());
        }
    }
    if (const auto* rst = section(root, "rest"))
    {
        if (auto version = get_uint<unsigned>(*rst, "api_version", 6, 10, 8); version)
        {
            config.rst.api_version = *version;
        }
        else
        {
            return std::unexpected(version.error());
        }
    }
    if (const auto* log = section(root, "logging"))
    {
        if (auto level = get_string(*log, "level", "info"); level)
        {
            config.log.level = *level;
        }
        else
        {
            return std::unexpected(level.error());
        }
        if (auto file = get_string(*log, "file", ""); file)
        {
            config.log.file = *file;
        }
        else
        {
            return std::unexpected(file.error());
        }
        if (auto max_size = get_uint<size_t>(*log, "max_size_mb", 1, 10000, 100); max_size)
        {
            config.log.max_size_mb = *max_size;
        }
        else
        {
            return std::unexpected(max_size.error());
        }
        if (auto console = get_bool(*log, "enable_console", true); console)
        {
            config.log.enable_console = *console;
        }
        else
        {
            return std::unexpected(console.error());
        }
    }
    return config;
}

} // namespace wisteria
