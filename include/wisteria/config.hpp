#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <expected>
#include <string>

namespace wisteria
{

namespace json = boost::json;

/**
 * Client configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    struct GatewayCfg
    {
        bool ignore_unknown_dispatch = true;
        size_t max_frame_size = 4 * 1024 * 1024;
    };

    struct RestCfg
    {
        unsigned api_version = 8;
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath);
    [[nodiscard]] static Config load_defaults();
    [[nodiscard]] static Config load_or_defaults(const std::string& filepath);
    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);

    [[nodiscard]] const GatewayCfg& gateway() const { return gw; }
    [[nodiscard]] const RestCfg& rest() const { return rst; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

private:
    GatewayCfg gw;
    RestCfg rst;
    LoggingCfg log;
};

} // namespace wisteria
