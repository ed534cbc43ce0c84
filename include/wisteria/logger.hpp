#pragma once

#include "wisteria/config.hpp"

#include <expected>
#include <format>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace wisteria
{

/**
 * Process-wide logger. Lines go to stdout (errors to stderr) and, when a
 * file is configured, to that file; once the file would grow past
 * max_size_mb it is moved to "<file>.1" and started afresh.
 */
class Logger
{
public:
    enum class Level { Debug, Info, Warn, Error };

    [[nodiscard]] static std::expected<void, std::string> init(std::string_view level,
                                                                std::string_view file,
                                                                size_t max_size_mb,
                                                                bool enable_console);
    [[nodiscard]] static std::expected<void, std::string> init(const Config::LoggingCfg& cfg);
    static void shutdown();

    [[nodiscard]] static Level level();
    [[nodiscard]] static Level parse_level(std::string_view lvl);
    [[nodiscard]] static std::string_view to_string(Level l);

    template<typename... Args>
    static void write(Level l, std::format_string<Args...> fmt, Args&&... args)
    {
        if (level() <= l)
        {
            emit(l, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    static void debug(std::format_string<Args...> fmt, Args&&... args) { write<Args...>(Level::Debug, fmt, std::forward<Args>(args)...); }

    template<typename... Args>
    static void info(std::format_string<Args...> fmt, Args&&... args) { write<Args...>(Level::Info, fmt, std::forward<Args>(args)...); }

    template<typename... Args>
    static void warn(std::format_string<Args...> fmt, Args&&... args) { write<Args...>(Level::Warn, fmt, std::forward<Args>(args)...); }

    template<typename... Args>
    static void error(std::format_string<Args...> fmt, Args&&... args) { write<Args...>(Level::Error, fmt, std::forward<Args>(args)...); }

private:
    struct Sink
    {
        std::mutex mtx;
        Level threshold = Level::Info;
        bool console = true;
        std::string path;
        std::ofstream out;
        size_t limit = 100 * 1024 * 1024;
        size_t written = 0;
    };

    static Sink& sink();
    static std::string now_str();
    static void rotate(Sink& s);
    static void emit(Level l, const std::string& msg);
};

} // namespace wisteria

#define WISTERIA_LOG_DEBUG(...) ::wisteria::Logger::debug(__VA_ARGS__)
#define WISTERIA_LOG_INFO(...)  ::wisteria::Logger::info(__VA_ARGS__)
#define WISTERIA_LOG_WARN(...)  ::wisteria::Logger::warn(__VA_ARGS__)
#define WISTERIA_LOG_ERROR(...) ::wisteria::Logger::error(__VA_ARGS__)
