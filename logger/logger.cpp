#include "wisteria/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <utility>

namespace wisteria
{

namespace fs = std::filesystem;

Logger::Sink& Logger::sink()
{
    static Sink s;
    return s;
}

Logger::Level Logger::parse_level(std::string_view lvl)
{
    static constexpr std::array<std::pair<std::string_view, Level>, 5> names
    {{
        {"debug", Level::Debug},
        {"info", Level::Info},
        {"warn", Level::Warn},
        {"warning", Level::Warn},
        {"error", Level::Error},
    }};

    auto same = [lvl](std::string_view name)
    {
        return std::ranges::equal(lvl, name, [](unsigned char a, unsigned char b)
        {
            return std::tolower(a) == b;
        });
    };
    auto it = std::ranges::find_if(names, [&](const auto& entry) { return same(entry.first); });
    return it != names.end() ? it->second : Level::Info;
}

std::string_view Logger::to_string(Level l)
{
    switch (l)
    {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
    }
    return "INFO";
}

Logger::Level Logger::level()
{
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    return s.threshold;
}

std::string Logger::now_str()
{
    using namespace std::chrono;
    auto now = system_clock::now();
    auto secs = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&secs, &local);
    std::array<char, 20> date{};
    std::strftime(date.data(), date.size(), "%Y-%m-%d %H:%M:%S", &local);
    return std::format("{}.{:03d}", date.data(), ms);
}

std::expected<void, std::string> Logger::init(std::string_view level,
                                              std::string_view file,
                                              size_t max_size_mb,
                                              bool enable_console)
{
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.threshold = parse_level(level);
    s.console = enable_console;
    s.limit = max_size_mb * 1024 * 1024;
    s.path = std::string(file);
    s.written = 0;
    s.out.close();
    if (s.path.empty())
    {
        return {};
    }

    std::error_code ec;
    if (auto size = fs::file_size(s.path, ec); !ec)
    {
        s.written = static_cast<size_t>(size);
    }
    s.out.open(s.path, std::ios::app);
    if (!s.out.is_open())
    {
        return std::unexpected("Failed to open log file: " + s.path);
    }
    return {};
}

std::expected<void, std::string> Logger::init(const Config::LoggingCfg& cfg)
{
    return init(cfg.level, cfg.file, cfg.max_size_mb, cfg.enable_console);
}

void Logger::shutdown()
{
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.out.close();
}

// Caller holds the lock. One previous generation is kept; if it cannot be
// moved aside the current file is kept and appended to.
void Logger::rotate(Sink& s)
{
    s.out.close();
    std::error_code ec;
    fs::rename(s.path, s.path + ".1", ec);
    if (ec)
    {
        std::cerr << "Log rotation of " << s.path << " failed: " << ec.message() << "\n";
        s.out.open(s.path, std::ios::app);
        return;
    }
    s.out.open(s.path, std::ios::trunc);
    s.written = 0;
}

void Logger::emit(Level l, const std::string& msg)
{
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    std::string line = std::format("[{}] [{}] {}\n", now_str(), to_string(l), msg);
    if (s.console)
    {
        (l == Level::Error ? std::cerr : std::cout) << line;
    }
    if (!s.out.is_open())
    {
        return;
    }
    if (s.limit > 0 && s.written > 0 && s.written + line.size() > s.limit)
    {
        rotate(s);
    }
    s.out << line;
    s.out.flush();
    s.written += line.size();
}

} // namespace wisteria
