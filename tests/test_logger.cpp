#include <catch2/catch_test_macros.hpp>

#include "wisteria/config.hpp"
#include "wisteria/logger.hpp"

#include <boost/json.hpp>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using wisteria::Logger;

TEST_CASE("Logger::parse_level accepts level names")
{
    CHECK(Logger::parse_level("debug") == Logger::Level::Debug);
    CHECK(Logger::parse_level("WARNING") == Logger::Level::Warn);
    CHECK(Logger::parse_level("Error") == Logger::Level::Error);
    CHECK(Logger::parse_level("bogus") == Logger::Level::Info);
}

TEST_CASE("Logger writes formatted lines to the log file")
{
    const std::string test_file = "/tmp/wisteria_logger_lines.log";
    fs::remove(test_file);

    REQUIRE(Logger::init("warn", test_file, 1, false).has_value());
    WISTERIA_LOG_INFO("suppressed {}", 1);
    WISTERIA_LOG_WARN("frame {} dropped", 42);
    Logger::shutdown();

    std::ifstream f(test_file);
    std::string line;
    REQUIRE(static_cast<bool>(std::getline(f, line)));
    CHECK(line.find("[WARN] frame 42 dropped") != std::string::npos);
    CHECK(!std::getline(f, line));

    fs::remove(test_file);
}

TEST_CASE("Logger rotates the file past its size limit")
{
    const std::string test_file = "/tmp/wisteria_logger_rotate.log";
    fs::remove(test_file);
    fs::remove(test_file + ".1");

    REQUIRE(Logger::init("info", test_file, 1, false).has_value());
    const std::string filler(1000, 'x');
    for (int i = 0; i < 1200; ++i)
    {
        WISTERIA_LOG_INFO("{} {}", i, filler);
    }
    Logger::shutdown();

    CHECK(fs::exists(test_file + ".1"));
    CHECK(fs::file_size(test_file + ".1") <= 1024 * 1024);
    CHECK(fs::file_size(test_file) < 1024 * 1024);

    fs::remove(test_file);
    fs::remove(test_file + ".1");
}

TEST_CASE("Logger keeps the current file when rotation cannot move it")
{
    const std::string test_file = "/tmp/wisteria_logger_stuck.log";
    const std::string blocker = test_file + ".1";
    fs::remove(test_file);
    fs::remove_all(blocker);
    fs::create_directories(blocker + "/occupied");

    REQUIRE(Logger::init("info", test_file, 1, false).has_value());
    const std::string filler(1000, 'x');
    for (int i = 0; i < 1100; ++i)
    {
        WISTERIA_LOG_INFO("line {} {}", i, filler);
    }
    Logger::shutdown();

    CHECK(fs::is_directory(blocker));
    REQUIRE(fs::exists(test_file));
    CHECK(fs::file_size(test_file) > 1024 * 1024);

    std::ifstream f(test_file);
    std::string first;
    REQUIRE(static_cast<bool>(std::getline(f, first)));
    CHECK(first.find("line 0 ") != std::string::npos);

    fs::remove(test_file);
    fs::remove_all(blocker);
}

TEST_CASE("Logger::init takes the logging section of the config")
{
    const std::string test_file = "/tmp/wisteria_logger_config.log";
    fs::remove(test_file);

    auto cfg = wisteria::Config::parse(boost::json::parse(
        R"({"logging": {"level": "error", "file": "/tmp/wisteria_logger_config.log", "enable_console": false}})"));
    REQUIRE(cfg.has_value());
    REQUIRE(Logger::init(cfg->logging()).has_value());

    CHECK(Logger::level() == Logger::Level::Error);
    WISTERIA_LOG_WARN("not written");
    WISTERIA_LOG_ERROR("written {}", "once");
    Logger::shutdown();

    std::ifstream f(test_file);
    std::string line;
    REQUIRE(static_cast<bool>(std::getline(f, line)));
    CHECK(line.find("[ERROR] written once") != std::string::npos);
    CHECK(!std::getline(f, line));

    fs::remove(test_file);
}

TEST_CASE("Logger::to_string names every level")
{
    CHECK(Logger::to_string(Logger::Level::Debug) == "DEBUG");
    CHECK(Logger::to_string(Logger::Level::Info) == "INFO");
    CHECK(Logger::to_string(Logger::Level::Warn) == "WARN");
    CHECK(Logger::to_string(Logger::Level::Error) == "ERROR");
}

TEST_CASE("Logger::init reports an unwritable file")
{
    auto result = Logger::init("info", "/nonexistent/dir/wisteria.log", 1, false);

    CHECK(!result.has_value());
    REQUIRE(Logger::init("info", "", 100, false).has_value());
}
