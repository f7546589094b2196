#include <doctest/doctest.h>
#include "tp90x/auth.hpp"
#include "tp90x/config.hpp"
#include "tp90x/session.hpp"   // SessionConfig, MAX_RECEIVE_POLL_MS

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace tp90x;
namespace fs = std::filesystem;

TEST_CASE("Defaults") {
    Config c;
    CHECK(c.model == "tp902");
    CHECK(c.request_timeout_ms == 5000);
    CHECK(c.write_grace_ms == 300);
    CHECK(c.log_level == LogLevel::Warn);
    CHECK_FALSE(c.auth_payload.has_value());

    SessionConfig s = c.session_config();
    CHECK(s.request_timeout_ms == 5000);
    CHECK(s.write_grace_ms == 300);
    CHECK(s.receive_poll_ms == 50);
    CHECK(s.broadcast_backlog == 0);
}

TEST_CASE("Keys overlay the defaults") {
    Config c;
    std::string why;
    REQUIRE(parse_config(R"({
        "model": "tp904",
        "request_timeout_ms": 1500,
        "write_grace_ms": 0,
        "broadcast_backlog": 64,
        "log_level": "DEBUG",
        "auth_payload": "01 02 03 04 05 06 07 08 09"
    })", c, why));
    CHECK(c.model == "tp904");
    CHECK(c.request_timeout_ms == 1500);
    CHECK(c.receive_poll_ms == 50);         // untouched
    CHECK(c.write_grace_ms == 0);
    CHECK(c.session_config().broadcast_backlog == 64);
    CHECK(c.log_level == LogLevel::Debug);
    REQUIRE(c.auth_payload.has_value());
    CHECK((*c.auth_payload)[8] == 0x09);
}

TEST_CASE("Bad input is reported and changes nothing") {
    Config c;
    std::string why;

    CHECK_FALSE(parse_config("{ not json", c, why));
    CHECK(why == "invalid_json");

    CHECK_FALSE(parse_config("[1, 2]", c, why));
    CHECK(why == "expected_object");

    CHECK_FALSE(parse_config(R"({"model": "tp904", "request_timeout_ms": "fast"})", c, why));
    CHECK(why == "key=request_timeout_ms expected=integer");
    CHECK(c.model == "tp902");              // not half-applied

    CHECK_FALSE(parse_config(R"({"request_timeout_ms": 0})", c, why));
    CHECK(why == "key=request_timeout_ms expected=positive_integer");

    CHECK_FALSE(parse_config(R"({"write_grace_ms": -5})", c, why));
    CHECK(why == "key=write_grace_ms expected=non_negative_integer");

    CHECK_FALSE(parse_config(R"({"model": 7})", c, why));
    CHECK(why == "key=model expected=string");

    CHECK_FALSE(parse_config(R"({"log_level": "loud"})", c, why));
    CHECK(why == "key=log_level expected=error|warn|info|debug");

    CHECK_FALSE(parse_config(R"({"auth_payload": "99a8"})", c, why));
    CHECK(why == "key=auth_payload expected_9_bytes_got_2");
    CHECK_FALSE(c.auth_payload.has_value());
}

TEST_CASE("Receive poll slice is bounded") {
    Config c;
    std::string why;

    CHECK(parse_config(R"({"receive_poll_ms": 60000})", c, why));
    CHECK(c.session_config().receive_poll_ms == MAX_RECEIVE_POLL_MS);

    // Would wrap negative as an int timeout.
    CHECK_FALSE(parse_config(R"({"receive_poll_ms": 4294967295})", c, why));
    CHECK(why == "key=receive_poll_ms expected=1..60000");
    CHECK_FALSE(parse_config(R"({"receive_poll_ms": 60001})", c, why));
    CHECK(why == "key=receive_poll_ms expected=1..60000");
    CHECK(c.receive_poll_ms == 60000);      // last good value kept
}

TEST_CASE("Unknown keys are ignored") {
    Config c;
    std::string why;
    CHECK(parse_config(R"({"colour": "blue"})", c, why));
    CHECK(c.model == "tp902");
}

TEST_CASE("Loading from disk") {
    const fs::path dir = fs::temp_directory_path() / "tp90x-config-test";
    fs::create_directories(dir);
    const fs::path file = dir / "config.json";

    Config c;
    std::string why;

    SUBCASE("missing file keeps defaults") {
        fs::remove(file);
        CHECK(load_config(file.string(), c, why));
        CHECK(c.model == "tp902");
        CHECK(load_config("", c, why));
    }

    SUBCASE("file contents are applied") {
        {
            std::ofstream out(file);
            out << R"({"model": "tp904", "receive_poll_ms": 20})";
        }
        REQUIRE(load_config(file.string(), c, why));
        CHECK(c.model == "tp904");
        CHECK(c.receive_poll_ms == 20);
    }

    SUBCASE("parse errors name the file") {
        {
            std::ofstream out(file);
            out << R"({"receive_poll_ms": 0})";
        }
        CHECK_FALSE(load_config(file.string(), c, why));
        CHECK(why == "key=receive_poll_ms expected=positive_integer path=" + file.string());
    }

    fs::remove_all(dir);
}

TEST_CASE("Default location follows XDG, then HOME") {
    const char* xdg0  = std::getenv("XDG_CONFIG_HOME");
    const char* home0 = std::getenv("HOME");
    const bool had_xdg  = xdg0 != nullptr;
    const bool had_home = home0 != nullptr;
    const std::string xdg_saved  = had_xdg ? xdg0 : "";
    const std::string home_saved = had_home ? home0 : "";

    setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    setenv("HOME", "/home/someone", 1);
    CHECK(default_config_path() == "/tmp/xdg/tp90x/config.json");

    unsetenv("XDG_CONFIG_HOME");
    CHECK(default_config_path() == "/home/someone/.config/tp90x/config.json");

    unsetenv("HOME");
    CHECK(default_config_path().empty());

    if (had_xdg) setenv("XDG_CONFIG_HOME", xdg_saved.c_str(), 1);
    if (had_home) setenv("HOME", home_saved.c_str(), 1);
}
