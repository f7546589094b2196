#include <doctest/doctest.h>
#include "tp90x/log.hpp"
#include "tp90x/status.hpp"

#include <string>
#include <vector>

using namespace tp90x;

TEST_CASE("Log lines are key=value and respect the level") {
    std::vector<std::string> lines;
    set_log_sink([&lines](LogLevel, const std::string& l) { lines.push_back(l); });
    const LogLevel saved = log_level();

    set_log_level(LogLevel::Warn);
    log_event(LogLevel::Warn, "frame_dropped", "reason=checksum_mismatch len=20");
    log_event(LogLevel::Debug, "rx", "type=raw");
    log_event(LogLevel::Error, "link_error");

    set_log_sink({});
    set_log_level(saved);

    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "level=warn event=frame_dropped reason=checksum_mismatch len=20");
    CHECK(lines[1] == "level=error event=link_error");
}

TEST_CASE("A sink may log and read the level from inside a call") {
    std::vector<std::string> lines;
    const LogLevel saved = log_level();
    set_log_level(LogLevel::Info);
    set_log_sink([&lines](LogLevel, const std::string& l) {
        lines.push_back(l);
        if (l.find("event=outer") != std::string::npos) {
            log_event(LogLevel::Info, "inner");
            (void)log_level();
        }
    });

    log_event(LogLevel::Info, "outer");
    set_log_sink({});
    set_log_level(saved);

    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "level=info event=outer");
    CHECK(lines[1] == "level=info event=inner");
}

TEST_CASE("Level names parse case-insensitively") {
    LogLevel l = LogLevel::Warn;
    REQUIRE(parse_log_level("DEBUG", l));
    CHECK(l == LogLevel::Debug);
    REQUIRE(parse_log_level("error", l));
    CHECK(l == LogLevel::Error);
    CHECK_FALSE(parse_log_level("loud", l));
    CHECK(l == LogLevel::Error);
}

TEST_CASE("Status reasons are stable snake_case") {
    CHECK(std::string(to_string(Status::ChecksumMismatch)) == "checksum_mismatch");
    CHECK(std::string(to_string(Status::UnexpectedPayloadLength)) == "unexpected_payload_length");
    CHECK(std::string(to_string(Status::Timeout)) == "timeout");
    CHECK(std::string(to_string(Status::TransportError)) == "transport_error");
    CHECK(hex_byte(0x3a) == "0x3a");
}
