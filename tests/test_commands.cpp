#include <doctest/doctest.h>
#include "tp90x/auth.hpp"
#include "tp90x/catalog.hpp"
#include "tp90x/commands.hpp"

#include <vector>

using namespace tp90x;

static std::vector<uint8_t> bytes(const Request& r) {
    return std::vector<uint8_t>(r.payload.begin(), r.payload.end());
}

TEST_CASE("Handshake frame matches the capture byte for byte") {
    Request r = make_auth(KNOWN_AUTH_PAYLOAD);
    WireBytes wire;
    REQUIRE(encode_frame(r.opcode, r.payload, wire) == Status::Ok);
    CHECK(wire == WireBytes{0x01, 0x09, 0x99, 0xa8, 0x89, 0x3c, 0x66, 0x81, 0x75, 0x0d, 0xe3, 0x5c});
}

TEST_CASE("Simple builders") {
    CHECK(bytes(make_set_units(Units::Celsius)) == std::vector<uint8_t>{0x0c});
    CHECK(bytes(make_set_units(Units::Fahrenheit)) == std::vector<uint8_t>{0x0f});
    CHECK(bytes(make_set_sound(true)) == std::vector<uint8_t>{0x0c});
    CHECK(bytes(make_set_sound(false)) == std::vector<uint8_t>{0x0f});
    CHECK(bytes(make_get_alarm(3)) == std::vector<uint8_t>{0x03});
    CHECK(make_get_status().payload.empty());
    CHECK(make_get_firmware().payload.empty());
    CHECK(make_snooze().opcode == OP_SNOOZE);
    CHECK(make_backlight_on().opcode == OP_BACKLIGHT_ON);
    CHECK(make_backlight_on().payload.empty());
}

TEST_CASE("Time sync is little-endian seconds since 2020") {
    CHECK(bytes(make_time_sync(0x01020304)) == std::vector<uint8_t>{0x04, 0x03, 0x02, 0x01});
    CHECK(seconds_since_2020(EPOCH_2020_UNIX + 100) == 100);
    CHECK(seconds_since_2020(EPOCH_2020_UNIX) == 0);
    CHECK(seconds_since_2020(0) == 0);
}

TEST_CASE("Alarm payloads per mode") {
    AlarmConfig cfg;
    Request r;

    cfg.channel = 4;
    cfg.mode = AlarmMode::Off;
    cfg.primary = Temperature::from_tenths(100);   // ignored when off
    REQUIRE(make_set_alarm(cfg, r) == Status::Ok);
    CHECK(bytes(r) == std::vector<uint8_t>{0x04, 0x00, 0xff, 0xff, 0xff, 0xff});

    cfg.channel = 1;
    cfg.mode = AlarmMode::Target;
    cfg.primary = Temperature::from_tenths(635);
    REQUIRE(make_set_alarm(cfg, r) == Status::Ok);
    CHECK(bytes(r) == std::vector<uint8_t>{0x01, 0x0a, 0x06, 0x35, 0x00, 0x00});

    cfg.channel = 2;
    cfg.mode = AlarmMode::Range;
    cfg.primary = Temperature::from_tenths(800);
    cfg.secondary = Temperature::from_tenths(600);
    REQUIRE(make_set_alarm(cfg, r) == Status::Ok);
    CHECK(bytes(r) == std::vector<uint8_t>{0x02, 0x82, 0x08, 0x00, 0x06, 0x00});
}

TEST_CASE("Alarm builder rejects what the device cannot take") {
    AlarmConfig cfg;
    Request r;

    cfg.channel = 7;
    CHECK(make_set_alarm(cfg, r) == Status::InvalidArgument);
    cfg.channel = 0;
    CHECK(make_set_alarm(cfg, r) == Status::InvalidArgument);

    cfg.channel = 1;
    cfg.mode = AlarmMode::Target;
    cfg.primary = Temperature::absent();
    CHECK(make_set_alarm(cfg, r) == Status::InvalidArgument);

    cfg.mode = AlarmMode::Range;
    cfg.primary = Temperature::from_tenths(800);
    cfg.secondary = Temperature::absent();
    CHECK(make_set_alarm(cfg, r) == Status::InvalidArgument);

    cfg.secondary = Temperature::from_tenths(9000);
    CHECK(make_set_alarm(cfg, r) == Status::InvalidArgument);

    cfg.mode = static_cast<AlarmMode>(0x55);
    CHECK(make_set_alarm(cfg, r) == Status::InvalidArgument);
}

TEST_CASE("Every builder produces a catalog-legal payload") {
    AlarmConfig cfg;
    Request alarm;
    REQUIRE(make_set_alarm(cfg, alarm) == Status::Ok);

    const Request all[] = {
        make_auth(KNOWN_AUTH_PAYLOAD), make_backlight_on(), make_set_units(Units::Celsius),
        make_set_sound(true), alarm, make_get_alarm(1), make_get_status(), make_snooze(),
        make_time_sync(42), make_get_firmware(),
    };
    for (const auto& r : all) {
        CAPTURE(int(r.opcode));
        CHECK(validate_outbound(r.opcode, r.payload.size()) == Status::Ok);
    }
}

TEST_CASE("Handshake bytes from hex") {
    AuthPayload p{};
    std::string why;
    REQUIRE(parse_auth_hex("99a8893c6681750de3", p, why));
    CHECK(p == KNOWN_AUTH_PAYLOAD);
    REQUIRE(parse_auth_hex("99 A8 89 3c 66 81 75 0d e3", p, why));
    CHECK(p == KNOWN_AUTH_PAYLOAD);
    REQUIRE(parse_auth_hex("01:02:03:04:05:06:07:08:09", p, why));
    CHECK(p[8] == 0x09);

    CHECK_FALSE(parse_auth_hex("99a8", p, why));
    CHECK(why == "expected_9_bytes_got_2");
    CHECK_FALSE(parse_auth_hex("99a8893c6681750de", p, why));
    CHECK(why == "odd_digit_count");
    CHECK_FALSE(parse_auth_hex("zz", p, why));
    CHECK(why == "bad_hex_digit");
    CHECK_FALSE(parse_auth_hex("9 9", p, why));
    CHECK(why == "split_byte");
}

TEST_CASE("Fixed generator replays its bytes") {
    FixedAuthPayload def;
    CHECK(def.generate() == KNOWN_AUTH_PAYLOAD);

    AuthPayload other{{1, 2, 3, 4, 5, 6, 7, 8, 9}};
    FixedAuthPayload custom(other);
    CHECK(custom.generate() == other);
}
