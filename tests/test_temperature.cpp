#include <doctest/doctest.h>
#include "tp90x/temperature.hpp"

using namespace tp90x;

static Temperature decode2(uint8_t hi, uint8_t lo, Status* st_out = nullptr) {
    const uint8_t raw[2] = {hi, lo};
    Temperature t = Temperature::from_tenths(12345 % 7999);   // poison
    Status st = decode_temperature(raw, t);
    if (st_out) *st_out = st;
    return t;
}

TEST_CASE("FF FF is an absent probe and encodes back to FF FF") {
    Status st;
    Temperature t = decode2(0xff, 0xff, &st);
    REQUIRE(st == Status::Ok);
    CHECK(t.is_absent());
    CHECK(to_string(t) == "---");

    uint8_t out[2] = {0, 0};
    REQUIRE(encode_temperature(Temperature::absent(), out) == Status::Ok);
    CHECK(out[0] == 0xff);
    CHECK(out[1] == 0xff);
}

TEST_CASE("BCD digits decode to tenths of a degree") {
    CHECK(decode2(0x02, 0x15).tenths() == 215);
    CHECK(decode2(0x80, 0x32).tenths() == -32);
    CHECK(decode2(0x79, 0x99).tenths() == 7999);
    CHECK(decode2(0x00, 0x00).present());
    CHECK(decode2(0x00, 0x00).tenths() == 0);
    CHECK(decode2(0x12, 0x34).degrees() == doctest::Approx(123.4));
}

TEST_CASE("Digit nibbles above 9 are InvalidBcd") {
    Status st;
    decode2(0x0a, 0x00, &st);
    CHECK(st == Status::InvalidBcd);
    decode2(0x00, 0xa0, &st);
    CHECK(st == Status::InvalidBcd);
    decode2(0x00, 0x0f, &st);
    CHECK(st == Status::InvalidBcd);
    decode2(0xff, 0xfe, &st);                    // almost the sentinel
    CHECK(st == Status::InvalidBcd);
}

TEST_CASE("Encoding is the inverse of decoding") {
    for (int v : {0, 1, 9, 10, 215, -32, 999, 1000, 6350, 7999, -7999}) {
        uint8_t raw[2];
        REQUIRE(encode_temperature(Temperature::from_tenths(static_cast<int16_t>(v)), raw) == Status::Ok);
        Temperature back;
        REQUIRE(decode_temperature(raw, back) == Status::Ok);
        CAPTURE(v);
        CHECK(back.tenths() == v);
    }

    uint8_t raw[2];
    REQUIRE(encode_temperature(Temperature::from_tenths(-32), raw) == Status::Ok);
    CHECK(raw[0] == 0x80);
    CHECK(raw[1] == 0x32);
}

TEST_CASE("Values beyond 799.9 cannot be encoded") {
    uint8_t raw[2];
    CHECK(encode_temperature(Temperature::from_tenths(8000), raw) == Status::InvalidArgument);
    CHECK(encode_temperature(Temperature::from_tenths(-8000), raw) == Status::InvalidArgument);
}

TEST_CASE("Text rendering and parsing") {
    CHECK(to_string(Temperature::from_tenths(215)) == "21.5");
    CHECK(to_string(Temperature::from_tenths(-32)) == "-3.2");
    CHECK(to_string(Temperature::from_tenths(-5)) == "-0.5");

    Temperature t;
    REQUIRE(parse_temperature("63.5", t));
    CHECK(t.tenths() == 635);
    REQUIRE(parse_temperature("80", t));
    CHECK(t.tenths() == 800);
    REQUIRE(parse_temperature("-3.2", t));
    CHECK(t.tenths() == -32);
    REQUIRE(parse_temperature("---", t));
    CHECK(t.is_absent());

    CHECK_FALSE(parse_temperature("", t));
    CHECK_FALSE(parse_temperature("abc", t));
    CHECK_FALSE(parse_temperature("1.25", t));
    CHECK_FALSE(parse_temperature("800", t));
    CHECK_FALSE(parse_temperature("12.", t));
}

TEST_CASE("Absent compares equal only to absent") {
    CHECK(Temperature::absent() == Temperature());
    CHECK(Temperature::absent() != Temperature::from_tenths(0));
    CHECK(Temperature::from_tenths(5) == Temperature::from_tenths(5));
}
