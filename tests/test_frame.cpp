#include <doctest/doctest.h>
#include "tp90x/frame.hpp"

#include <string>
#include <vector>

using namespace tp90x;

TEST_CASE("Set-units frame encodes to the captured bytes") {
    Payload p;
    p.push_back(0x0c);
    WireBytes out;
    REQUIRE(encode_frame(0x20, p, out) == Status::Ok);
    CHECK(out == WireBytes{0x20, 0x01, 0x0c, 0x2d});
}

TEST_CASE("Empty payload frame is opcode, zero length, checksum") {
    WireBytes out;
    REQUIRE(encode_frame(0x26, nullptr, 0, out) == Status::Ok);
    CHECK(out == WireBytes{0x26, 0x00, 0x26});
}

TEST_CASE("Checksum wraps at 8 bits") {
    const uint8_t data[] = {0xff, 0xff, 0xff};
    // 0x30 + 3 + 3*0xff = 0x330
    CHECK(frame_checksum(0x30, data, 3) == 0x30);
}

TEST_CASE("Payloads longer than 255 bytes are refused") {
    std::vector<uint8_t> big(256, 0x01);
    WireBytes out;
    CHECK(encode_frame(0x30, big.data(), big.size(), out) == Status::PayloadTooLarge);

    std::vector<uint8_t> max(255, 0x01);
    CHECK(encode_frame(0x30, max.data(), max.size(), out) == Status::Ok);
    CHECK(out.size() == 258);
}

TEST_CASE("Decode recovers opcode and payload and ignores padding") {
    WireBytes wire{0x26, 0x05, 0x0c, 0x0c, 0x50, 0x00, 0x00};
    wire.push_back(frame_checksum(0x26, &wire[2], 5));
    wire.resize(20, 0x00);                       // notifications arrive padded

    Frame f;
    REQUIRE(decode_frame(wire, f) == Status::Ok);
    CHECK(f.opcode == 0x26);
    REQUIRE(f.payload.size() == 5);
    CHECK(f.payload[2] == 0x50);
    CHECK(f.checksum == wire[7]);
}

TEST_CASE("Short input is TooShort") {
    Frame f;
    CHECK(decode_frame(nullptr, 0, f) == Status::TooShort);

    const uint8_t two[] = {0x26, 0x00};
    CHECK(decode_frame(two, 2, f) == Status::TooShort);

    // Length says 5, only 3 payload bytes + checksum present.
    const uint8_t cut[] = {0x26, 0x05, 0x0c, 0x0c, 0x50, 0x00};
    CHECK(decode_frame(cut, sizeof cut, f) == Status::TooShort);
}

TEST_CASE("Any single bit flip outside the length byte is a ChecksumMismatch") {
    Payload p;
    for (uint8_t b : {0x32, 0x0c, 0x00, 0x02, 0x15, 0xff, 0xff}) p.push_back(b);
    WireBytes good;
    REQUIRE(encode_frame(0x30, p, good) == Status::Ok);

    for (size_t byte = 0; byte < good.size(); ++byte) {
        if (byte == 1) continue;                 // a length flip changes the frame shape instead
        for (int bit = 0; bit < 8; ++bit) {
            WireBytes bad = good;
            bad[byte] ^= static_cast<uint8_t>(1u << bit);
            Frame f;
            CAPTURE(byte);
            CAPTURE(bit);
            CHECK(decode_frame(bad, f) == Status::ChecksumMismatch);
        }
    }
}

TEST_CASE("Round trip across payload sizes") {
    for (size_t len : {size_t(0), size_t(1), size_t(6), size_t(15), size_t(255)}) {
        std::vector<uint8_t> data(len);
        for (size_t i = 0; i < len; ++i) data[i] = static_cast<uint8_t>(i * 37 + 11);

        WireBytes wire;
        REQUIRE(encode_frame(0x41, data.data(), data.size(), wire) == Status::Ok);
        Frame f;
        REQUIRE(decode_frame(wire, f) == Status::Ok);
        CHECK(f.opcode == 0x41);
        REQUIRE(f.payload.size() == len);
        for (size_t i = 0; i < len; ++i) CHECK(f.payload[i] == data[i]);
    }
}

TEST_CASE("Decode never fails hard on arbitrary bytes") {
    uint32_t seed = 0x1234567u;
    auto rnd = [&seed]() {
        seed = seed * 1103515245u + 12345u;
        return static_cast<uint8_t>(seed >> 16);
    };

    for (int round = 0; round < 2000; ++round) {
        std::vector<uint8_t> junk(rnd() % 40);
        for (auto& b : junk) b = rnd();
        Frame f;
        Status st = decode_frame(junk.data(), junk.size(), f);
        CHECK((st == Status::Ok || st == Status::TooShort || st == Status::ChecksumMismatch));
    }
}

TEST_CASE("Hex text from a GATT tool parses into a frame") {
    WireBytes wire;
    std::string why;
    REQUIRE(parse_hex("26 05 0C 0c 50 00 00 93 00 00", wire, why));
    REQUIRE(wire.size() == 10);
    CHECK(format_hex(wire.data(), 3) == "26 05 0c");

    Frame f;
    REQUIRE(decode_frame(wire, f) == Status::Ok);
    CHECK(f.payload[2] == 0x50);

    CHECK(parse_hex("", wire, why));
    CHECK(wire.empty());

    CHECK_FALSE(parse_hex("26 0", wire, why));
    CHECK(why == "odd_digit_count");
    CHECK(wire.empty());
    CHECK_FALSE(parse_hex("2 6", wire, why));
    CHECK(why == "split_byte");
    CHECK_FALSE(parse_hex("0x26", wire, why));
    CHECK(why == "bad_hex_digit");
}
