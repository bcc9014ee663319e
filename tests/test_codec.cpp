#include <doctest/doctest.h>
#include "lmreadout/codec.hpp"

#include <string>

using namespace lmreadout;

static std::vector<uint8_t> bytes(const std::string& s) { return {s.begin(), s.end()}; }

TEST_CASE("Readout board request frame") {
    ReadoutBoardCodec c;
    CHECK(c.encode_read_request(3) == bytes("r 3 1\n"));
    CHECK(c.encode_read_request(6) == bytes("r 6 1\n"));
    CHECK(ReadoutBoardCodec::make_command("getmode") == bytes("getmode\n"));
}

TEST_CASE("Readout board channel range") {
    ReadoutBoardCodec c;
    CHECK_FALSE(c.has_channel(0));
    CHECK(c.has_channel(1));
    CHECK(c.has_channel(6));
    CHECK_FALSE(c.has_channel(7));
}

TEST_CASE("Readout board decodes a terminated number") {
    ReadoutBoardCodec c;
    auto r = c.decode_response(bytes("123.456\n"));
    REQUIRE(r.ok());
    CHECK(r.value == doctest::Approx(123.456));

    r = c.decode_response(bytes("  -1.5e2 \r\n"));
    REQUIRE(r.ok());
    CHECK(r.value == doctest::Approx(-150.0));

    r = c.decode_response(bytes("42\nleftover"));   // only the first line counts
    REQUIRE(r.ok());
    CHECK(r.value == doctest::Approx(42.0));

    r = c.decode_response(bytes("42\n7"));
    REQUIRE(r.ok());
    CHECK(r.value == doctest::Approx(42.0));
}

TEST_CASE("Readout board ignores whatever follows the value line") {
    ReadoutBoardCodec c;
    CHECK(c.decode_response(bytes("12.5\r\n")).ok());
    CHECK(c.decode_response(bytes("12.5\r\n>")).ok());
    auto r = c.decode_response(bytes("12.5\r\nOK\r\n"));
    REQUIRE(r.ok());
    CHECK(r.value == doctest::Approx(12.5));
    CHECK(c.decode_response(bytes("1x.5\r\nOK")).status == DecodeStatus::Malformed);
}

TEST_CASE("Readout board: partial and empty responses are incomplete") {
    ReadoutBoardCodec c;
    CHECK(c.decode_response({}).status == DecodeStatus::Incomplete);
    CHECK(c.decode_response(bytes("12.3")).status == DecodeStatus::Incomplete);
    CHECK(c.decode_response(bytes("  ")).status == DecodeStatus::Incomplete);
}

TEST_CASE("Readout board rejects malformed responses") {
    ReadoutBoardCodec c;
    CHECK(c.decode_response(bytes("r 1 1\n")).status == DecodeStatus::Malformed);   // echo
    CHECK(c.decode_response(bytes("\n")).status == DecodeStatus::Malformed);
    CHECK(c.decode_response(bytes("1.2.3\n")).status == DecodeStatus::Malformed);
    CHECK(c.decode_response(bytes("12 34\n")).status == DecodeStatus::Malformed);
    CHECK(c.decode_response(bytes("e5\n")).status == DecodeStatus::Malformed);
    CHECK(c.decode_response(bytes("1e999\n")).status == DecodeStatus::Malformed);
    CHECK(c.decode_response(bytes("\xff\x00")).status == DecodeStatus::Malformed);
}

TEST_CASE("UTI request is a bare trigger") {
    SmartecUtiCodec c;
    CHECK(c.encode_read_request(1) == bytes("m"));
    CHECK(c.has_channel(1));
    CHECK_FALSE(c.has_channel(2));
}

TEST_CASE("UTI decodes the capacitance ratio from hex period counts") {
    SmartecUtiCodec c;
    // Toff=0x100, Tref=0x500, Tx=0x300 -> (0x200)/(0x400) = 0.5
    auto r = c.decode_response(bytes("100 500 300\r\n"));
    REQUIRE(r.ok());
    CHECK(r.value == doctest::Approx(0.5));

    r = c.decode_response(bytes("0A 1a 12 ff ff\r\n"));
    REQUIRE(r.ok());
    CHECK(r.value == doctest::Approx(0.5));
}

TEST_CASE("UTI incomplete and malformed frames") {
    SmartecUtiCodec c;
    CHECK(c.decode_response({}).status == DecodeStatus::Incomplete);
    CHECK(c.decode_response(bytes("100 500")).status == DecodeStatus::Incomplete);
    CHECK(c.decode_response(bytes("100 500\r\n")).status == DecodeStatus::Malformed);
    CHECK(c.decode_response(bytes("100 100 300\r\n")).status == DecodeStatus::Malformed);
    CHECK(c.decode_response(bytes("100 50g 300\r\n")).status == DecodeStatus::Malformed);
    CHECK(c.decode_response(bytes("123456789 1 2\r\n")).status == DecodeStatus::Malformed);
    CHECK(c.decode_response(bytes("1 2 3 4 5 6\r\n")).status == DecodeStatus::Malformed);
}

TEST_CASE("Decode status tokens") {
    CHECK(std::string(to_string(DecodeStatus::Ok)) == "ok");
    CHECK(std::string(to_string(DecodeStatus::Incomplete)) == "incomplete");
    CHECK(std::string(to_string(DecodeStatus::Malformed)) == "malformed");
}
