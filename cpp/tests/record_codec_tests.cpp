#include <catch2/catch.hpp>
#include "ddosflowgen/errors.hpp"
#include "ddosflowgen/record_codec.hpp"
#include "ddosflowgen/utils.hpp"
#include "test_helpers.hpp"

using namespace ddosflowgen;

TEST_CASE("Codec: parse a flow line", "[codec]") {
    FlowRecord record = parse_line(test::sample_line() + "\n");

    CHECK(record.source_ip == "10.1.1.5");
    CHECK(record.destination_ip == "93.184.216.34");
    CHECK(record.source_port == "1234");
    CHECK(record.destination_port == "80");
    CHECK(record.protocol == "6");
    CHECK(record.packets == "3");
    CHECK(record.bytes == "180");
    CHECK(record.flags == " S      ");
    CHECK(record.start_time == "2024/01/01T00:00:00.000");
    CHECK(record.duration == "0.010");
    CHECK(record.end_time == "2024/01/01T00:00:00.010");
    CHECK(record.sensor == "S0");
    CHECK(record.start_time_ms == 1704067200000LL);
    CHECK_FALSE(record.is_header());
}

TEST_CASE("Codec: fields are trimmed except flags", "[codec]") {
    std::string line = "   10.1.1.5|  1.2.3.4| 1234|   80|  6|         3|       180|"
                       " S   A  |2024/01/01T00:00:00.000|    0.010|2024/01/01T00:00:00.010| S0|\r\n";
    FlowRecord record = parse_line(line);

    CHECK(record.source_ip == "10.1.1.5");
    CHECK(record.destination_ip == "1.2.3.4");
    CHECK(record.packets == "3");
    CHECK(record.flags == " S   A  ");
    CHECK(record.sensor == "S0");
}

TEST_CASE("Codec: line without trailing delimiter", "[codec]") {
    std::string line = test::sample_line();
    line.pop_back();
    CHECK(parse_line(line).sensor == "S0");
}

TEST_CASE("Codec: serialize right-justifies to rwcut widths", "[codec]") {
    std::string out = serialize_line(parse_line(test::sample_line()));

    std::string expected =
        utils::rjust("10.1.1.5", 39) + "|" + utils::rjust("93.184.216.34", 39) + "|" +
        " 1234|   80|  6|         3|       180| S      |" +
        "2024/01/01T00:00:00.000|    0.010|2024/01/01T00:00:00.010| S0|\n";
    CHECK(out == expected);

    // Serialized output parses back to the same fields
    FlowRecord again = parse_line(out);
    CHECK(serialize_line(again) == out);
}

TEST_CASE("Codec: header lines are recognized and not timestamp-parsed", "[codec][header]") {
    FlowRecord header = parse_line(test::header_line());

    CHECK(header.is_header());
    CHECK(header.start_time == "sTime");
    CHECK(header.flags == "   flags");
    CHECK(serialize_line(header) == test::header_line() + "\n");
}

TEST_CASE("Codec: malformed lines raise ParseError", "[codec][error]") {
    SECTION("Too few fields") {
        CHECK_THROWS_AS(parse_line("10.1.1.5|1.2.3.4|1234"), ParseError);
    }

    SECTION("Too many fields") {
        CHECK_THROWS_AS(parse_line(test::sample_line() + "extra|"), ParseError);
    }

    SECTION("Empty line") {
        CHECK_THROWS_AS(parse_line(""), ParseError);
    }

    SECTION("Unparsable start time") {
        std::string line = "10.1.1.5|1.2.3.4|1234|80|6|3|180| S      |"
                           "2024-01-01 00:00:00|0.010|2024/01/01T00:00:00.010|S0|";
        CHECK_THROWS_AS(parse_line(line), ParseError);
    }

    SECTION("Start-time header marker on a data line") {
        std::string line = "10.1.1.5|1.2.3.4|1234|80|6|3|180| S      |"
                           "sTime|0.010|2024/01/01T00:00:00.010|S0|";
        CHECK_THROWS_AS(parse_line(line), ParseError);
    }

    SECTION("Out of range date") {
        std::string line = "10.1.1.5|1.2.3.4|1234|80|6|3|180| S      |"
                           "2023/02/29T00:00:00.000|0.010|2023/02/29T00:00:00.010|S0|";
        CHECK_THROWS_AS(parse_line(line), ParseError);
    }
}

TEST_CASE("Timestamps: parse and format", "[codec][time]") {
    CHECK(utils::parse_timestamp_ms("1970/01/01T00:00:00.000") == 0);
    CHECK(utils::parse_timestamp_ms("1970/01/01T00:00:01") == 1000);
    CHECK(utils::parse_timestamp_ms("1970/01/01T00:00:00.5") == 500);
    CHECK(utils::parse_timestamp_ms("1970/01/01T00:00:00.123999") == 123);

    CHECK(utils::format_timestamp_ms(1704067200010LL) == "2024/01/01T00:00:00.010");

    int64_t leap = utils::parse_timestamp_ms("2024/02/29T23:59:59.999");
    CHECK(utils::format_timestamp_ms(leap + 1) == "2024/03/01T00:00:00.000");

    int64_t year_end = utils::parse_timestamp_ms("2023/12/31T23:59:30.000");
    CHECK(utils::format_timestamp_ms(year_end + 55000) == "2024/01/01T00:00:25.000");

    CHECK(utils::format_duration_ms(55000) == "55.000");
    CHECK(utils::format_duration_ms(10) == "0.010");
}
