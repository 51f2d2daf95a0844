#include "ddosflowgen/record_codec.hpp"
#include "ddosflowgen/errors.hpp"
#include "ddosflowgen/utils.hpp"
#include <sstream>
#include <vector>

namespace ddosflowgen {

// Column widths used by rwcut
constexpr size_t WIDTH_ADDRESS = 39;
constexpr size_t WIDTH_PORT = 5;
constexpr size_t WIDTH_PROTOCOL = 3;
constexpr size_t WIDTH_COUNTER = 10;
constexpr size_t WIDTH_TIMESTAMP = 23;
constexpr size_t WIDTH_DURATION = 9;
constexpr size_t WIDTH_SENSOR = 3;

constexpr size_t FIELD_FLAGS = 7;

static std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(FIELD_DELIMITER, start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

FlowRecord parse_line(const std::string& line) {
    std::string body = line;
    while (!body.empty() && (body.back() == '\n' || body.back() == '\r')) {
        body.pop_back();
    }

    std::vector<std::string> fields = split_fields(body);

    // rwcut terminates every line with a delimiter, leaving an empty last field
    if (fields.size() == FIELD_COUNT + 1 && utils::trim(fields.back()).empty()) {
        fields.pop_back();
    }
    if (fields.size() != FIELD_COUNT) {
        throw ParseError("expected " + std::to_string(FIELD_COUNT) +
                         " fields, got " + std::to_string(fields.size()));
    }

    for (size_t i = 0; i < fields.size(); ++i) {
        if (i == FIELD_FLAGS) {
            continue;  // whitespace is significant in the flags bitmap
        }
        fields[i] = utils::trim(fields[i]);
    }

    FlowRecord record;
    record.source_ip = fields[0];
    record.destination_ip = fields[1];
    record.source_port = fields[2];
    record.destination_port = fields[3];
    record.protocol = fields[4];
    record.packets = fields[5];
    record.bytes = fields[6];
    record.flags = fields[7];
    record.start_time = fields[8];
    record.duration = fields[9];
    record.end_time = fields[10];
    record.sensor = fields[11];

    // A header is recognized by the source address alone; any other line
    // must carry a real start time
    if (!record.is_header()) {
        try {
            record.start_time_ms = utils::parse_timestamp_ms(record.start_time);
        } catch (const std::invalid_argument& e) {
            throw ParseError(e.what());
        }
    }

    return record;
}

std::string serialize_line(const FlowRecord& record) {
    std::ostringstream oss;
    oss << utils::rjust(record.source_ip, WIDTH_ADDRESS) << FIELD_DELIMITER
        << utils::rjust(record.destination_ip, WIDTH_ADDRESS) << FIELD_DELIMITER
        << utils::rjust(record.source_port, WIDTH_PORT) << FIELD_DELIMITER
        << utils::rjust(record.destination_port, WIDTH_PORT) << FIELD_DELIMITER
        << utils::rjust(record.protocol, WIDTH_PROTOCOL) << FIELD_DELIMITER
        << utils::rjust(record.packets, WIDTH_COUNTER) << FIELD_DELIMITER
        << utils::rjust(record.bytes, WIDTH_COUNTER) << FIELD_DELIMITER
        << record.flags << FIELD_DELIMITER
        << utils::rjust(record.start_time, WIDTH_TIMESTAMP) << FIELD_DELIMITER
        << utils::rjust(record.duration, WIDTH_DURATION) << FIELD_DELIMITER
        << utils::rjust(record.end_time, WIDTH_TIMESTAMP) << FIELD_DELIMITER
        << utils::rjust(record.sensor, WIDTH_SENSOR) << FIELD_DELIMITER << "\n";
    return oss.str();
}

} // namespace ddosflowgen
