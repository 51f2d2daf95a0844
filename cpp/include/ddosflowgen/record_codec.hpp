#ifndef DDOSFLOWGEN_RECORD_CODEC_HPP
#define DDOSFLOWGEN_RECORD_CODEC_HPP

#include "flow_record.hpp"
#include <string>

namespace ddosflowgen {

constexpr char FIELD_DELIMITER = '|';
constexpr size_t FIELD_COUNT = 12;

/**
 * Parse one rwcut line into a FlowRecord
 *
 * Whitespace is trimmed from every field except the TCP flags. Unless the
 * source address is the "sIP" header marker, the start time is parsed as
 * well, so a data line with "sTime" in its start-time column is rejected.
 *
 * @throws ParseError on a wrong field count or an unparsable start time
 */
FlowRecord parse_line(const std::string& line);

/**
 * Format a FlowRecord as a fixed-width rwcut line, including the newline
 */
std::string serialize_line(const FlowRecord& record);

} // namespace ddosflowgen

#endif // DDOSFLOWGEN_RECORD_CODEC_HPP
