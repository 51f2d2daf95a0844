#ifndef DDOSFLOWGEN_FLOW_RECORD_HPP
#define DDOSFLOWGEN_FLOW_RECORD_HPP

#include <string>
#include <cstdint>

namespace ddosflowgen {

// Marker rwcut writes in the source-address column of the header line
constexpr const char* HEADER_SOURCE_IP = "sIP";

// Flags value for records where TCP flags are not relevant
constexpr const char* FLAGS_NONE = "        ";
constexpr const char* FLAGS_SYN_ONLY = " S      ";

constexpr uint8_t PROTO_TCP = 6;
constexpr uint8_t PROTO_UDP = 17;

/**
 * Traffic direction relative to the vantage point
 */
enum class Direction {
    INBOUND,
    OUTBOUND
};

std::string direction_name(Direction direction);

/**
 * SiLK rwcut flow record
 *
 * Fields are kept as the text that is written out, so header lines pass
 * through untouched. start_time_ms is the parsed start time and is only
 * meaningful when is_header() is false.
 */
struct FlowRecord {
    std::string source_ip;
    std::string destination_ip;
    std::string source_port;
    std::string destination_port;
    std::string protocol;
    std::string packets;
    std::string bytes;
    std::string flags;       // fixed 8-character bitmap, never trimmed
    std::string start_time;  // YYYY/MM/DDTHH:MM:SS.mmm
    std::string duration;    // seconds, 3 decimals
    std::string end_time;
    std::string sensor;

    int64_t start_time_ms = 0;  // milliseconds since Unix epoch (UTC)

    /**
     * Header lines carry the "sIP" marker instead of an address
     */
    bool is_header() const { return source_ip == HEADER_SOURCE_IP; }

    /**
     * Set start, duration and end from a start time and a duration
     */
    void set_timing(int64_t start_ms, uint64_t duration_ms);

    /**
     * Short human-readable form for diagnostics
     */
    std::string to_string() const;
};

} // namespace ddosflowgen

#endif // DDOSFLOWGEN_FLOW_RECORD_HPP
