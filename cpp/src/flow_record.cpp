#include "ddosflowgen/flow_record.hpp"
#include "ddosflowgen/utils.hpp"
#include <sstream>

namespace ddosflowgen {

std::string direction_name(Direction direction) {
    return direction == Direction::INBOUND ? "inbound" : "outbound";
}

void FlowRecord::set_timing(int64_t start_ms, uint64_t duration_ms) {
    int64_t end_ms = start_ms + static_cast<int64_t>(duration_ms);
    start_time_ms = start_ms;
    start_time = utils::format_timestamp_ms(start_ms);
    duration = utils::format_duration_ms(duration_ms);
    end_time = utils::format_timestamp_ms(end_ms);
}

std::string FlowRecord::to_string() const {
    std::ostringstream oss;
    oss << source_ip << ":" << source_port
        << " -> " << destination_ip << ":" << destination_port
        << " proto=" << protocol
        << " pkts=" << packets
        << " bytes=" << bytes
        << " start=" << start_time;
    return oss.str();
}

} // namespace ddosflowgen
