#include "ddosflowgen/anonymizer.hpp"
#include "ddosflowgen/address_digest.hpp"
#include "ddosflowgen/utils.hpp"
#include <stdexcept>

namespace ddosflowgen {

std::string anonymize_internal(const std::string& address, const VantagePoint& vp) {
    return host_in_prefix(vp.prefix, digest(address));
}

std::string anonymize_external(const std::string& address, const VantagePoint& vp) {
    Digest d = digest(address + vp.name);

    // Slide over the digest until four consecutive bytes are usable
    for (size_t pos = 0; pos + 4 <= d.size(); ++pos) {
        bool usable = true;
        for (size_t i = pos; i < pos + 4; ++i) {
            if (utils::is_reserved_first_octet(d[i])) {
                usable = false;
                break;
            }
        }
        if (usable) {
            return std::to_string(d[pos]) + "." + std::to_string(d[pos + 1]) + "." +
                   std::to_string(d[pos + 2]) + "." + std::to_string(d[pos + 3]);
        }
    }

    throw std::logic_error("Digest exhausted while remapping " + address +
                           " for vantage point " + vp.name);
}

FlowRecord rewrite_addresses(const FlowRecord& record, Direction direction,
                             const VantagePoint& vp) {
    FlowRecord out = record;
    if (record.is_header()) {
        return out;
    }

    if (direction == Direction::INBOUND) {
        out.destination_ip = anonymize_internal(record.destination_ip, vp);
        out.source_ip = anonymize_external(record.source_ip, vp);
    } else {
        out.source_ip = anonymize_internal(record.source_ip, vp);
        out.destination_ip = anonymize_external(record.destination_ip, vp);
    }
    return out;
}

} // namespace ddosflowgen
