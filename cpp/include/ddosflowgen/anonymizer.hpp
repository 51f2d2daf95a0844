#ifndef DDOSFLOWGEN_ANONYMIZER_HPP
#define DDOSFLOWGEN_ANONYMIZER_HPP

#include "flow_record.hpp"
#include "topology.hpp"
#include <string>

namespace ddosflowgen {

/**
 * Reallocate an internal address under the vantage point's own network
 *
 * Depends only on the original address and the prefix, so a host keeps
 * the same address in inbound and outbound views.
 */
std::string anonymize_internal(const std::string& address, const VantagePoint& vp);

/**
 * Remap an external address for one vantage point
 *
 * Hashes the address together with the vantage point name; every vantage
 * point sees a different, stable address whose octets avoid the reserved
 * first-octet set.
 *
 * @throws std::logic_error if no usable window exists in the digest
 */
std::string anonymize_external(const std::string& address, const VantagePoint& vp);

/**
 * Rewrite both addresses of a record for one view
 *
 * Inbound: the destination is internal. Outbound: the source is internal.
 * Header records are returned unchanged.
 */
FlowRecord rewrite_addresses(const FlowRecord& record, Direction direction,
                             const VantagePoint& vp);

} // namespace ddosflowgen

#endif // DDOSFLOWGEN_ANONYMIZER_HPP
