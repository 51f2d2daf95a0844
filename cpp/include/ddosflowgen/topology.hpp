#ifndef DDOSFLOWGEN_TOPOLOGY_HPP
#define DDOSFLOWGEN_TOPOLOGY_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace ddosflowgen {

/**
 * One observation point in the scenario
 *
 * Owns a two-octet network prefix such as "172.16". Only one vantage point
 * in a topology may hold the victim, and it may not hold attackers.
 */
struct VantagePoint {
    std::string prefix;
    std::string name;
    bool has_amplifiers = false;
    bool has_bots = false;
    std::string victim_ip;  // empty if this is not the victim network

    VantagePoint() = default;

    VantagePoint(const std::string& net_prefix, const std::string& node_name,
                 bool amplifiers, bool bots, const std::string& victim = "")
        : prefix(net_prefix), name(node_name),
          has_amplifiers(amplifiers), has_bots(bots), victim_ip(victim) {}

    bool is_victim() const { return !victim_ip.empty(); }
};

/**
 * Scenario definition: vantage points plus attack parameters
 *
 * Pure configuration, never mutated by the generator.
 */
struct AttackTopology {
    std::vector<VantagePoint> vantage_points;

    // Each network contains this many amplifiers or bots
    uint32_t amplifiers_per_node = 5;
    uint32_t bots_per_node = 10;

    // Noise records between two synthesis triggers (0 = most synthetic traffic)
    uint64_t synthetic_interval = 5;

    // Scanning bots: random sources probing every network, no response
    bool probes_enabled = true;
    uint32_t probes_duration_s = 5;
    uint32_t probes_per_trigger = 5;
    uint16_t probes_dst_port = 2323;

    // UDP reflection-amplification flows
    uint16_t reflect_service_port = 123;
    uint16_t reflect_client_port = 80;
    uint64_t reflect_input_packets_per_flow = 1;
    uint64_t reflect_input_bytes_per_flow = 200;
    uint64_t reflect_output_packets_per_flow = 300;
    uint64_t reflect_output_bytes_per_flow = 200000;

    // UDP floods emitted by bots; only their outputs are seen
    uint16_t bot_dst_port = 53;
    uint64_t bot_output_packets_per_flow = 20;
    uint64_t bot_output_bytes_per_flow = 6000;

    // Relates to the router NetFlow active timeout
    uint32_t flow_duration_s = 55;

    /**
     * Validate topology
     */
    bool validate(std::string* error = nullptr) const;

    /**
     * Validate and throw ConfigurationError on failure
     */
    void validate_or_throw() const;

    /**
     * The victim vantage point, or nullptr if none is declared
     */
    const VantagePoint* victim() const;

    bool has_attackers() const;
};

namespace topologies {

/**
 * Six-network scenario with amplifiers, bots, probes and one victim
 */
AttackTopology mixed_big();

/**
 * Look up a built-in topology
 *
 * @throws ConfigurationError for an unknown name
 */
AttackTopology by_name(const std::string& name);

/**
 * Names accepted by by_name()
 */
std::vector<std::string> names();

} // namespace topologies

} // namespace ddosflowgen

#endif // DDOSFLOWGEN_TOPOLOGY_HPP
