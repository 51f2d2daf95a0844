#include "ddosflowgen/topology.hpp"
#include "ddosflowgen/errors.hpp"
#include "ddosflowgen/utils.hpp"
#include <set>

namespace ddosflowgen {

bool AttackTopology::validate(std::string* error) const {
    if (vantage_points.empty()) {
        if (error) *error = "Topology must define at least one vantage point";
        return false;
    }

    std::set<std::string> names;
    std::set<std::string> prefixes;
    const VantagePoint* victim_node = nullptr;

    for (const auto& vp : vantage_points) {
        if (vp.name.empty()) {
            if (error) *error = "Vantage point name cannot be empty";
            return false;
        }
        if (!names.insert(vp.name).second) {
            if (error) *error = "Duplicate vantage point name: " + vp.name;
            return false;
        }
        if (!utils::is_two_octet_prefix(vp.prefix)) {
            if (error) *error = "Invalid network prefix for " + vp.name + ": '" + vp.prefix + "'";
            return false;
        }
        if (!prefixes.insert(vp.prefix).second) {
            if (error) *error = "Duplicate network prefix: " + vp.prefix;
            return false;
        }

        if (!vp.is_victim()) {
            continue;
        }
        if (vp.has_amplifiers || vp.has_bots) {
            if (error) *error = "Error in topology: victim should not contain attackers (" + vp.name + ")";
            return false;
        }
        if (victim_node) {
            if (error) *error = "Only one vantage point may declare a victim, found " +
                                victim_node->name + " and " + vp.name;
            return false;
        }
        try {
            utils::ip_str_to_uint32(vp.victim_ip);
        } catch (const std::exception& e) {
            if (error) *error = "Invalid victim address for " + vp.name + ": " + e.what();
            return false;
        }
        victim_node = &vp;
    }

    if (has_attackers() && !victim_node) {
        if (error) *error = "Topology has amplifiers or bots but no victim";
        return false;
    }

    return true;
}

void AttackTopology::validate_or_throw() const {
    std::string error;
    if (!validate(&error)) {
        throw ConfigurationError(error);
    }
}

const VantagePoint* AttackTopology::victim() const {
    for (const auto& vp : vantage_points) {
        if (vp.is_victim()) {
            return &vp;
        }
    }
    return nullptr;
}

bool AttackTopology::has_attackers() const {
    for (const auto& vp : vantage_points) {
        if (vp.has_amplifiers || vp.has_bots) {
            return true;
        }
    }
    return false;
}

namespace topologies {

AttackTopology mixed_big() {
    AttackTopology topology;

    // VantagePoint(prefix, name, has_amplifiers, has_bots, victim_ip)
    topology.vantage_points = {
        VantagePoint("172.16", "A", true,  true),
        VantagePoint("172.17", "B", true,  false),
        VantagePoint("172.18", "C", false, true),
        VantagePoint("172.19", "D", false, true),
        VantagePoint("172.20", "E", true,  false),
        VantagePoint("172.21", "F", false, false, "172.21.99.99"),
    };

    topology.amplifiers_per_node = 5;
    topology.bots_per_node = 10;
    topology.synthetic_interval = 5;

    topology.probes_enabled = true;
    topology.probes_duration_s = 5;
    topology.probes_per_trigger = 5;
    topology.probes_dst_port = 2323;

    topology.reflect_service_port = 123;
    topology.reflect_client_port = 80;
    topology.reflect_input_packets_per_flow = 1;
    topology.reflect_input_bytes_per_flow = 200;
    topology.reflect_output_packets_per_flow = 300;
    topology.reflect_output_bytes_per_flow = 200000;

    topology.bot_dst_port = 53;
    topology.bot_output_packets_per_flow = 20;
    topology.bot_output_bytes_per_flow = 6000;

    topology.flow_duration_s = 55;
    return topology;
}

AttackTopology by_name(const std::string& name) {
    if (name == "mixed_big") {
        return mixed_big();
    }
    throw ConfigurationError("Unknown topology: " + name + " (valid: mixed_big)");
}

std::vector<std::string> names() {
    return {"mixed_big"};
}

} // namespace topologies

} // namespace ddosflowgen
