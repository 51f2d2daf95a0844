#ifndef DDOSFLOWGEN_TESTS_TEST_HELPERS_HPP
#define DDOSFLOWGEN_TESTS_TEST_HELPERS_HPP

#include "ddosflowgen/output_sinks.hpp"
#include "ddosflowgen/topology.hpp"
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace ddosflowgen {
namespace test {

// Example rwcut line used across tests
inline const std::string& sample_line() {
    static const std::string line =
        "10.1.1.5|93.184.216.34|1234|80|6|3|180| S      |"
        "2024/01/01T00:00:00.000|0.010|2024/01/01T00:00:00.010|S0|";
    return line;
}

inline const std::string& header_line() {
    static const std::string line =
        "                                    sIP|                                    dIP|"
        "sPort|dPort|pro|   packets|     bytes|   flags|                  sTime| duration|"
        "                  eTime|sen|";
    return line;
}

/**
 * Two networks: one with a single amplifier and two bots, one victim
 */
inline AttackTopology small_topology() {
    AttackTopology topology;
    topology.vantage_points = {
        VantagePoint("172.16", "A", true, true),
        VantagePoint("172.21", "V", false, false, "172.21.99.99"),
    };
    topology.amplifiers_per_node = 1;
    topology.bots_per_node = 2;
    topology.synthetic_interval = 0;
    topology.probes_enabled = false;
    return topology;
}

/**
 * OutputSinks backed by string streams that stay inspectable
 */
class MemorySinks {
public:
    explicit MemorySinks(const AttackTopology& topology) {
        for (const auto& vp : topology.vantage_points) {
            auto inbound = std::make_unique<std::ostringstream>();
            auto outbound = std::make_unique<std::ostringstream>();
            inbound_[vp.name] = inbound.get();
            outbound_[vp.name] = outbound.get();
            sinks.add(vp.name, std::move(inbound), std::move(outbound));
        }
    }

    std::vector<std::string> lines(const std::string& name, Direction direction) const {
        const auto& streams = direction == Direction::INBOUND ? inbound_ : outbound_;
        std::istringstream in(streams.at(name)->str());
        std::vector<std::string> out;
        std::string line;
        while (std::getline(in, line)) {
            out.push_back(line);
        }
        return out;
    }

    OutputSinks sinks;

private:
    std::map<std::string, std::ostringstream*> inbound_;
    std::map<std::string, std::ostringstream*> outbound_;
};

// Duration field ("55.000") in milliseconds
inline int64_t duration_ms(const std::string& duration) {
    size_t dot = duration.find('.');
    int64_t seconds = std::stoll(duration.substr(0, dot));
    int64_t millis = dot == std::string::npos ? 0 : std::stoll(duration.substr(dot + 1));
    return seconds * 1000 + millis;
}

} // namespace test
} // namespace ddosflowgen

#endif // DDOSFLOWGEN_TESTS_TEST_HELPERS_HPP
