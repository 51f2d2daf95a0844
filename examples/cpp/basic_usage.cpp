/**
 * ddosflowgen C++ Example
 *
 * Demonstrates:
 * - Parsing an rwcut line
 * - Rewriting its addresses for every vantage point of a topology
 * - Synthesizing the attack traffic one trigger adds to each view
 *
 * Usage: basic_usage [rwcut line]
 */

#include <ddosflowgen/anonymizer.hpp>
#include <ddosflowgen/record_codec.hpp>
#include <ddosflowgen/synthesizer.hpp>
#include <ddosflowgen/topology.hpp>
#include <ddosflowgen/utils.hpp>
#include <iostream>

using namespace ddosflowgen;

int main(int argc, char* argv[]) {
    std::string line = "10.1.1.5|93.184.216.34|1234|80|6|3|180| S      |"
                       "2024/01/01T00:00:00.000|0.010|2024/01/01T00:00:00.010|S0|";
    if (argc > 1) {
        line = argv[1];
    }

    // Fixed seed so the jittered counters repeat between runs
    utils::Random::instance().seed(42);

    try {
        AttackTopology topology = topologies::mixed_big();
        topology.probes_per_trigger = 1;

        AttackSynthesizer synthesizer(topology);
        FlowRecord parsed = parse_line(line);

        for (Direction direction : {Direction::INBOUND, Direction::OUTBOUND}) {
            BotPortCounter bot_ports;
            std::cout << "=== " << direction_name(direction) << " ===\n";

            for (const auto& vp : topology.vantage_points) {
                FlowRecord rewritten = rewrite_addresses(parsed, direction, vp);
                std::cout << "[" << vp.name << "] real\n" << serialize_line(rewritten);

                for (const auto& flow : synthesizer.synthesize(rewritten, vp, direction, bot_ports)) {
                    std::cout << "[" << flow.vantage_point << "] "
                              << attack_class_name(flow.attack) << "\n"
                              << serialize_line(flow.record);
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
