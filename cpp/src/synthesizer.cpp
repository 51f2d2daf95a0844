#include "ddosflowgen/synthesizer.hpp"
#include "ddosflowgen/utils.hpp"
#include <stdexcept>

namespace ddosflowgen {

// Spacing between synthetic flows of one trigger, so they do not collide
constexpr int64_t ATTACK_STEP_MS = 10;
constexpr int64_t PROBE_STEP_MS = 15;

constexpr uint32_t BOT_PORT_BASE = 10000;
constexpr uint32_t BOT_PORT_RANGE = 55536;

constexpr int EPHEMERAL_PORT_MIN = 49152;
constexpr int EPHEMERAL_PORT_MAX = 65535;

// Bytes per probe packet
constexpr uint64_t PROBE_PACKET_BYTES = 64;

std::string attack_class_name(AttackClass attack) {
    switch (attack) {
    case AttackClass::AMPLIFIER:
        return "amplifier";
    case AttackClass::BOT_FLOOD:
        return "bot_flood";
    case AttackClass::VICTIM_AGGREGATE:
        return "victim_aggregate";
    case AttackClass::PROBE:
        return "probe";
    default:
        return "unknown";
    }
}

uint16_t BotPortCounter::next_port(const Digest& bot_digest) {
    uint64_t current = count_;
    for (size_t i = 2; i <= 10; ++i) {
        current += bot_digest[i];
    }
    ++count_;
    return static_cast<uint16_t>(BOT_PORT_BASE + (current % BOT_PORT_RANGE));
}

std::string amplifier_address(const std::string& prefix, uint32_t index) {
    return host_in_prefix(prefix, digest(prefix + std::to_string(index)));
}

Digest bot_digest(const std::string& prefix, uint32_t index) {
    return digest(prefix + std::to_string(index) + "bot");
}

static const std::string& victim_ip(const AttackTopology& topology) {
    const VantagePoint* victim = topology.victim();
    if (!victim) {
        throw std::logic_error("Attack traffic requested but topology has no victim");
    }
    return victim->victim_ip;
}

// UDP flow common to amplifiers and bots, timed relative to the trigger
static FlowRecord attack_template(const FlowRecord& base, const AttackTopology& topology,
                                  int64_t start_time_ms, uint32_t index) {
    FlowRecord synth = base;
    synth.set_timing(start_time_ms + ATTACK_STEP_MS * (1 + index),
                     static_cast<uint64_t>(topology.flow_duration_s) * 1000);
    synth.protocol = std::to_string(PROTO_UDP);
    synth.flags = FLAGS_NONE;
    return synth;
}

// Amplified response leaving amplifier `index` of `prefix` towards the victim
static FlowRecord amplifier_response(const FlowRecord& base, const AttackTopology& topology,
                                     const std::string& prefix, int64_t start_time_ms,
                                     uint32_t index) {
    FlowRecord synth = attack_template(base, topology, start_time_ms, index);
    synth.source_ip = amplifier_address(prefix, index);
    synth.destination_ip = victim_ip(topology);
    synth.source_port = std::to_string(topology.reflect_service_port);
    synth.destination_port = std::to_string(topology.reflect_client_port);
    synth.packets = std::to_string(utils::jittered(topology.reflect_output_packets_per_flow));
    synth.bytes = std::to_string(utils::jittered(topology.reflect_output_bytes_per_flow));
    return synth;
}

// Flood from bot `index` of `prefix` towards the victim
static FlowRecord bot_flood(const FlowRecord& base, const AttackTopology& topology,
                            const std::string& prefix, int64_t start_time_ms,
                            uint32_t index, BotPortCounter& bot_ports) {
    Digest d = bot_digest(prefix, index);
    FlowRecord synth = attack_template(base, topology, start_time_ms, index);
    synth.source_ip = host_in_prefix(prefix, d);
    synth.destination_ip = victim_ip(topology);
    synth.source_port = std::to_string(bot_ports.next_port(d));
    synth.destination_port = std::to_string(topology.bot_dst_port);
    synth.packets = std::to_string(utils::jittered(topology.bot_output_packets_per_flow));
    synth.bytes = std::to_string(utils::jittered(topology.bot_output_bytes_per_flow));
    return synth;
}

// Amplifier reflection
bool AmplifierAttack::applies(const VantagePoint& vp, Direction) const {
    return vp.has_amplifiers;
}

void AmplifierAttack::generate(const SynthesisContext& ctx, std::vector<SyntheticFlow>& out) {
    const std::string& prefix = ctx.vantage_point.prefix;

    for (uint32_t ampid = 0; ampid < topology_.amplifiers_per_node; ++ampid) {
        FlowRecord synth;
        if (ctx.direction == Direction::INBOUND) {
            // Spoofed query from the victim into the amplifier
            synth = attack_template(ctx.base, topology_, ctx.start_time_ms, ampid);
            synth.source_ip = victim_ip(topology_);
            synth.destination_ip = amplifier_address(prefix, ampid);
            synth.source_port = std::to_string(topology_.reflect_client_port);
            synth.destination_port = std::to_string(topology_.reflect_service_port);
            synth.packets = std::to_string(utils::jittered(topology_.reflect_input_packets_per_flow));
            synth.bytes = std::to_string(utils::jittered(topology_.reflect_input_bytes_per_flow));
        } else {
            synth = amplifier_response(ctx.base, topology_, prefix, ctx.start_time_ms, ampid);
        }
        out.push_back({synth, ctx.vantage_point.name, ctx.direction, type()});
    }
}

// Bot flooding
bool BotFloodAttack::applies(const VantagePoint& vp, Direction direction) const {
    return vp.has_bots && direction == Direction::OUTBOUND;
}

void BotFloodAttack::generate(const SynthesisContext& ctx, std::vector<SyntheticFlow>& out) {
    for (uint32_t botid = 0; botid < topology_.bots_per_node; ++botid) {
        FlowRecord synth = bot_flood(ctx.base, topology_, ctx.vantage_point.prefix,
                                     ctx.start_time_ms, botid, ctx.bot_ports);
        out.push_back({synth, ctx.vantage_point.name, ctx.direction, type()});
    }
}

// Victim aggregation
bool VictimAggregation::applies(const VantagePoint& vp, Direction direction) const {
    return vp.is_victim() && direction == Direction::INBOUND;
}

void VictimAggregation::generate(const SynthesisContext& ctx, std::vector<SyntheticFlow>& out) {
    // All amplifiers first, then all bots, in topology order
    for (const auto& ampnode : topology_.vantage_points) {
        if (!ampnode.has_amplifiers) {
            continue;
        }
        for (uint32_t ampid = 0; ampid < topology_.amplifiers_per_node; ++ampid) {
            FlowRecord synth = amplifier_response(ctx.base, topology_, ampnode.prefix,
                                                  ctx.start_time_ms, ampid);
            out.push_back({synth, ctx.vantage_point.name, Direction::INBOUND, type()});
        }
    }

    for (const auto& botnode : topology_.vantage_points) {
        if (!botnode.has_bots) {
            continue;
        }
        for (uint32_t botid = 0; botid < topology_.bots_per_node; ++botid) {
            FlowRecord synth = bot_flood(ctx.base, topology_, botnode.prefix,
                                         ctx.start_time_ms, botid, ctx.bot_ports);
            out.push_back({synth, ctx.vantage_point.name, Direction::INBOUND, type()});
        }
    }
}

// Scanning probes
bool ScanningProbes::applies(const VantagePoint&, Direction direction) const {
    return topology_.probes_enabled && direction == Direction::INBOUND;
}

void ScanningProbes::generate(const SynthesisContext& ctx, std::vector<SyntheticFlow>& out) {
    auto& rng = utils::Random::instance();
    uint64_t duration_s = topology_.probes_duration_s;

    for (uint32_t probe = 0; probe < topology_.probes_per_trigger; ++probe) {
        FlowRecord synth = ctx.base;
        synth.set_timing(ctx.start_time_ms + PROBE_STEP_MS * (1 + probe), duration_s * 1000);
        synth.protocol = std::to_string(PROTO_TCP);
        synth.flags = FLAGS_SYN_ONLY;
        synth.source_ip = utils::random_ipv4_avoiding();
        synth.destination_ip = utils::random_ipv4_avoiding(ctx.vantage_point.prefix);
        synth.source_port = std::to_string(rng.randint(EPHEMERAL_PORT_MIN, EPHEMERAL_PORT_MAX));
        synth.destination_port = std::to_string(topology_.probes_dst_port);
        synth.packets = std::to_string(1 + duration_s);
        synth.bytes = std::to_string(PROBE_PACKET_BYTES * (1 + duration_s));
        out.push_back({synth, ctx.vantage_point.name, ctx.direction, type()});
    }
}

// AttackSynthesizer implementation
AttackSynthesizer::AttackSynthesizer(const AttackTopology& topology)
    : topology_(topology) {
    topology_.validate_or_throw();

    generators_.push_back(std::make_unique<AmplifierAttack>(topology_));
    generators_.push_back(std::make_unique<BotFloodAttack>(topology_));
    generators_.push_back(std::make_unique<VictimAggregation>(topology_));
    generators_.push_back(std::make_unique<ScanningProbes>(topology_));
}

std::vector<SyntheticFlow> AttackSynthesizer::synthesize(const FlowRecord& base,
                                                         const VantagePoint& vp,
                                                         Direction direction,
                                                         BotPortCounter& bot_ports) {
    std::vector<SyntheticFlow> flows;
    if (base.is_header()) {
        return flows;
    }

    SynthesisContext ctx{base, vp, direction, base.start_time_ms, bot_ports};
    for (auto& generator : generators_) {
        if (generator->applies(vp, direction)) {
            generator->generate(ctx, flows);
        }
    }
    return flows;
}

} // namespace ddosflowgen
