#ifndef DDOSFLOWGEN_SYNTHESIZER_HPP
#define DDOSFLOWGEN_SYNTHESIZER_HPP

#include "address_digest.hpp"
#include "flow_record.hpp"
#include "topology.hpp"
#include <string>
#include <vector>
#include <memory>

namespace ddosflowgen {

enum class AttackClass {
    AMPLIFIER,
    BOT_FLOOD,
    VICTIM_AGGREGATE,
    PROBE
};

std::string attack_class_name(AttackClass attack);

/**
 * Source-port sequence for flooding bots
 *
 * Owned by the orchestrator for one direction pass. Every bot emission,
 * including the ones recomputed for the victim view, consumes one step, so
 * a bot's port at its own network and at the victim need not match.
 */
class BotPortCounter {
public:
    BotPortCounter() : count_(0) {}

    /**
     * 10000 + ((count + d[2] + ... + d[10]) mod 55536), then advance
     */
    uint16_t next_port(const Digest& bot_digest);

    void reset() { count_ = 0; }

    uint64_t count() const { return count_; }

private:
    uint64_t count_;
};

/**
 * A synthetic record and the sink it belongs to
 */
struct SyntheticFlow {
    FlowRecord record;
    std::string vantage_point;
    Direction direction;
    AttackClass attack;
};

/**
 * Inputs shared by all attack generators for one trigger at one vantage point
 */
struct SynthesisContext {
    const FlowRecord& base;        // anonymized real record
    const VantagePoint& vantage_point;
    Direction direction;
    int64_t start_time_ms;         // start of the triggering record
    BotPortCounter& bot_ports;
};

/**
 * Base class for attack traffic generators
 */
class AttackGenerator {
public:
    explicit AttackGenerator(const AttackTopology& topology) : topology_(topology) {}
    virtual ~AttackGenerator() = default;

    /**
     * Whether this generator emits anything for the given view
     */
    virtual bool applies(const VantagePoint& vp, Direction direction) const = 0;

    /**
     * Append synthetic flows for one trigger
     */
    virtual void generate(const SynthesisContext& ctx, std::vector<SyntheticFlow>& out) = 0;

    virtual AttackClass type() const = 0;

protected:
    const AttackTopology& topology_;
};

/**
 * UDP reflectors: queries in, amplified responses out
 */
class AmplifierAttack : public AttackGenerator {
public:
    using AttackGenerator::AttackGenerator;

    bool applies(const VantagePoint& vp, Direction direction) const override;
    void generate(const SynthesisContext& ctx, std::vector<SyntheticFlow>& out) override;
    AttackClass type() const override { return AttackClass::AMPLIFIER; }
};

/**
 * Bots flooding the victim; outbound only, command-and-control is not modeled
 */
class BotFloodAttack : public AttackGenerator {
public:
    using AttackGenerator::AttackGenerator;

    bool applies(const VantagePoint& vp, Direction direction) const override;
    void generate(const SynthesisContext& ctx, std::vector<SyntheticFlow>& out) override;
    AttackClass type() const override { return AttackClass::BOT_FLOOD; }
};

/**
 * Everything the amplifiers and bots of all networks send, as the victim sees it
 */
class VictimAggregation : public AttackGenerator {
public:
    using AttackGenerator::AttackGenerator;

    bool applies(const VantagePoint& vp, Direction direction) const override;
    void generate(const SynthesisContext& ctx, std::vector<SyntheticFlow>& out) override;
    AttackClass type() const override { return AttackClass::VICTIM_AGGREGATE; }
};

/**
 * TCP SYN scans from random sources into the vantage point's network
 */
class ScanningProbes : public AttackGenerator {
public:
    using AttackGenerator::AttackGenerator;

    bool applies(const VantagePoint& vp, Direction direction) const override;
    void generate(const SynthesisContext& ctx, std::vector<SyntheticFlow>& out) override;
    AttackClass type() const override { return AttackClass::PROBE; }
};

/**
 * Runs every applicable attack generator for a trigger
 */
class AttackSynthesizer {
public:
    explicit AttackSynthesizer(const AttackTopology& topology);

    // Non-copyable and non-movable (generators refer to topology_)
    AttackSynthesizer(const AttackSynthesizer&) = delete;
    AttackSynthesizer& operator=(const AttackSynthesizer&) = delete;
    AttackSynthesizer(AttackSynthesizer&&) = delete;
    AttackSynthesizer& operator=(AttackSynthesizer&&) = delete;

    /**
     * Synthetic flows for one real record at one vantage point, in the
     * order amplifiers, bots, victim aggregation, probes
     */
    std::vector<SyntheticFlow> synthesize(const FlowRecord& base,
                                          const VantagePoint& vp,
                                          Direction direction,
                                          BotPortCounter& bot_ports);

    const AttackTopology& topology() const { return topology_; }

private:
    AttackTopology topology_;
    std::vector<std::unique_ptr<AttackGenerator>> generators_;
};

/**
 * Address of amplifier `index` inside a network
 */
std::string amplifier_address(const std::string& prefix, uint32_t index);

/**
 * Digest identifying bot `index` inside a network
 */
Digest bot_digest(const std::string& prefix, uint32_t index);

} // namespace ddosflowgen

#endif // DDOSFLOWGEN_SYNTHESIZER_HPP
