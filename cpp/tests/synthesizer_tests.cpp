#include <catch2/catch.hpp>
#include "ddosflowgen/anonymizer.hpp"
#include "ddosflowgen/errors.hpp"
#include "ddosflowgen/record_codec.hpp"
#include "ddosflowgen/synthesizer.hpp"
#include "ddosflowgen/utils.hpp"
#include "test_helpers.hpp"
#include <set>

using namespace ddosflowgen;

static std::vector<SyntheticFlow> of_class(const std::vector<SyntheticFlow>& flows, AttackClass attack) {
    std::vector<SyntheticFlow> out;
    for (const auto& flow : flows) {
        if (flow.attack == attack) {
            out.push_back(flow);
        }
    }
    return out;
}

static void check_timing(const FlowRecord& record) {
    int64_t start = utils::parse_timestamp_ms(record.start_time);
    int64_t end = utils::parse_timestamp_ms(record.end_time);
    CHECK(end - start == test::duration_ms(record.duration));
    CHECK(record.start_time_ms == start);
}

TEST_CASE("Bot port counter", "[synthesizer][bots]") {
    BotPortCounter counter;
    Digest d = bot_digest("172.16", 0);

    CHECK(counter.next_port(d) == 11108);
    CHECK(counter.next_port(d) == 11109);
    CHECK(counter.count() == 2);

    counter.reset();
    CHECK(counter.next_port(d) == 11108);
}

TEST_CASE("Amplifier reflection", "[synthesizer][amplifiers]") {
    AttackTopology topology = test::small_topology();
    topology.bots_per_node = 0;
    AttackSynthesizer synthesizer(topology);
    const VantagePoint& a = topology.vantage_points[0];
    BotPortCounter bot_ports;

    FlowRecord base = parse_line(test::sample_line());

    SECTION("Inbound: query from the victim into the amplifier") {
        FlowRecord rewritten = rewrite_addresses(base, Direction::INBOUND, a);
        auto flows = synthesizer.synthesize(rewritten, a, Direction::INBOUND, bot_ports);

        REQUIRE(flows.size() == 1);
        const FlowRecord& r = flows[0].record;
        CHECK(flows[0].attack == AttackClass::AMPLIFIER);
        CHECK(flows[0].vantage_point == "A");
        CHECK(flows[0].direction == Direction::INBOUND);
        CHECK(r.protocol == "17");
        CHECK(r.source_ip == "172.21.99.99");
        CHECK(r.destination_ip == "172.16.10.13");
        CHECK(r.source_port == "80");
        CHECK(r.destination_port == "123");
        CHECK(r.flags == "        ");
        CHECK(r.sensor == "S0");
        CHECK(r.start_time == "2024/01/01T00:00:00.010");
        CHECK(r.duration == "55.000");
        CHECK(r.end_time == "2024/01/01T00:00:55.010");

        uint64_t packets = std::stoull(r.packets);
        uint64_t bytes = std::stoull(r.bytes);
        CHECK(packets >= 1);
        CHECK(packets <= 2);
        CHECK(bytes >= 200);
        CHECK(bytes <= 400);
    }

    SECTION("Outbound: amplified response to the victim") {
        FlowRecord rewritten = rewrite_addresses(base, Direction::OUTBOUND, a);
        auto flows = synthesizer.synthesize(rewritten, a, Direction::OUTBOUND, bot_ports);

        REQUIRE(flows.size() == 1);
        const FlowRecord& r = flows[0].record;
        CHECK(r.source_ip == "172.16.10.13");
        CHECK(r.destination_ip == "172.21.99.99");
        CHECK(r.source_port == "123");
        CHECK(r.destination_port == "80");

        uint64_t packets = std::stoull(r.packets);
        uint64_t bytes = std::stoull(r.bytes);
        CHECK(packets >= 300);
        CHECK(packets <= 600);
        CHECK(bytes >= 200000);
        CHECK(bytes <= 400000);
    }

    SECTION("Distinct amplifiers are spaced 10ms apart") {
        topology.amplifiers_per_node = 3;
        AttackSynthesizer three(topology);
        auto flows = three.synthesize(base, a, Direction::OUTBOUND, bot_ports);

        REQUIRE(flows.size() == 3);
        CHECK(flows[0].record.start_time == "2024/01/01T00:00:00.010");
        CHECK(flows[1].record.start_time == "2024/01/01T00:00:00.020");
        CHECK(flows[2].record.start_time == "2024/01/01T00:00:00.030");
        // md5("172.161") starts with 174, 39
        CHECK(flows[1].record.source_ip == "172.16.174.39");
        for (const auto& flow : flows) {
            check_timing(flow.record);
        }
    }
}

TEST_CASE("Bot flooding", "[synthesizer][bots]") {
    AttackTopology topology = test::small_topology();
    topology.vantage_points[0].has_amplifiers = false;
    AttackSynthesizer synthesizer(topology);
    const VantagePoint& a = topology.vantage_points[0];
    FlowRecord base = parse_line(test::sample_line());

    SECTION("Outbound: one flood per bot") {
        BotPortCounter bot_ports;
        auto flows = synthesizer.synthesize(rewrite_addresses(base, Direction::OUTBOUND, a),
                                            a, Direction::OUTBOUND, bot_ports);

        REQUIRE(flows.size() == 2);
        CHECK(flows[0].record.source_ip == "172.16.224.103");
        CHECK(flows[1].record.source_ip == "172.16.97.67");
        CHECK(flows[0].record.source_port == "11108");
        CHECK(flows[1].record.source_port == "10985");
        for (const auto& flow : flows) {
            CHECK(flow.attack == AttackClass::BOT_FLOOD);
            CHECK(flow.record.protocol == "17");
            CHECK(flow.record.destination_ip == "172.21.99.99");
            CHECK(flow.record.destination_port == "53");
            uint64_t packets = std::stoull(flow.record.packets);
            CHECK(packets >= 20);
            CHECK(packets <= 40);
            check_timing(flow.record);
        }
        CHECK(bot_ports.count() == 2);
    }

    SECTION("Inbound: nothing is modeled") {
        BotPortCounter bot_ports;
        auto flows = synthesizer.synthesize(base, a, Direction::INBOUND, bot_ports);
        CHECK(flows.empty());
        CHECK(bot_ports.count() == 0);
    }
}

TEST_CASE("Victim aggregation", "[synthesizer][victim]") {
    AttackTopology topology = topologies::mixed_big();
    topology.probes_enabled = false;
    AttackSynthesizer synthesizer(topology);
    const VantagePoint& victim = topology.vantage_points[5];
    REQUIRE(victim.is_victim());

    FlowRecord base = rewrite_addresses(parse_line(test::sample_line()), Direction::INBOUND, victim);
    BotPortCounter bot_ports;
    auto flows = synthesizer.synthesize(base, victim, Direction::INBOUND, bot_ports);

    // 3 amplifier networks x 5, then 3 bot networks x 10
    REQUIRE(flows.size() == 45);
    CHECK(bot_ports.count() == 30);

    std::set<std::string> sources;
    for (size_t i = 0; i < flows.size(); ++i) {
        const auto& flow = flows[i];
        CHECK(flow.attack == AttackClass::VICTIM_AGGREGATE);
        CHECK(flow.vantage_point == "F");
        CHECK(flow.direction == Direction::INBOUND);
        CHECK(flow.record.destination_ip == "172.21.99.99");
        if (i < 15) {
            CHECK(flow.record.source_port == "123");
            CHECK(flow.record.destination_port == "80");
        } else {
            CHECK(flow.record.destination_port == "53");
        }
        check_timing(flow.record);
        sources.insert(flow.record.source_ip);
    }
    CHECK(sources.size() == 45);
    CHECK(flows[0].record.source_ip == "172.16.10.13");
    CHECK(sources.count(amplifier_address("172.20", 4)) == 1);
    CHECK(sources.count(host_in_prefix("172.19", bot_digest("172.19", 9))) == 1);

    SECTION("Outbound view of the victim gets nothing") {
        BotPortCounter outbound_ports;
        CHECK(synthesizer.synthesize(base, victim, Direction::OUTBOUND, outbound_ports).empty());
    }
}

TEST_CASE("Victim aggregation matches each network's own outbound flows", "[synthesizer][victim]") {
    AttackTopology topology = test::small_topology();
    topology.amplifiers_per_node = 2;
    AttackSynthesizer synthesizer(topology);
    const VantagePoint& a = topology.vantage_points[0];
    const VantagePoint& v = topology.vantage_points[1];
    FlowRecord base = parse_line(test::sample_line());

    BotPortCounter origin_ports;
    auto origin = synthesizer.synthesize(base, a, Direction::OUTBOUND, origin_ports);
    BotPortCounter victim_ports;
    auto aggregated = synthesizer.synthesize(base, v, Direction::INBOUND, victim_ports);

    REQUIRE(origin.size() == aggregated.size());
    for (size_t i = 0; i < origin.size(); ++i) {
        CHECK(origin[i].record.source_ip == aggregated[i].record.source_ip);
        CHECK(origin[i].record.destination_ip == aggregated[i].record.destination_ip);
        CHECK(origin[i].record.destination_port == aggregated[i].record.destination_port);
        CHECK(origin[i].record.start_time == aggregated[i].record.start_time);
    }
}

TEST_CASE("Scanning probes", "[synthesizer][probes]") {
    utils::Random::instance().seed(1234);
    AttackTopology topology = test::small_topology();
    topology.vantage_points[0].has_amplifiers = false;
    topology.vantage_points[0].has_bots = false;
    topology.probes_enabled = true;
    topology.probes_per_trigger = 200;
    AttackSynthesizer synthesizer(topology);
    const VantagePoint& a = topology.vantage_points[0];
    FlowRecord base = parse_line(test::sample_line());
    BotPortCounter bot_ports;

    auto flows = synthesizer.synthesize(base, a, Direction::INBOUND, bot_ports);
    REQUIRE(flows.size() == 200);

    CHECK(flows[0].record.start_time == "2024/01/01T00:00:00.015");
    CHECK(flows[1].record.start_time == "2024/01/01T00:00:00.030");

    for (const auto& flow : flows) {
        const FlowRecord& r = flow.record;
        CHECK(flow.attack == AttackClass::PROBE);
        CHECK(r.protocol == "6");
        CHECK(r.flags == " S      ");
        CHECK(r.destination_port == "2323");
        CHECK(r.packets == "6");
        CHECK(r.bytes == "384");
        CHECK(r.duration == "5.000");
        CHECK(r.destination_ip.rfind("172.16.", 0) == 0);

        uint32_t src = utils::ip_str_to_uint32(r.source_ip);
        CHECK_FALSE(utils::is_reserved_first_octet(src >> 24));

        int port = std::stoi(r.source_port);
        CHECK(port >= 49152);
        CHECK(port <= 65535);
        check_timing(r);
    }

    SECTION("No probes outbound") {
        CHECK(synthesizer.synthesize(base, a, Direction::OUTBOUND, bot_ports).empty());
    }
}

TEST_CASE("Synthesizer: headers never produce attacks", "[synthesizer][header]") {
    AttackTopology topology = test::small_topology();
    AttackSynthesizer synthesizer(topology);
    BotPortCounter bot_ports;
    FlowRecord header = parse_line(test::header_line());

    for (const auto& vp : topology.vantage_points) {
        CHECK(synthesizer.synthesize(header, vp, Direction::INBOUND, bot_ports).empty());
        CHECK(synthesizer.synthesize(header, vp, Direction::OUTBOUND, bot_ports).empty());
    }
}

TEST_CASE("Synthesizer: rejects an invalid topology", "[synthesizer][error]") {
    AttackTopology topology = test::small_topology();
    topology.vantage_points[1].has_bots = true;
    CHECK_THROWS_AS(AttackSynthesizer(topology), ConfigurationError);
}
