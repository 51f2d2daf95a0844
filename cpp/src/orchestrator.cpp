#include "ddosflowgen/orchestrator.hpp"
#include "ddosflowgen/anonymizer.hpp"
#include "ddosflowgen/errors.hpp"
#include "ddosflowgen/record_codec.hpp"
#include <iostream>
#include <string>

namespace ddosflowgen {

uint64_t FlowOrchestrator::Stats::synthetic_total() const {
    uint64_t total = 0;
    for (const auto& entry : synthetic_records_written) {
        total += entry.second;
    }
    return total;
}

FlowOrchestrator::FlowOrchestrator(const AttackTopology& topology, OutputSinks& sinks,
                                   const OrchestratorOptions& options)
    : synthesizer_(topology),
      sinks_(sinks),
      options_(options) {
    for (const auto& vp : topology.vantage_points) {
        if (!sinks_.contains(vp.name)) {
            throw ResourceError("No output sinks opened for vantage point " + vp.name);
        }
    }
}

void FlowOrchestrator::run(std::istream& inbound, std::istream& outbound) {
    process(inbound, Direction::INBOUND);
    process(outbound, Direction::OUTBOUND);
}

void FlowOrchestrator::process(std::istream& noise, Direction direction) {
    std::ostream& diag = options_.diagnostics ? *options_.diagnostics : std::cerr;
    const uint64_t interval = topology().synthetic_interval;

    bot_ports_.reset();
    uint64_t counter = 0;
    size_t line_number = 0;
    std::string line;

    while (std::getline(noise, line)) {
        ++line_number;
        stats_.lines_read++;

        bool add_attack;
        if (counter > interval) {
            add_attack = true;
            counter = 1;
        } else {
            add_attack = false;
            counter++;
        }

        FlowRecord parsed;
        try {
            parsed = parse_line(line);
        } catch (const ParseError& e) {
            if (options_.parse_policy == ParsePolicy::ABORT) {
                throw ParseError(direction_name(direction) + ": " + e.what(), line_number);
            }
            diag << "Warning: skipping " << direction_name(direction)
                 << " line " << line_number << ": " << e.what() << "\n";
            stats_.skipped_lines++;
            continue;
        }

        if (parsed.is_header()) {
            stats_.header_lines++;
            add_attack = false;
        } else if (add_attack) {
            stats_.triggers++;
        }

        emit(parsed, direction, add_attack);
    }

    if (noise.bad()) {
        throw ResourceError("Read error in " + direction_name(direction) + " noise dataset");
    }

    // Flush all files when we're done with a direction
    sinks_.flush_all();
}

void FlowOrchestrator::emit(const FlowRecord& parsed, Direction direction, bool add_attack) {
    for (const auto& vp : topology().vantage_points) {
        // Each vantage point gets its own copy of the record
        FlowRecord rewritten = rewrite_addresses(parsed, direction, vp);
        sinks_.get(vp.name, direction) << serialize_line(rewritten);
        stats_.real_records_written++;

        if (!add_attack) {
            continue;
        }

        for (const auto& flow : synthesizer_.synthesize(rewritten, vp, direction, bot_ports_)) {
            sinks_.get(flow.vantage_point, flow.direction) << serialize_line(flow.record);
            stats_.synthetic_records_written[flow.attack]++;
        }
    }
}

} // namespace ddosflowgen
