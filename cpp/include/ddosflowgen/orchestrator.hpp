#ifndef DDOSFLOWGEN_ORCHESTRATOR_HPP
#define DDOSFLOWGEN_ORCHESTRATOR_HPP

#include "flow_record.hpp"
#include "output_sinks.hpp"
#include "synthesizer.hpp"
#include "topology.hpp"
#include <istream>
#include <ostream>
#include <map>
#include <cstdint>

namespace ddosflowgen {

/**
 * What to do with a line that cannot be parsed
 */
enum class ParsePolicy {
    ABORT,  // throw ParseError, ending the run
    SKIP    // write a diagnostic and continue with the next line
};

struct OrchestratorOptions {
    ParsePolicy parse_policy = ParsePolicy::ABORT;
    std::ostream* diagnostics = nullptr;  // nullptr means std::cerr
};

/**
 * Streams the noise logs and fans every record out to all vantage points
 */
class FlowOrchestrator {
public:
    struct Stats {
        uint64_t lines_read = 0;
        uint64_t header_lines = 0;
        uint64_t skipped_lines = 0;
        uint64_t triggers = 0;
        uint64_t real_records_written = 0;
        std::map<AttackClass, uint64_t> synthetic_records_written;

        uint64_t synthetic_total() const;
    };

    /**
     * @throws ConfigurationError if the topology is invalid
     * @throws ResourceError if a vantage point has no sinks
     */
    FlowOrchestrator(const AttackTopology& topology, OutputSinks& sinks,
                     const OrchestratorOptions& options = OrchestratorOptions());

    FlowOrchestrator(const FlowOrchestrator&) = delete;
    FlowOrchestrator& operator=(const FlowOrchestrator&) = delete;

    /**
     * Inbound pass then outbound pass
     */
    void run(std::istream& inbound, std::istream& outbound);

    /**
     * Process one direction from start to end of the stream, then flush
     * all sinks. Resets the trigger and the bot port counter.
     */
    void process(std::istream& noise, Direction direction);

    const Stats& stats() const { return stats_; }

    const AttackTopology& topology() const { return synthesizer_.topology(); }

private:
    void emit(const FlowRecord& parsed, Direction direction, bool add_attack);

    AttackSynthesizer synthesizer_;
    OutputSinks& sinks_;
    OrchestratorOptions options_;
    BotPortCounter bot_ports_;
    Stats stats_;
};

} // namespace ddosflowgen

#endif // DDOSFLOWGEN_ORCHESTRATOR_HPP
