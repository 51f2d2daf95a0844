/**
 * ddosflowgen - DDoS flow generator and address rewriter
 *
 * Takes a noise dataset of SiLK rwcut dumps ("inbound" and "outbound") and
 * a topology, and writes noise plus synthetic attack traffic for every
 * vantage point:
 *   - amplifiers: UDP reflectors such as DNS and NTP
 *   - bots: UDP floods at the victim
 *   - probes: TCP SYN scans of random destinations
 *
 * The noise files can be produced with:
 *   rwfilter --sensor=S0 --type=in,inweb,inicmp ... --pass=stdout | rwcut
 *   rwfilter --sensor=S0 --type=out,outweb,outicmp ... --pass=stdout | rwcut
 */

#include "arg_parser.hpp"
#include <ddosflowgen/dataset.hpp>
#include <ddosflowgen/errors.hpp>
#include <ddosflowgen/synthesizer.hpp>
#include <ddosflowgen/topology.hpp>
#include <ddosflowgen/utils.hpp>
#include <iostream>
#include <string>

using namespace ddosflowgen;

struct ProgramOptions {
    std::string dataset_dir;
    std::string outdir;
    std::string topology = "mixed_big";
    uint64_t interval = 0;
    uint64_t seed = 0;
    bool skip_malformed = false;
};

static void print_summary(const FlowOrchestrator::Stats& stats) {
    std::cerr << "\nSummary:\n"
              << "  Lines read: " << stats.lines_read << "\n"
              << "  Header lines: " << stats.header_lines << "\n"
              << "  Skipped lines: " << stats.skipped_lines << "\n"
              << "  Triggers: " << stats.triggers << "\n"
              << "  Real records written: " << stats.real_records_written << "\n"
              << "  Synthetic records written: " << stats.synthetic_total() << "\n";
    for (const auto& entry : stats.synthetic_records_written) {
        std::cerr << "    " << attack_class_name(entry.first) << ": " << entry.second << "\n";
    }
}

int main(int argc, char** argv) {
    ProgramOptions opts;

    tools::ArgParser parser("ddosflowgen - DDoS flow generator and address rewriter");

    parser.add_option("-d", "dataset", opts.dataset_dir,
                      "Noise dataset directory, containing files: inbound, outbound");
    parser.add_option("-o", "outdir", opts.outdir,
                      "Output directory for per-node results (must not exist)");
    parser.add_option("-t", "topology", opts.topology,
                      "Built-in topology name", false, "mixed_big");
    parser.add_option("-i", "interval", opts.interval,
                      "Override the synthetic record interval of the topology",
                      static_cast<uint64_t>(0));
    parser.add_option("-s", "seed", opts.seed,
                      "Seed for the packet/byte jitter and probe generator (0 = clock)",
                      static_cast<uint64_t>(0));
    parser.add_flag("skip-malformed", opts.skip_malformed,
                    "Skip unparsable noise lines instead of aborting");

    if (!parser.parse(argc, argv)) {
        if (parser.should_show_help()) {
            parser.print_help();
            return 0;
        }
        std::cerr << "Error: " << parser.error() << "\n\n";
        parser.print_help(std::cerr);
        return 1;
    }

    try {
        if (opts.dataset_dir.empty()) {
            throw ConfigurationError("Must use --dataset to specify the path of noise dataset. "
                                     "Must contain files: inbound, outbound");
        }
        if (opts.outdir.empty()) {
            throw ConfigurationError("Must use --outdir to specify the path that will store the "
                                     "generated outputs, numbered by node name");
        }

        AttackTopology topology = topologies::by_name(opts.topology);
        if (parser.was_set("interval")) {
            topology.synthetic_interval = opts.interval;
        }
        topology.validate_or_throw();

        if (opts.seed != 0) {
            utils::Random::instance().seed(opts.seed);
        }

        OrchestratorOptions orchestrator_options;
        orchestrator_options.parse_policy =
            opts.skip_malformed ? ParsePolicy::SKIP : ParsePolicy::ABORT;

        FlowOrchestrator::Stats stats = generate_dataset(opts.dataset_dir, opts.outdir,
                                                         topology, orchestrator_options,
                                                         std::cerr);
        print_summary(stats);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
