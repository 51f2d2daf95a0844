#include "ddosflowgen/dataset.hpp"
#include "ddosflowgen/errors.hpp"
#include "ddosflowgen/output_sinks.hpp"
#include <filesystem>
#include <fstream>

namespace ddosflowgen {

namespace fs = std::filesystem;

static std::ifstream open_noise(const fs::path& path) {
    if (!fs::is_regular_file(path)) {
        throw ConfigurationError("Noise dataset file does not exist: " + path.string());
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ResourceError("Cannot open noise dataset file: " + path.string());
    }
    return in;
}

FlowOrchestrator::Stats generate_dataset(const std::string& dataset_dir,
                                         const std::string& outdir,
                                         const AttackTopology& topology,
                                         const OrchestratorOptions& options,
                                         std::ostream& log) {
    // Everything that can be rejected is checked before outdir is created
    topology.validate_or_throw();
    std::ifstream inbound = open_noise(fs::path(dataset_dir) / "inbound");
    std::ifstream outbound = open_noise(fs::path(dataset_dir) / "outbound");

    OutputSinks sinks = OutputSinks::open_directory(outdir, topology);
    FlowOrchestrator orchestrator(topology, sinks, options);

    log << "Processing inbound..." << std::endl;
    orchestrator.process(inbound, Direction::INBOUND);

    log << "Processing outbound..." << std::endl;
    orchestrator.process(outbound, Direction::OUTBOUND);

    for (const auto& name : sinks.close_all()) {
        log << "Closed result files for " << name << std::endl;
    }

    return orchestrator.stats();
}

} // namespace ddosflowgen
