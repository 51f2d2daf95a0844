#ifndef DDOSFLOWGEN_DATASET_HPP
#define DDOSFLOWGEN_DATASET_HPP

#include "orchestrator.hpp"
#include "topology.hpp"
#include <ostream>
#include <string>

namespace ddosflowgen {

/**
 * Generate a full dataset from a directory of noise logs
 *
 * dataset_dir must contain the rwcut dumps "inbound" and "outbound".
 * outdir must not exist yet; it receives one inbound and one outbound file
 * per vantage point. Progress goes to `log`.
 *
 * @throws ConfigurationError for an invalid topology or missing dataset files
 * @throws ResourceError if outdir exists or cannot be written
 * @throws ParseError on a malformed line under ParsePolicy::ABORT
 */
FlowOrchestrator::Stats generate_dataset(const std::string& dataset_dir,
                                         const std::string& outdir,
                                         const AttackTopology& topology,
                                         const OrchestratorOptions& options,
                                         std::ostream& log);

} // namespace ddosflowgen

#endif // DDOSFLOWGEN_DATASET_HPP
