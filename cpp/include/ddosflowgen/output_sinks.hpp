#ifndef DDOSFLOWGEN_OUTPUT_SINKS_HPP
#define DDOSFLOWGEN_OUTPUT_SINKS_HPP

#include "flow_record.hpp"
#include "topology.hpp"
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace ddosflowgen {

/**
 * Output streams per vantage point and direction
 *
 * Each vantage point exclusively owns one inbound and one outbound stream
 * for the whole run.
 */
class OutputSinks {
public:
    OutputSinks() = default;

    OutputSinks(const OutputSinks&) = delete;
    OutputSinks& operator=(const OutputSinks&) = delete;
    OutputSinks(OutputSinks&&) = default;
    OutputSinks& operator=(OutputSinks&&) = default;

    /**
     * Create outdir and open "<name>-inbound.tuc" / "<name>-outbound.tuc"
     * for every vantage point
     *
     * @throws ResourceError if outdir already exists or a file cannot be opened
     */
    static OutputSinks open_directory(const std::string& outdir, const AttackTopology& topology);

    /**
     * Register the streams of one vantage point
     */
    void add(const std::string& vantage_point,
             std::unique_ptr<std::ostream> inbound,
             std::unique_ptr<std::ostream> outbound);

    /**
     * @throws ResourceError for an unknown vantage point
     */
    std::ostream& get(const std::string& vantage_point, Direction direction);

    bool contains(const std::string& vantage_point) const;

    /**
     * Flush every stream
     *
     * @throws ResourceError if a stream has failed
     */
    void flush_all();

    /**
     * Flush and close file streams; returns the names closed
     */
    std::vector<std::string> close_all();

private:
    struct SinkPair {
        std::unique_ptr<std::ostream> inbound;
        std::unique_ptr<std::ostream> outbound;
    };

    std::map<std::string, SinkPair> sinks_;
};

} // namespace ddosflowgen

#endif // DDOSFLOWGEN_OUTPUT_SINKS_HPP
