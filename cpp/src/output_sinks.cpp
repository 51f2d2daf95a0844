#include "ddosflowgen/output_sinks.hpp"
#include "ddosflowgen/errors.hpp"
#include <filesystem>
#include <fstream>

namespace ddosflowgen {

namespace fs = std::filesystem;

static std::unique_ptr<std::ostream> open_file(const fs::path& path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::trunc);
    if (!file->is_open()) {
        throw ResourceError("Cannot open output file: " + path.string());
    }
    return file;
}

OutputSinks OutputSinks::open_directory(const std::string& outdir, const AttackTopology& topology) {
    std::error_code ec;
    if (fs::exists(outdir, ec)) {
        throw ResourceError("The --outdir path already exists. Aborting, not clobbering existing results.");
    }
    if (!fs::create_directories(outdir, ec) || ec) {
        throw ResourceError("Cannot create output directory " + outdir +
                            (ec ? ": " + ec.message() : ""));
    }

    OutputSinks sinks;
    for (const auto& vp : topology.vantage_points) {
        fs::path dir(outdir);
        sinks.add(vp.name,
                  open_file(dir / (vp.name + "-inbound.tuc")),
                  open_file(dir / (vp.name + "-outbound.tuc")));
    }
    return sinks;
}

void OutputSinks::add(const std::string& vantage_point,
                      std::unique_ptr<std::ostream> inbound,
                      std::unique_ptr<std::ostream> outbound) {
    if (!inbound || !outbound) {
        throw ResourceError("Null output stream for " + vantage_point);
    }
    sinks_[vantage_point] = SinkPair{std::move(inbound), std::move(outbound)};
}

std::ostream& OutputSinks::get(const std::string& vantage_point, Direction direction) {
    auto it = sinks_.find(vantage_point);
    if (it == sinks_.end()) {
        throw ResourceError("No output sink for vantage point " + vantage_point);
    }
    return direction == Direction::INBOUND ? *it->second.inbound : *it->second.outbound;
}

bool OutputSinks::contains(const std::string& vantage_point) const {
    return sinks_.find(vantage_point) != sinks_.end();
}

void OutputSinks::flush_all() {
    for (auto& entry : sinks_) {
        for (std::ostream* out : {entry.second.inbound.get(), entry.second.outbound.get()}) {
            out->flush();
            if (!*out) {
                throw ResourceError("Write failed for " + entry.first);
            }
        }
    }
}

std::vector<std::string> OutputSinks::close_all() {
    flush_all();

    std::vector<std::string> closed;
    for (auto& entry : sinks_) {
        for (std::ostream* out : {entry.second.inbound.get(), entry.second.outbound.get()}) {
            if (auto* file = dynamic_cast<std::ofstream*>(out)) {
                file->close();
            }
        }
        closed.push_back(entry.first);
    }
    return closed;
}

} // namespace ddosflowgen
