#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <iostream>
#include "ddosflowgen/address_digest.hpp"
#include "ddosflowgen/anonymizer.hpp"
#include "ddosflowgen/dataset.hpp"
#include "ddosflowgen/flow_record.hpp"
#include "ddosflowgen/record_codec.hpp"
#include "ddosflowgen/topology.hpp"
#include "ddosflowgen/utils.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_ddosflowgen_core, m) {
    m.doc() = "ddosflowgen C++ core - DDoS flow synthesis and address anonymization";

    py::enum_<ddosflowgen::Direction>(m, "Direction")
        .value("INBOUND", ddosflowgen::Direction::INBOUND)
        .value("OUTBOUND", ddosflowgen::Direction::OUTBOUND);

    // FlowRecord binding
    py::class_<ddosflowgen::FlowRecord>(m, "FlowRecord")
        .def(py::init<>())
        .def_readwrite("source_ip", &ddosflowgen::FlowRecord::source_ip)
        .def_readwrite("destination_ip", &ddosflowgen::FlowRecord::destination_ip)
        .def_readwrite("source_port", &ddosflowgen::FlowRecord::source_port)
        .def_readwrite("destination_port", &ddosflowgen::FlowRecord::destination_port)
        .def_readwrite("protocol", &ddosflowgen::FlowRecord::protocol)
        .def_readwrite("packets", &ddosflowgen::FlowRecord::packets)
        .def_readwrite("bytes", &ddosflowgen::FlowRecord::bytes)
        .def_readwrite("flags", &ddosflowgen::FlowRecord::flags)
        .def_readwrite("start_time", &ddosflowgen::FlowRecord::start_time)
        .def_readwrite("duration", &ddosflowgen::FlowRecord::duration)
        .def_readwrite("end_time", &ddosflowgen::FlowRecord::end_time)
        .def_readwrite("sensor", &ddosflowgen::FlowRecord::sensor)
        .def_readonly("start_time_ms", &ddosflowgen::FlowRecord::start_time_ms)
        .def("is_header", &ddosflowgen::FlowRecord::is_header)
        .def("__repr__", [](const ddosflowgen::FlowRecord& f) {
            return "FlowRecord(" + f.to_string() + ")";
        });

    // VantagePoint binding
    py::class_<ddosflowgen::VantagePoint>(m, "VantagePoint")
        .def(py::init<>())
        .def(py::init<const std::string&, const std::string&, bool, bool, const std::string&>(),
             py::arg("prefix"),
             py::arg("name"),
             py::arg("has_amplifiers"),
             py::arg("has_bots"),
             py::arg("victim_ip") = "")
        .def_readwrite("prefix", &ddosflowgen::VantagePoint::prefix)
        .def_readwrite("name", &ddosflowgen::VantagePoint::name)
        .def_readwrite("has_amplifiers", &ddosflowgen::VantagePoint::has_amplifiers)
        .def_readwrite("has_bots", &ddosflowgen::VantagePoint::has_bots)
        .def_readwrite("victim_ip", &ddosflowgen::VantagePoint::victim_ip);

    // AttackTopology binding
    py::class_<ddosflowgen::AttackTopology>(m, "AttackTopology")
        .def(py::init<>())
        .def_readwrite("vantage_points", &ddosflowgen::AttackTopology::vantage_points)
        .def_readwrite("amplifiers_per_node", &ddosflowgen::AttackTopology::amplifiers_per_node)
        .def_readwrite("bots_per_node", &ddosflowgen::AttackTopology::bots_per_node)
        .def_readwrite("synthetic_interval", &ddosflowgen::AttackTopology::synthetic_interval)
        .def_readwrite("probes_enabled", &ddosflowgen::AttackTopology::probes_enabled)
        .def_readwrite("probes_duration_s", &ddosflowgen::AttackTopology::probes_duration_s)
        .def_readwrite("probes_per_trigger", &ddosflowgen::AttackTopology::probes_per_trigger)
        .def_readwrite("probes_dst_port", &ddosflowgen::AttackTopology::probes_dst_port)
        .def_readwrite("reflect_service_port", &ddosflowgen::AttackTopology::reflect_service_port)
        .def_readwrite("reflect_client_port", &ddosflowgen::AttackTopology::reflect_client_port)
        .def_readwrite("reflect_input_packets_per_flow", &ddosflowgen::AttackTopology::reflect_input_packets_per_flow)
        .def_readwrite("reflect_input_bytes_per_flow", &ddosflowgen::AttackTopology::reflect_input_bytes_per_flow)
        .def_readwrite("reflect_output_packets_per_flow", &ddosflowgen::AttackTopology::reflect_output_packets_per_flow)
        .def_readwrite("reflect_output_bytes_per_flow", &ddosflowgen::AttackTopology::reflect_output_bytes_per_flow)
        .def_readwrite("bot_dst_port", &ddosflowgen::AttackTopology::bot_dst_port)
        .def_readwrite("bot_output_packets_per_flow", &ddosflowgen::AttackTopology::bot_output_packets_per_flow)
        .def_readwrite("bot_output_bytes_per_flow", &ddosflowgen::AttackTopology::bot_output_bytes_per_flow)
        .def_readwrite("flow_duration_s", &ddosflowgen::AttackTopology::flow_duration_s)
        .def("validate", [](const ddosflowgen::AttackTopology& topology) {
            std::string error;
            if (!topology.validate(&error)) {
                throw std::runtime_error("Topology validation failed: " + error);
            }
            return true;
        });

    m.def("mixed_big", &ddosflowgen::topologies::mixed_big,
          "Reference six-network topology");

    // Codec and anonymization
    m.def("parse_line", &ddosflowgen::parse_line, py::arg("line"));
    m.def("serialize_line", &ddosflowgen::serialize_line, py::arg("record"));
    m.def("digest", [](const std::string& text) {
        auto d = ddosflowgen::digest(text);
        return py::bytes(reinterpret_cast<const char*>(d.data()), d.size());
    }, py::arg("text"));
    m.def("rewrite_addresses", &ddosflowgen::rewrite_addresses,
          py::arg("record"), py::arg("direction"), py::arg("vantage_point"));

    m.def("seed", [](uint64_t seed) {
        ddosflowgen::utils::Random::instance().seed(seed);
    }, py::arg("seed"), "Seed the packet/byte jitter and probe generator");

    m.def("generate", [](const std::string& dataset_dir, const std::string& outdir,
                         const ddosflowgen::AttackTopology& topology) {
        ddosflowgen::OrchestratorOptions options;
        auto stats = ddosflowgen::generate_dataset(dataset_dir, outdir, topology,
                                                   options, std::cerr);
        return stats.synthetic_total();
    }, py::arg("dataset_dir"), py::arg("outdir"), py::arg("topology"),
       "Generate a dataset; returns the number of synthetic records written");
}
