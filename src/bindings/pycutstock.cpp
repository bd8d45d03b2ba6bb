/**
 * pycutstock — Python bindings for the cutting-stock optimizer
 *
 * Exposes the order types, OptimizerConfig, CancelToken and optimize() to
 * the web layer. optimize() releases the GIL while the GA runs, so a request
 * timeout on another Python thread can call CancelToken.cancel().
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "core/errors.h"
#include "demand/demand.h"
#include "engine/optimizer.h"
#include "report/cutting_report.h"

namespace py = pybind11;
using namespace cutstock;

// Helper: histogram as an insertion-ordered dict {length: count}.
// Whole lengths become int keys (50, not 50.0), as the templates expect.
static py::dict histogram_to_dict(const std::vector<LengthCount>& histogram) {
    py::dict d;
    for (const auto& e : histogram) {
        if (is_whole_length(e.length)) {
            d[py::int_(static_cast<long long>(e.length))] = e.count;
        } else {
            d[py::float_(e.length)] = e.count;
        }
    }
    return d;
}

PYBIND11_MODULE(pycutstock, m) {
    m.doc() = "One-dimensional cutting-stock genetic optimizer";

    // =========================================================================
    // Errors (both derive from ValueError on the Python side)
    // =========================================================================
    py::register_exception<InvalidInputError>(m, "InvalidInputError", PyExc_ValueError);
    py::register_exception<InfeasiblePartError>(m, "InfeasiblePartError", PyExc_ValueError);

    // =========================================================================
    // Order
    // =========================================================================
    py::class_<RequiredPart>(m, "Part")
        .def(py::init([](Length length, int quantity) {
            return RequiredPart{length, quantity};
        }), py::arg("length"), py::arg("quantity") = 1)
        .def_readwrite("length",   &RequiredPart::length)
        .def_readwrite("quantity", &RequiredPart::quantity)
        .def("__repr__", [](const RequiredPart& p) {
            return "Part(length=" + format_length(p.length)
                 + ", quantity=" + std::to_string(p.quantity) + ")";
        });

    // =========================================================================
    // Configuration
    // =========================================================================
    py::class_<FitnessWeights>(m, "FitnessWeights")
        .def(py::init<>())
        .def_readwrite("beam_weight",  &FitnessWeights::beam_weight)
        .def_readwrite("waste_weight", &FitnessWeights::waste_weight);

    py::class_<OptimizerConfig>(m, "OptimizerConfig")
        .def(py::init<>())
        .def_readwrite("population_size", &OptimizerConfig::population_size)
        .def_readwrite("max_generations", &OptimizerConfig::max_generations)
        .def_readwrite("stall_limit",     &OptimizerConfig::stall_limit)
        .def_readwrite("p_crossover",     &OptimizerConfig::p_crossover)
        .def_readwrite("p_mutation",      &OptimizerConfig::p_mutation)
        .def_readwrite("tournament_size", &OptimizerConfig::tournament_size)
        .def_readwrite("fitness_weights", &OptimizerConfig::fitness_weights)
        .def_readwrite("random_seed",     &OptimizerConfig::random_seed)
        .def_readwrite("n_threads",       &OptimizerConfig::n_threads)
        .def_readwrite("verbose",         &OptimizerConfig::verbose);

    py::class_<CancelToken>(m, "CancelToken",
        "Raise from any thread; the optimizer stops at the next generation boundary")
        .def(py::init<>())
        .def("cancel",    &CancelToken::cancel)
        .def("reset",     &CancelToken::reset)
        .def("cancelled", &CancelToken::cancelled);

    // =========================================================================
    // Result
    // =========================================================================
    py::class_<Pattern>(m, "Pattern")
        .def_readonly("lengths", &Pattern::lengths)
        .def_readonly("used",    &Pattern::used)
        .def_readonly("waste",   &Pattern::waste);

    py::class_<PatternGroup>(m, "PatternGroup")
        .def_readonly("lengths",    &PatternGroup::lengths)
        .def_readonly("waste",      &PatternGroup::waste)
        .def_readonly("repetition", &PatternGroup::repetition)
        .def_readonly("counts",     &PatternGroup::counts);

    py::class_<CuttingReport>(m, "CuttingReport")
        .def_readonly("raw_length",          &CuttingReport::raw_length)
        .def_readonly("genotype_waste",      &CuttingReport::genotype_waste)
        .def_readonly("beam_count",          &CuttingReport::beam_count)
        .def_readonly("all_elements_length", &CuttingReport::all_elements_length)
        .def_readonly("surowca_utilization", &CuttingReport::surowca_utilization)
        .def_readonly("patterns",            &CuttingReport::patterns)
        .def_readonly("pattern_groups",      &CuttingReport::pattern_groups)
        .def_readonly("generations_run",     &CuttingReport::generations_run)
        .def_readonly("cancelled",           &CuttingReport::cancelled)
        .def_readonly("stopped_by_stall",    &CuttingReport::stopped_by_stall)
        .def_readonly("seed",                &CuttingReport::seed)
        .def_property_readonly("unique_element_lengths_and_count_dict",
            [](const CuttingReport& r) {
                return histogram_to_dict(r.unique_element_lengths_and_count);
            })
        .def("to_json", &CuttingReport::to_json)
        .def("summary", &CuttingReport::summary)
        .def("__repr__", [](const CuttingReport& r) {
            char buf[160];
            snprintf(buf, sizeof(buf),
                     "CuttingReport(beam_count=%zu, genotype_waste=%g, utilization=%.2f%%)",
                     r.beam_count, r.genotype_waste, r.surowca_utilization);
            return std::string(buf);
        });

    // =========================================================================
    // Entry point
    // =========================================================================
    m.def("optimize", &optimize_cutting,
          "Validate the order, run the GA and return the cutting report",
          py::arg("raw_length"), py::arg("parts"),
          py::arg("config") = OptimizerConfig{},
          py::arg("cancel") = static_cast<const CancelToken*>(nullptr),
          py::call_guard<py::gil_scoped_release>());

    m.def("version", []() { return "0.1.0"; });
}
