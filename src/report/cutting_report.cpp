#include "report/cutting_report.h"
#include <sstream>
#include <iomanip>
#include <utility>

namespace cutstock {

// =============================================================================
// Pattern grouping
// =============================================================================

std::vector<PatternGroup> group_patterns(const std::vector<Pattern>& patterns,
                                         const std::vector<LengthCount>& histogram) {
    std::vector<PatternGroup> groups;
    for (const auto& p : patterns) {
        std::vector<int> counts(histogram.size(), 0);
        for (Length l : p.lengths) {
            for (size_t k = 0; k < histogram.size(); ++k) {
                if (histogram[k].length == l) { counts[k]++; break; }
            }
        }

        bool merged = false;
        for (auto& g : groups) {
            if (g.counts == counts) {
                g.repetition++;
                merged = true;
                break;
            }
        }
        if (!merged) {
            PatternGroup g;
            g.lengths = p.lengths;
            g.waste = p.waste;
            g.repetition = 1;
            g.counts = std::move(counts);
            groups.push_back(std::move(g));
        }
    }
    return groups;
}

// =============================================================================
// make_report / optimize_cutting
// =============================================================================

CuttingReport make_report(const Demand& demand, const OptimizationResult& result) {
    const CuttingPlan& plan = result.plan;

    CuttingReport r;
    r.raw_length = demand.raw_length;
    r.genotype_waste = plan.genotype_waste();
    r.beam_count = plan.beam_count();
    r.all_elements_length = plan.all_elements_length();
    r.surowca_utilization = plan.surowca_utilization();
    r.unique_element_lengths_and_count = demand.histogram;
    r.patterns = plan.patterns;
    r.pattern_groups = group_patterns(plan.patterns, demand.histogram);
    r.generations_run = result.generations_run;
    r.cancelled = result.cancelled;
    r.stopped_by_stall = result.stopped_by_stall;
    r.seed = result.seed;
    return r;
}

CuttingReport optimize_cutting(Length raw_length,
                               const std::vector<RequiredPart>& parts,
                               const OptimizerConfig& config,
                               const CancelToken* cancel) {
    Demand demand = build_demand(raw_length, parts);
    CuttingOptimizer optimizer(demand, config);
    OptimizationResult result = optimizer.run(cancel);
    return make_report(demand, result);
}

// =============================================================================
// JSON serialization
// =============================================================================

static void write_lengths(std::ostringstream& ss, const std::vector<Length>& lengths) {
    ss << "[";
    for (size_t i = 0; i < lengths.size(); ++i) {
        if (i) ss << ", ";
        ss << format_length_exact(lengths[i]);
    }
    ss << "]";
}

std::string CuttingReport::to_json() const {
    std::ostringstream ss;
    ss << "{\n";
    ss << "  \"raw_length\": " << format_length_exact(raw_length) << ",\n";
    ss << "  \"genotype_waste\": " << format_length_exact(genotype_waste) << ",\n";
    ss << "  \"beam_count\": " << beam_count << ",\n";
    ss << "  \"all_elements_length\": " << format_length_exact(all_elements_length) << ",\n";
    ss << "  \"surowca_utilization\": " << format_length_exact(surowca_utilization) << ",\n";

    // Object keys keep histogram (first-seen) order
    ss << "  \"unique_element_lengths_and_count_dict\": {";
    for (size_t i = 0; i < unique_element_lengths_and_count.size(); ++i) {
        const auto& e = unique_element_lengths_and_count[i];
        if (i) ss << ", ";
        ss << "\"" << format_length_exact(e.length) << "\": " << e.count;
    }
    ss << "},\n";

    ss << "  \"patterns\": [\n";
    for (size_t i = 0; i < patterns.size(); ++i) {
        ss << "    {\"lengths\": ";
        write_lengths(ss, patterns[i].lengths);
        ss << ", \"waste\": " << format_length_exact(patterns[i].waste) << "}";
        if (i + 1 < patterns.size()) ss << ",";
        ss << "\n";
    }
    ss << "  ],\n";

    ss << "  \"pattern_groups\": [\n";
    for (size_t i = 0; i < pattern_groups.size(); ++i) {
        const auto& g = pattern_groups[i];
        ss << "    {\"repetition\": " << g.repetition << ", \"lengths\": ";
        write_lengths(ss, g.lengths);
        ss << ", \"counts\": [";
        for (size_t k = 0; k < g.counts.size(); ++k) {
            if (k) ss << ", ";
            ss << g.counts[k];
        }
        ss << "], \"waste\": " << format_length_exact(g.waste) << "}";
        if (i + 1 < pattern_groups.size()) ss << ",";
        ss << "\n";
    }
    ss << "  ],\n";

    ss << "  \"generations_run\": " << generations_run << ",\n";
    ss << "  \"cancelled\": " << (cancelled ? "true" : "false") << ",\n";
    ss << "  \"stopped_by_stall\": " << (stopped_by_stall ? "true" : "false") << ",\n";
    ss << "  \"seed\": " << seed << "\n";
    ss << "}";
    return ss.str();
}

// =============================================================================
// Summary
// =============================================================================

std::string CuttingReport::summary() const {
    std::ostringstream ss;
    const Length stock_used = static_cast<Length>(beam_count) * raw_length;
    ss << "Total waste: " << format_length(genotype_waste) << "\n";
    ss << "Beams used: " << beam_count << " x " << format_length(raw_length) << "\n";
    ss << "Total element length: " << format_length(all_elements_length) << "\n";
    ss << "Stock used: " << format_length(stock_used)
       << " (" << std::fixed << std::setprecision(2) << surowca_utilization << "%)\n";
    for (const auto& g : pattern_groups) {
        ss << "  " << g.repetition << " x ";
        for (size_t i = 0; i < g.lengths.size(); ++i) {
            if (i) ss << " + ";
            ss << format_length(g.lengths[i]);
        }
        ss << "  | waste " << format_length(g.waste) << "\n";
    }
    return ss.str();
}

} // namespace cutstock
