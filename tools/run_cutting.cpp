/**
 * run_cutting — command-line cutting-stock optimizer
 *
 * Reads a part-list text file (first line: raw stock length, then one part
 * length per line; blank lines ignored; equal lengths are merged into one
 * row with a quantity), runs the GA and prints the plan.
 * Output: cutting_plan.json in the working directory.
 *
 * Usage: run_cutting <parts_file> [generations] [population] [seed]
 *   defaults: 200 generations, 70 population, seed 2024
 */

#include "report/cutting_report.h"
#include "core/errors.h"
#include "demand/parts_file.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace cutstock;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <parts_file> [generations] [population] [seed]\n", argv[0]);
        return 2;
    }

    OptimizerConfig cfg;
    cfg.verbose = true;
    if (argc >= 3) cfg.max_generations = static_cast<size_t>(std::atoi(argv[2]));
    if (argc >= 4) cfg.population_size = static_cast<size_t>(std::atoi(argv[3]));
    if (argc >= 5) cfg.random_seed = static_cast<uint32_t>(std::strtoul(argv[4], nullptr, 10));

    PartList order;
    try {
        order = read_part_list_file(argv[1]);
    } catch (const InvalidInputError& e) {
        fprintf(stderr, "  %s\n", e.what());
        return 1;
    }

    printf("=== cutstock: 1D cutting-stock optimizer ===\n");
    printf("  Population: %zu, Generations: %zu, Seed: %u\n",
           cfg.population_size, cfg.max_generations, cfg.random_seed);
    printf("  Fitness: beams*%.3f + waste*%.3f\n\n",
           cfg.fitness_weights.beam_weight, cfg.fitness_weights.waste_weight);

    CuttingReport report;
    try {
        report = optimize_cutting(order.raw_length, order.parts, cfg);
    } catch (const InfeasiblePartError& e) {
        fprintf(stderr, "  infeasible order: %s\n", e.what());
        return 1;
    } catch (const InvalidInputError& e) {
        fprintf(stderr, "  invalid input: %s\n", e.what());
        return 1;
    }

    printf("\n=== Cutting Plan ===\n");
    printf("%s", report.summary().c_str());

    std::ofstream ofs("cutting_plan.json");
    if (ofs.is_open()) {
        ofs << report.to_json() << "\n";
        ofs.close();
        printf("\n  Saved to cutting_plan.json\n");
    } else {
        fprintf(stderr, "  cannot write cutting_plan.json\n");
        return 1;
    }

    return 0;
}
