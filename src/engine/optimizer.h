#pragma once
/**
 * CuttingOptimizer — generation loop of the cutting-stock GA
 *
 * Per generation:
 *   1. decode + evaluate every genotype (worker threads, one result slot each)
 *   2. track best-ever (owned copy), update stall counter
 *   3. stop on hard generation cap, stall limit, or cancellation
 *   4. breed next generation on this thread (PopulationManager)
 *
 * One std::mt19937 seeded with random_seed drives every random choice, so a
 * seed reproduces the run exactly whatever the thread count.
 */

#include "demand/demand.h"
#include "genome/genotype.h"
#include "genome/decoder.h"
#include "genome/fitness.h"
#include "genome/population_manager.h"
#include <atomic>
#include <functional>
#include <random>
#include <vector>
#include <cstdint>

namespace cutstock {

// =============================================================================
// Optimizer configuration
// =============================================================================

struct OptimizerConfig {
    size_t   population_size = 70;    // genotypes per generation
    size_t   max_generations = 200;   // hard cap, always enforced
    size_t   stall_limit     = 60;    // generations without improvement; 0 = off
    double   p_crossover     = 0.9;   // order crossover probability
    double   p_mutation      = 0.2;   // swap mutation probability per child
    size_t   tournament_size = 3;
    FitnessWeights fitness_weights;
    uint32_t random_seed     = 2024;

    size_t   n_threads       = 0;     // evaluation workers; 0 = hardware concurrency
    bool     verbose         = false; // per-generation progress lines on stdout
};

/** Throws InvalidInputError when a field is out of range */
void validate_config(const OptimizerConfig& config);

// =============================================================================
// Cancellation flag, polled once per generation boundary
// =============================================================================

class CancelToken {
public:
    void cancel() { flag_.store(true); }
    void reset() { flag_.store(false); }
    bool cancelled() const { return flag_.load(); }

private:
    std::atomic<bool> flag_{false};
};

// =============================================================================
// Per-generation statistics and run result
// =============================================================================

struct GenerationStats {
    size_t generation        = 0;
    double best_fitness      = 0.0;   // this generation
    double avg_fitness       = 0.0;
    double best_ever_fitness = 0.0;
    size_t best_ever_beams   = 0;
    size_t stall             = 0;
};

struct OptimizationResult {
    Genotype    best;                 // best-ever genotype (owned copy)
    CuttingPlan plan;                 // decode(best)
    size_t      generations_run  = 0;
    bool        cancelled        = false;
    bool        stopped_by_stall = false;
    uint32_t    seed             = 0;

    /** Best-ever fitness after each generation */
    std::vector<double> best_fitness_history;
};

// =============================================================================
// CuttingOptimizer
// =============================================================================

class CuttingOptimizer {
public:
    /** Throws InvalidInputError for an invalid config */
    explicit CuttingOptimizer(const Demand& demand, const OptimizerConfig& config = {});

    /**
     * Run the full evolutionary loop. If cancel is raised the run stops at
     * the next generation boundary and returns the best-ever result so far
     * with cancelled = true. At least one generation is always evaluated.
     */
    OptimizationResult run(const CancelToken* cancel = nullptr);

    /** Called on the driver thread after each generation is evaluated */
    using ProgressCallback = std::function<void(const GenerationStats&)>;
    void set_progress_callback(ProgressCallback cb) { progress_cb_ = std::move(cb); }

    /** Sees every evaluated population (generation index, population) */
    using GenerationObserver = std::function<void(size_t, const std::vector<Genotype>&)>;
    void set_generation_observer(GenerationObserver obs) { observer_ = std::move(obs); }

    const Demand& demand() const { return demand_; }
    const OptimizerConfig& config() const { return config_; }

private:
    Demand demand_;
    OptimizerConfig config_;
    PopulationManager manager_;
    std::mt19937 rng_;
    std::vector<Genotype> population_;
    ProgressCallback progress_cb_;
    GenerationObserver observer_;

    void initialize_population();

    /** Evaluate population_[skip..]; the first skip entries keep their fitness */
    void evaluate_population(size_t skip);
};

} // namespace cutstock
