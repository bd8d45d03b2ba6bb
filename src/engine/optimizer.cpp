#include "engine/optimizer.h"
#include "core/errors.h"
#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <thread>

namespace cutstock {

// =============================================================================
// Config validation
// =============================================================================

static bool is_probability(double p) {
    return std::isfinite(p) && p >= 0.0 && p <= 1.0;
}

void validate_config(const OptimizerConfig& config) {
    if (config.population_size < 1) {
        throw InvalidInputError("population_size must be at least 1");
    }
    if (config.max_generations < 1) {
        throw InvalidInputError("max_generations must be at least 1");
    }
    if (config.tournament_size < 1) {
        throw InvalidInputError("tournament_size must be at least 1");
    }
    if (!is_probability(config.p_crossover)) {
        throw InvalidInputError("p_crossover must be within [0, 1]");
    }
    if (!is_probability(config.p_mutation)) {
        throw InvalidInputError("p_mutation must be within [0, 1]");
    }
    if (!config.fitness_weights.valid()) {
        throw InvalidInputError("fitness weights must be >= 0 and not both zero");
    }
}

static BreedingConfig breeding_config(const OptimizerConfig& config) {
    BreedingConfig b;
    b.population_size = config.population_size;
    b.tournament_size = config.tournament_size;
    b.p_crossover = config.p_crossover;
    b.p_mutation = config.p_mutation;
    return b;
}

// =============================================================================
// Constructor
// =============================================================================

CuttingOptimizer::CuttingOptimizer(const Demand& demand, const OptimizerConfig& config)
    : demand_(demand)
    , config_(config)
    , manager_(breeding_config(config))
    , rng_(config.random_seed)
{
    validate_config(config_);
    if (demand_.empty()) {
        throw InvalidInputError("part list is empty: nothing to cut");
    }
}

// =============================================================================
// Initialize population with random permutations
// =============================================================================

void CuttingOptimizer::initialize_population() {
    population_.clear();
    population_.resize(config_.population_size);
    for (auto& g : population_) {
        g.randomize(demand_.size(), rng_);
        g.generation = 0;
    }
}

// =============================================================================
// Evaluate population in parallel (decode + fitness are pure)
// =============================================================================

void CuttingOptimizer::evaluate_population(size_t skip) {
    const size_t n = population_.size();
    if (skip >= n) return;

    size_t n_threads = config_.n_threads;
    if (n_threads == 0) n_threads = std::thread::hardware_concurrency();
    if (n_threads == 0) n_threads = 4;
    n_threads = std::min(n_threads, n - skip);

    std::vector<double> results(n, 0.0);

    auto worker = [&](size_t start, size_t end) {
        for (size_t idx = start; idx < end; ++idx) {
            results[idx] = evaluate_genotype(population_[idx], demand_,
                                             config_.fitness_weights);
        }
    };

    if (n_threads <= 1) {
        worker(skip, n);
    } else {
        std::vector<std::thread> threads;
        size_t chunk = (n - skip + n_threads - 1) / n_threads;
        for (size_t t = 0; t < n_threads; ++t) {
            size_t start = skip + t * chunk;
            size_t end = std::min(start + chunk, n);
            if (start < end) {
                threads.emplace_back(worker, start, end);
            }
        }
        for (auto& th : threads) th.join();
    }

    for (size_t idx = skip; idx < n; ++idx) {
        population_[idx].fitness = results[idx];
        population_[idx].evaluated = true;
    }
}

// =============================================================================
// Run the full evolutionary loop
// =============================================================================

OptimizationResult CuttingOptimizer::run(const CancelToken* cancel) {
    using Clock = std::chrono::steady_clock;
    auto t_start = Clock::now();

    rng_.seed(config_.random_seed);
    initialize_population();

    OptimizationResult result;
    result.seed = config_.random_seed;

    Genotype best_ever;
    size_t best_ever_beams = 0;
    size_t stall = 0;

    if (config_.verbose) {
        printf("  Parts: %zu (%zu distinct), raw length %s, population %zu, max %zu generations\n",
               demand_.size(), demand_.histogram.size(),
               format_length(demand_.raw_length).c_str(),
               config_.population_size, config_.max_generations);
        fflush(stdout);
    }

    for (size_t gen = 0; gen < config_.max_generations; ++gen) {
        auto t_gen_start = Clock::now();

        // Elite (index 0) already carries its fitness after generation 0
        evaluate_population(gen == 0 ? 0 : 1);
        for (auto& g : population_) g.generation = static_cast<int>(gen);

        if (observer_) observer_(gen, population_);

        const Genotype& gen_best = population_[PopulationManager::best_index(population_)];
        // Sub-tolerance gains are summation-order noise, not a better plan
        if (!best_ever.evaluated || gen_best.fitness < best_ever.fitness - kLengthTolerance) {
            best_ever = gen_best;
            best_ever_beams = decode(best_ever, demand_.raw_length, demand_).beam_count();
            stall = 0;
        } else {
            ++stall;
        }
        result.best_fitness_history.push_back(best_ever.fitness);
        result.generations_run = gen + 1;

        GenerationStats stats;
        stats.generation = gen;
        stats.best_fitness = gen_best.fitness;
        double sum = 0.0;
        for (const auto& g : population_) sum += g.fitness;
        stats.avg_fitness = sum / static_cast<double>(population_.size());
        stats.best_ever_fitness = best_ever.fitness;
        stats.best_ever_beams = best_ever_beams;
        stats.stall = stall;

        if (config_.verbose) {
            float gen_sec = std::chrono::duration<float>(Clock::now() - t_gen_start).count();
            printf("  Gen %3zu/%zu | best=%.4f avg=%.4f | best_ever=%.4f beams=%zu | %.3fs",
                   gen + 1, config_.max_generations, stats.best_fitness, stats.avg_fitness,
                   stats.best_ever_fitness, best_ever_beams, gen_sec);
            if (stall > 0) printf(" [stall=%zu]", stall);
            printf("\n");
            fflush(stdout);
        }

        if (progress_cb_) progress_cb_(stats);

        // A raised token wins over the other stop reasons at the same boundary
        if (cancel && cancel->cancelled()) {
            result.cancelled = true;
            break;
        }
        if (config_.stall_limit > 0 && stall >= config_.stall_limit) {
            result.stopped_by_stall = true;
            break;
        }
        if (gen + 1 == config_.max_generations) break;

        population_ = manager_.next_generation(population_, rng_);
#ifndef NDEBUG
        for (const auto& g : population_) {
            assert(g.is_permutation_of(demand_.size()) && "breeding broke the permutation");
        }
#endif
    }

    result.best = best_ever;
    result.plan = decode(best_ever, demand_.raw_length, demand_);

    if (config_.verbose) {
        float total_sec = std::chrono::duration<float>(Clock::now() - t_start).count();
        printf("\n  Optimization %s after %zu generations: %.3f sec, beams=%zu waste=%s\n",
               result.cancelled ? "cancelled" : (result.stopped_by_stall ? "converged" : "complete"),
               result.generations_run, total_sec, result.plan.beam_count(),
               format_length(result.plan.genotype_waste()).c_str());
        printf("    %s\n", result.best.summary().c_str());
        fflush(stdout);
    }

    return result;
}

} // namespace cutstock
