#pragma once

#include "EvaluationResult.h"
#include "Population.h"
#include "core/Result.h"

#include <random>
#include <string>
#include <vector>

namespace NeuroEvo {

class InterfaceRegistry;

// Rejects sizes below one, rates outside [0, 1] and negative weight ranges
// or distance coefficients.
Result<std::monostate, std::string> validateConfig(const EvolutionConfig& config);

/**
 * Generation 0: populationSize fresh genotypes from the layout, speciated.
 */
Population createInitialPopulation(
    const EvolutionConfig& config, const InterfaceLayout& layout, std::mt19937& rng);

Result<Population, std::string> createInitialPopulation(
    const EvolutionConfig& config,
    const GenotypeSpec& spec,
    const InterfaceRegistry& registry,
    std::mt19937& rng);

/**
 * Reassign every genotype to the first species (existing species first, in
 * order) whose representative is closer than the compatibility threshold,
 * founding a new species otherwise. Empty species are dropped and each
 * survivor's first member becomes its representative.
 */
Population speciate(const Population& population);

std::vector<Genotype> unevaluatedGenotypes(const Population& population);

/**
 * Record fitness by genotype id (failed evaluations score 0), share it within
 * species, update species progress and stagnation flags, the all-time best and
 * the statistics history.
 */
Population applyEvaluations(
    const Population& population, const std::vector<EvaluationResult>& results);

/**
 * Offspring per species, proportional to each species' share of the summed
 * mean fitness (negative means count as zero) and rounded. Falls back to an
 * even split when the sum is zero. The counts need not add up exactly to
 * populationSize; nextGeneration() pads or truncates.
 */
std::vector<int> computeOffspringCounts(
    const std::vector<double>& speciesMeanFitness, int populationSize);

/**
 * Breed the next generation from an evaluated population: per-species elitism,
 * tournament selection, crossover and mutation, then pad with fresh genotypes
 * or truncate to exactly populationSize and re-speciate.
 */
Population nextGeneration(const Population& population, std::mt19937& rng);

} // namespace NeuroEvo
