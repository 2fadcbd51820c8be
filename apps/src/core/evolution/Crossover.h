#pragma once

#include "EvolutionConfig.h"
#include "core/genotype/GenotypeIds.h"

#include <random>

namespace NeuroEvo {

struct Genotype;

/**
 * NEAT crossover. The fitter parent (`a` on ties) supplies the structure:
 * its disjoint and excess genes, interfaces and species. Matching genes take
 * weight and enabled state from a random parent (or the mean weight when
 * blending). Node genes are the union of both parents.
 *
 * The child is unevaluated, has id `childId` and was created one generation
 * after the fitter parent.
 */
Genotype crossover(
    const Genotype& a,
    const Genotype& b,
    GenotypeId childId,
    const CrossoverConfig& config,
    std::mt19937& rng);

} // namespace NeuroEvo
