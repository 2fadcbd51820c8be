#pragma once

#include <random>
#include <vector>

namespace NeuroEvo {

struct Genotype;

/**
 * Tournament selection: pick k random candidates (with replacement), return
 * the fittest. k is clamped to [1, candidates.size()]. Ties go to the
 * candidate drawn first.
 */
const Genotype& tournamentSelect(
    const std::vector<const Genotype*>& candidates, int tournamentSize, std::mt19937& rng);

} // namespace NeuroEvo
