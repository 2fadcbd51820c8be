#include "Selection.h"

#include "core/Assert.h"
#include "core/genotype/Genotype.h"

#include <algorithm>

namespace NeuroEvo {

const Genotype& tournamentSelect(
    const std::vector<const Genotype*>& candidates, int tournamentSize, std::mt19937& rng)
{
    NEUROEVO_ASSERT(!candidates.empty(), "Tournament needs at least one candidate");

    const int k = std::clamp(tournamentSize, 1, static_cast<int>(candidates.size()));
    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);

    const Genotype* best = candidates[dist(rng)];
    for (int i = 1; i < k; ++i) {
        const Genotype* challenger = candidates[dist(rng)];
        if (challenger->fitness > best->fitness) {
            best = challenger;
        }
    }
    return *best;
}

} // namespace NeuroEvo
