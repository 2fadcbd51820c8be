#pragma once

#include "EvolutionConfig.h"

#include <random>

namespace NeuroEvo {

struct Genotype;

struct MutationStats {
    int weightPerturbations = 0;
    int weightResets = 0;
    int nodesAdded = 0;
    int connectionsAdded = 0;
    int recurrentConnectionsAdded = 0;
    int connectionsToggled = 0;

    int totalChanges() const
    {
        return weightPerturbations + weightResets + nodesAdded + connectionsAdded
            + connectionsToggled;
    }
};

/**
 * Derive a child from a parent: weight mutation, then add-node, add-connection
 * and toggle, each gated by its own rate. The child keeps the parent's id and
 * comes back unevaluated. Deterministic for a given rng state.
 */
Genotype mutate(
    const Genotype& parent,
    const MutationConfig& config,
    std::mt19937& rng,
    MutationStats* stats = nullptr);

// Individual operators, applied in place. Each returns false when the
// genotype offers no valid site for it.
void mutateWeights(
    Genotype& genotype, const MutationConfig& config, std::mt19937& rng, MutationStats* stats);
bool mutateAddNode(Genotype& genotype, const MutationConfig& config, std::mt19937& rng);
bool mutateAddConnection(
    Genotype& genotype, const MutationConfig& config, std::mt19937& rng, bool* recurrent = nullptr);
bool mutateToggleConnection(Genotype& genotype, std::mt19937& rng);

} // namespace NeuroEvo
