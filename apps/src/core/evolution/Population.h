#pragma once

#include "EvolutionConfig.h"
#include "Species.h"
#include "core/genotype/GenotypeConstructor.h"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace NeuroEvo {

struct GenerationStats {
    int generation = 0;
    double bestFitness = 0.0;
    double meanFitness = 0.0;
    int speciesCount = 0;
    int evaluations = 0;
    int failedEvaluations = 0;
    std::vector<SpeciesId> stagnantSpecies;
};

/**
 * One generation of the run as a value. Every population transition takes a
 * Population and returns a new one.
 */
struct Population {
    int generation = 0;
    std::map<GenotypeId, Genotype> genotypes;
    std::vector<Species> species;
    EvolutionConfig config;
    InterfaceLayout layout; // Shape of fresh random genotypes.

    GenotypeId nextGenotypeId{ 1 };
    SpeciesId nextSpeciesId{ 1 };

    std::optional<Genotype> best; // Fittest genotype seen in any generation.
    std::vector<GenerationStats> history;

    const Genotype* find(GenotypeId id) const
    {
        const auto it = genotypes.find(id);
        return it == genotypes.end() ? nullptr : &it->second;
    }

    size_t size() const { return genotypes.size(); }
};

inline void to_json(nlohmann::json& j, const GenerationStats& stats)
{
    j = ReflectSerializer::to_json(stats);
}

inline void from_json(const nlohmann::json& j, GenerationStats& stats)
{
    stats = ReflectSerializer::from_json<GenerationStats>(j);
}

} // namespace NeuroEvo
