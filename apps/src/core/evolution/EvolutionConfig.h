#pragma once

#include "core/ReflectSerializer.h"
#include "core/genotype/ActivationFunction.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace NeuroEvo {

/**
 * Per-offspring mutation probabilities. Weight mutation applies per enabled
 * connection; the structural mutations fire at most once per offspring.
 */
struct MutationConfig {
    double weightMutationRate = 0.8;     // Chance each enabled connection is touched.
    double weightPerturbationRate = 0.9; // Of those, chance of perturb instead of replace.
    double perturbationMagnitude = 0.5;  // Perturbation drawn from [-m, m].
    double weightRange = 2.0;            // Replacement and new weights drawn from [-r, r].
    double addNodeRate = 0.03;
    double addConnectionRate = 0.05;
    double toggleRate = 0.01;
    ActivationFunction addNodeActivation = ActivationFunction::Sigmoid;
};

// c1 * E / N + c2 * D / N + c3 * mean |dw|
struct CompatibilityConfig {
    double excessCoefficient = 1.0;
    double disjointCoefficient = 1.0;
    double weightCoefficient = 0.4;
    int normalizeThreshold = 20; // Genotypes smaller than this use N = 1.
};

struct CrossoverConfig {
    bool blendMatchingWeights = false; // Average matching weights instead of picking one.
};

/**
 * Configuration for the NEAT generation loop.
 */
struct EvolutionConfig {
    int populationSize = 50;
    int tournamentSize = 3;
    double crossoverRate = 0.75;
    double compatibilityThreshold = 3.0;
    int elitismMinSpeciesSize = 5;  // Species with more members keep their champion.
    int stagnationThreshold = 15;   // Generations without improvement before flagging.
    int maxParallelEvaluations = 0; // 0 = auto (use detected core count).
    std::optional<uint32_t> seed;   // Unset = seeded from std::random_device.
    std::optional<std::string> bestGenotypePath; // Champion is saved here when a run completes.

    MutationConfig mutation;
    CompatibilityConfig compatibility;
    CrossoverConfig crossover;
};

inline void to_json(nlohmann::json& j, const MutationConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, MutationConfig& config)
{
    config = ReflectSerializer::from_json<MutationConfig>(j);
}

inline void to_json(nlohmann::json& j, const CompatibilityConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, CompatibilityConfig& config)
{
    config = ReflectSerializer::from_json<CompatibilityConfig>(j);
}

inline void to_json(nlohmann::json& j, const CrossoverConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, CrossoverConfig& config)
{
    config = ReflectSerializer::from_json<CrossoverConfig>(j);
}

inline void to_json(nlohmann::json& j, const EvolutionConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, EvolutionConfig& config)
{
    config = ReflectSerializer::from_json<EvolutionConfig>(j);
}

} // namespace NeuroEvo
