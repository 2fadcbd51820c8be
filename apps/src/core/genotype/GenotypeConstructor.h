#pragma once

#include "ActivationFunction.h"
#include "Genotype.h"
#include "core/Result.h"

#include <nlohmann/json.hpp>
#include <random>
#include <string>
#include <vector>

namespace NeuroEvo {

class InterfaceRegistry;

/**
 * Shape of freshly constructed genotypes: a layered, fully connected
 * feed-forward network. The output layer is sized to the total actuator
 * vector length, so it is not listed in hiddenLayerDensities.
 */
struct GenotypeSpec {
    std::vector<std::string> sensors = { "rng" };
    std::vector<std::string> actuators = { "pts" };
    std::vector<int> hiddenLayerDensities = { 3 };
    ActivationFunction hiddenActivation = ActivationFunction::Tanh;
    ActivationFunction outputActivation = ActivationFunction::Tanh;
    double initialWeightRange = 0.5; // Weights and biases drawn from [-range, range].
};

struct InterfaceShape {
    std::string name;
    int vectorLength = 0;

    bool operator==(const InterfaceShape&) const = default;
};

// GenotypeSpec with interface names resolved to vector lengths.
struct InterfaceLayout {
    std::vector<InterfaceShape> sensors;
    std::vector<InterfaceShape> actuators;
    std::vector<int> hiddenLayerDensities;
    ActivationFunction hiddenActivation = ActivationFunction::Tanh;
    ActivationFunction outputActivation = ActivationFunction::Tanh;
    double initialWeightRange = 0.5;
};

Result<InterfaceLayout, std::string> resolveLayout(
    const GenotypeSpec& spec, const InterfaceRegistry& registry);

Genotype constructGenotype(GenotypeId id, const InterfaceLayout& layout, std::mt19937& rng);

Result<Genotype, std::string> constructGenotype(
    GenotypeId id, const GenotypeSpec& spec, const InterfaceRegistry& registry, std::mt19937& rng);

void to_json(nlohmann::json& j, const GenotypeSpec& spec);
void from_json(const nlohmann::json& j, GenotypeSpec& spec);

} // namespace NeuroEvo
