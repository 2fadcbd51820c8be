#pragma once

#include "Message.h"
#include "core/Result.h"
#include "core/genotype/ActivationFunction.h"
#include "core/genotype/Genotype.h"

#include <string>
#include <vector>

namespace NeuroEvo {
namespace Cortex {

struct SensorBlueprint {
    NodeId id;
    std::string name;
    int vectorLength = 0;
    std::vector<NodeId> fanOut;
};

struct NeuronBlueprint {
    NodeId id;
    ActivationFunction activation = ActivationFunction::Tanh;
    std::vector<WeightedInput> inputs;
    double bias = 0.0;
    std::vector<NodeId> outputs;
};

struct ActuatorBlueprint {
    NodeId id;
    std::string name;
    int vectorLength = 0;
    std::vector<NodeId> fanIn;
};

/**
 * The expressed part of a genotype, wired and validated, ready to be turned
 * into actors. Neurons are listed in topological order.
 *
 * A neuron is expressed when a sensor reaches it through enabled,
 * non-recurrent connections. Recurrent connections never carry signals.
 */
struct Phenotype {
    std::vector<SensorBlueprint> sensors;
    std::vector<NeuronBlueprint> neurons;
    std::vector<ActuatorBlueprint> actuators;
};

Result<Phenotype, std::string> buildPhenotype(const Genotype& genotype);

/**
 * Synchronous forward pass over one sample per sensor (in sensor order).
 * Returns one vector per actuator. Sums are taken in the same order as the
 * actor runtime, so results match it exactly.
 */
Result<std::vector<std::vector<double>>, std::string> evaluateFeedForward(
    const Phenotype& phenotype, const std::vector<std::vector<double>>& sensorSignals);

// Writes a weight snapshot taken from a running network back into a genotype.
Genotype applyBackup(const Genotype& genotype, const std::vector<NeuronBackup>& backup);

} // namespace Cortex
} // namespace NeuroEvo
