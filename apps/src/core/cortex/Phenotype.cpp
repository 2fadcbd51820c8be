#include "Phenotype.h"
#include "core/genotype/Innovation.h"

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace NeuroEvo {
namespace Cortex {

namespace {

std::string idString(NodeId id)
{
    return std::to_string(id.get());
}

} // namespace

Result<Phenotype, std::string> buildPhenotype(const Genotype& genotype)
{
    using PhenotypeResult = Result<Phenotype, std::string>;

    if (genotype.sensors.empty()) {
        return PhenotypeResult::error("Genotype has no sensors");
    }
    if (genotype.actuators.empty()) {
        return PhenotypeResult::error("Genotype has no actuators");
    }

    std::unordered_set<NodeId> sensorIds;
    for (const auto& sensor : genotype.sensors) {
        const NodeGene* node = genotype.findNode(sensor.id);
        if (!node || node->kind != NodeKind::Sensor) {
            return PhenotypeResult::error("Sensor " + sensor.name + " has no sensor node gene");
        }
        if (sensor.vectorLength <= 0) {
            return PhenotypeResult::error("Sensor " + sensor.name + " has no outputs");
        }
        sensorIds.insert(sensor.id);
    }

    // Signal-carrying edges, grouped by source.
    std::unordered_map<NodeId, std::vector<const ConnectionGene*>> outgoing;
    for (const auto& connection : genotype.connections) {
        if (!connection.enabled || connection.recurrent || genotype.isBiasConnection(connection)) {
            continue;
        }
        const NodeGene* target = genotype.findNode(connection.targetId);
        if (!target || target->kind != NodeKind::Neuron) {
            return PhenotypeResult::error(
                "Connection " + std::to_string(connection.innovation) + " does not target a neuron");
        }
        const NodeGene* source = genotype.findNode(connection.sourceId);
        if (!source || (source->kind != NodeKind::Sensor && source->kind != NodeKind::Neuron)) {
            return PhenotypeResult::error(
                "Connection " + std::to_string(connection.innovation)
                + " has an invalid source node");
        }
        if (connection.sourceIndex < 0
            || connection.sourceIndex >= genotype.outputWidth(connection.sourceId)) {
            return PhenotypeResult::error(
                "Connection " + std::to_string(connection.innovation)
                + " reads past the end of its source vector");
        }
        outgoing[connection.sourceId].push_back(&connection);
    }

    // Expressed neurons: everything a sensor reaches.
    std::unordered_set<NodeId> active;
    std::deque<NodeId> frontier(sensorIds.begin(), sensorIds.end());
    while (!frontier.empty()) {
        const NodeId current = frontier.front();
        frontier.pop_front();
        const auto it = outgoing.find(current);
        if (it == outgoing.end()) {
            continue;
        }
        for (const ConnectionGene* connection : it->second) {
            if (active.insert(connection->targetId).second) {
                frontier.push_back(connection->targetId);
            }
        }
    }

    Phenotype phenotype;
    std::unordered_map<NodeId, size_t> neuronIndex;
    std::vector<NeuronBlueprint> neurons;
    for (const auto& node : genotype.nodes) {
        if (node.kind != NodeKind::Neuron || !active.contains(node.id)) {
            continue;
        }
        neuronIndex[node.id] = neurons.size();
        neurons.push_back({ .id = node.id, .activation = node.activation });
    }

    const NodeId bias = biasNodeId();
    for (const auto& connection : genotype.connections) {
        const auto target = neuronIndex.find(connection.targetId);
        if (target == neuronIndex.end()) {
            continue;
        }
        NeuronBlueprint& neuron = neurons[target->second];

        if (connection.sourceId == bias) {
            if (connection.enabled) {
                neuron.bias = connection.weight;
            }
            continue;
        }
        if (!connection.enabled || connection.recurrent) {
            continue;
        }
        if (!sensorIds.contains(connection.sourceId) && !active.contains(connection.sourceId)) {
            continue;
        }

        auto input = std::find_if(
            neuron.inputs.begin(), neuron.inputs.end(), [&](const WeightedInput& existing) {
                return existing.sourceId == connection.sourceId;
            });
        if (input == neuron.inputs.end()) {
            neuron.inputs.push_back(
                { .sourceId = connection.sourceId,
                  .weights = std::vector<double>(genotype.outputWidth(connection.sourceId), 0.0) });
            input = std::prev(neuron.inputs.end());
        }
        input->weights[connection.sourceIndex] = connection.weight;
    }

    for (const auto& neuron : neurons) {
        if (neuron.inputs.empty()) {
            return PhenotypeResult::error("Neuron " + idString(neuron.id) + " has an empty fan-in");
        }
        for (const auto& input : neuron.inputs) {
            if (!sensorIds.contains(input.sourceId)) {
                neurons[neuronIndex[input.sourceId]].outputs.push_back(neuron.id);
            }
        }
    }

    for (const auto& actuator : genotype.actuators) {
        const NodeGene* node = genotype.findNode(actuator.id);
        if (!node || node->kind != NodeKind::Actuator) {
            return PhenotypeResult::error(
                "Actuator " + actuator.name + " has no actuator node gene");
        }
        if (actuator.fanInIds.empty()) {
            return PhenotypeResult::error("Actuator " + actuator.name + " has an empty fan-in");
        }
        if (static_cast<int>(actuator.fanInIds.size()) != actuator.vectorLength) {
            return PhenotypeResult::error(
                "Actuator " + actuator.name + " expects " + std::to_string(actuator.vectorLength)
                + " inputs but has " + std::to_string(actuator.fanInIds.size()));
        }

        std::unordered_set<NodeId> seen;
        for (const NodeId fanIn : actuator.fanInIds) {
            if (!seen.insert(fanIn).second) {
                return PhenotypeResult::error(
                    "Actuator " + actuator.name + " lists neuron " + idString(fanIn) + " twice");
            }
            const auto it = neuronIndex.find(fanIn);
            if (it == neuronIndex.end()) {
                return PhenotypeResult::error(
                    "Actuator " + actuator.name + " reads neuron " + idString(fanIn)
                    + ", which no sensor reaches");
            }
            neurons[it->second].outputs.push_back(actuator.id);
        }

        phenotype.actuators.push_back(
            { .id = actuator.id,
              .name = actuator.name,
              .vectorLength = actuator.vectorLength,
              .fanIn = actuator.fanInIds });
    }

    for (const auto& sensor : genotype.sensors) {
        SensorBlueprint blueprint{
            .id = sensor.id, .name = sensor.name, .vectorLength = sensor.vectorLength, .fanOut = {}
        };
        for (const auto& neuron : neurons) {
            for (const auto& input : neuron.inputs) {
                if (input.sourceId == sensor.id) {
                    blueprint.fanOut.push_back(neuron.id);
                }
            }
        }
        phenotype.sensors.push_back(std::move(blueprint));
    }

    // Kahn's algorithm over neuron-to-neuron edges.
    std::vector<int> pending(neurons.size(), 0);
    for (size_t i = 0; i < neurons.size(); ++i) {
        for (const auto& input : neurons[i].inputs) {
            if (!sensorIds.contains(input.sourceId)) {
                pending[i]++;
            }
        }
    }
    std::deque<size_t> ready;
    for (size_t i = 0; i < neurons.size(); ++i) {
        if (pending[i] == 0) {
            ready.push_back(i);
        }
    }
    while (!ready.empty()) {
        const size_t index = ready.front();
        ready.pop_front();
        phenotype.neurons.push_back(neurons[index]);
        for (const NodeId output : neurons[index].outputs) {
            const auto it = neuronIndex.find(output);
            if (it != neuronIndex.end() && --pending[it->second] == 0) {
                ready.push_back(it->second);
            }
        }
    }
    if (phenotype.neurons.size() != neurons.size()) {
        return PhenotypeResult::error("Non-recurrent connections form a cycle");
    }

    return PhenotypeResult::okay(std::move(phenotype));
}

Result<std::vector<std::vector<double>>, std::string> evaluateFeedForward(
    const Phenotype& phenotype, const std::vector<std::vector<double>>& sensorSignals)
{
    using OutputResult = Result<std::vector<std::vector<double>>, std::string>;

    if (sensorSignals.size() != phenotype.sensors.size()) {
        return OutputResult::error(
            "Expected " + std::to_string(phenotype.sensors.size()) + " sensor signals, got "
            + std::to_string(sensorSignals.size()));
    }

    std::unordered_map<NodeId, std::vector<double>> signals;
    for (size_t i = 0; i < phenotype.sensors.size(); ++i) {
        const auto& sensor = phenotype.sensors[i];
        if (static_cast<int>(sensorSignals[i].size()) != sensor.vectorLength) {
            return OutputResult::error("Sensor " + sensor.name + " signal has the wrong length");
        }
        signals[sensor.id] = sensorSignals[i];
    }

    for (const auto& neuron : phenotype.neurons) {
        double accumulator = 0.0;
        for (const auto& input : neuron.inputs) {
            const auto& signal = signals.at(input.sourceId);
            double dot = 0.0;
            for (size_t k = 0; k < input.weights.size(); ++k) {
                dot += signal[k] * input.weights[k];
            }
            accumulator += dot;
        }
        signals[neuron.id] = { applyActivation(neuron.activation, accumulator + neuron.bias) };
    }

    std::vector<std::vector<double>> outputs;
    for (const auto& actuator : phenotype.actuators) {
        std::vector<double> output;
        for (const NodeId fanIn : actuator.fanIn) {
            const auto& signal = signals.at(fanIn);
            output.insert(output.end(), signal.begin(), signal.end());
        }
        outputs.push_back(std::move(output));
    }
    return OutputResult::okay(std::move(outputs));
}

Genotype applyBackup(const Genotype& genotype, const std::vector<NeuronBackup>& backup)
{
    Genotype updated = genotype;
    const NodeId bias = biasNodeId();

    for (const auto& neuron : backup) {
        for (const auto& input : neuron.inputs) {
            for (size_t k = 0; k < input.weights.size(); ++k) {
                ConnectionGene* connection =
                    updated.findConnection(input.sourceId, static_cast<int>(k), neuron.neuronId);
                if (connection && connection->enabled && !connection->recurrent) {
                    connection->weight = input.weights[k];
                }
            }
        }
        if (ConnectionGene* connection = updated.findConnection(bias, 0, neuron.neuronId)) {
            connection->weight = neuron.bias;
        }
    }
    return updated;
}

} // namespace Cortex
} // namespace NeuroEvo
