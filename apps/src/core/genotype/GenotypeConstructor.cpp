#include "GenotypeConstructor.h"
#include "Innovation.h"
#include "core/LoggingChannels.h"
#include "core/ReflectSerializer.h"
#include "core/cortex/InterfaceRegistry.h"

namespace NeuroEvo {

Result<InterfaceLayout, std::string> resolveLayout(
    const GenotypeSpec& spec, const InterfaceRegistry& registry)
{
    using LayoutResult = Result<InterfaceLayout, std::string>;

    if (spec.sensors.empty()) {
        return LayoutResult::error("Genotype spec has no sensors");
    }
    if (spec.actuators.empty()) {
        return LayoutResult::error("Genotype spec has no actuators");
    }
    for (const int density : spec.hiddenLayerDensities) {
        if (density <= 0) {
            return LayoutResult::error(
                "Hidden layer density must be positive, got " + std::to_string(density));
        }
    }
    if (spec.initialWeightRange < 0.0) {
        return LayoutResult::error("Initial weight range must not be negative");
    }

    InterfaceLayout layout{
        .sensors = {},
        .actuators = {},
        .hiddenLayerDensities = spec.hiddenLayerDensities,
        .hiddenActivation = spec.hiddenActivation,
        .outputActivation = spec.outputActivation,
        .initialWeightRange = spec.initialWeightRange,
    };

    for (const auto& name : spec.sensors) {
        const SensorInterface* sensor = registry.findSensor(name);
        if (!sensor) {
            return LayoutResult::error("Unknown sensor: " + name);
        }
        layout.sensors.push_back({ .name = name, .vectorLength = sensor->vectorLength });
    }
    for (const auto& name : spec.actuators) {
        const ActuatorInterface* actuator = registry.findActuator(name);
        if (!actuator) {
            return LayoutResult::error("Unknown actuator: " + name);
        }
        layout.actuators.push_back({ .name = name, .vectorLength = actuator->vectorLength });
    }

    return LayoutResult::okay(std::move(layout));
}

Genotype constructGenotype(GenotypeId id, const InterfaceLayout& layout, std::mt19937& rng)
{
    std::uniform_real_distribution<double> weightDist(
        -layout.initialWeightRange, layout.initialWeightRange);

    Genotype genotype;
    genotype.id = id;

    const NodeId bias = biasNodeId();
    genotype.nodes.push_back(makeNodeGene(bias, NodeKind::Bias, ActivationFunction::Linear, 0));

    // Previous layer as (node, element) sources.
    std::vector<std::pair<NodeId, int>> previous;
    for (size_t i = 0; i < layout.sensors.size(); ++i) {
        const auto& shape = layout.sensors[i];
        const NodeId sensorId = sensorNodeId(shape.name, static_cast<int>(i));
        genotype.nodes.push_back(
            makeNodeGene(sensorId, NodeKind::Sensor, ActivationFunction::Linear, 0));
        genotype.sensors.push_back(
            { .id = sensorId, .name = shape.name, .vectorLength = shape.vectorLength });
        for (int element = 0; element < shape.vectorLength; ++element) {
            previous.emplace_back(sensorId, element);
        }
    }

    int outputWidth = 0;
    for (const auto& shape : layout.actuators) {
        outputWidth += shape.vectorLength;
    }

    std::vector<int> densities = layout.hiddenLayerDensities;
    densities.push_back(outputWidth);

    std::vector<NodeId> outputNeurons;
    for (size_t layerIndex = 0; layerIndex < densities.size(); ++layerIndex) {
        const int layer = static_cast<int>(layerIndex) + 1;
        const bool isOutputLayer = layerIndex + 1 == densities.size();
        const ActivationFunction activation =
            isOutputLayer ? layout.outputActivation : layout.hiddenActivation;

        std::vector<std::pair<NodeId, int>> current;
        for (int index = 0; index < densities[layerIndex]; ++index) {
            const NodeId neuronId = layerNeuronId(layer, index);
            genotype.nodes.push_back(makeNodeGene(neuronId, NodeKind::Neuron, activation, layer));
            for (const auto& [source, element] : previous) {
                genotype.connections.push_back(
                    makeConnectionGene(source, element, neuronId, weightDist(rng)));
            }
            genotype.connections.push_back(makeConnectionGene(bias, 0, neuronId, weightDist(rng)));
            current.emplace_back(neuronId, 0);
            if (isOutputLayer) {
                outputNeurons.push_back(neuronId);
            }
        }
        previous = std::move(current);
    }

    const int actuatorLayer = static_cast<int>(densities.size()) + 1;
    size_t nextOutput = 0;
    for (size_t i = 0; i < layout.actuators.size(); ++i) {
        const auto& shape = layout.actuators[i];
        const NodeId actuatorId = actuatorNodeId(shape.name, static_cast<int>(i));
        genotype.nodes.push_back(
            makeNodeGene(actuatorId, NodeKind::Actuator, ActivationFunction::Linear, actuatorLayer));

        ActuatorRef ref{ .id = actuatorId, .name = shape.name, .vectorLength = shape.vectorLength };
        for (int element = 0; element < shape.vectorLength; ++element) {
            ref.fanInIds.push_back(outputNeurons[nextOutput++]);
        }
        genotype.actuators.push_back(std::move(ref));
    }

    genotype.sortGenes();

    LOG_DEBUG(
        Evolution,
        "Constructed genotype {} with {} nodes, {} connections",
        genotype.id,
        genotype.nodes.size(),
        genotype.connections.size());

    return genotype;
}

Result<Genotype, std::string> constructGenotype(
    GenotypeId id, const GenotypeSpec& spec, const InterfaceRegistry& registry, std::mt19937& rng)
{
    auto layout = resolveLayout(spec, registry);
    if (layout.isError()) {
        return Result<Genotype, std::string>::error(layout.errorValue());
    }
    return Result<Genotype, std::string>::okay(constructGenotype(id, layout.value(), rng));
}

void to_json(nlohmann::json& j, const GenotypeSpec& spec)
{
    j = ReflectSerializer::to_json(spec);
}

void from_json(const nlohmann::json& j, GenotypeSpec& spec)
{
    spec = ReflectSerializer::from_json<GenotypeSpec>(j);
}

} // namespace NeuroEvo
