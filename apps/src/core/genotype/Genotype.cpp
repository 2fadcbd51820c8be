#include "Genotype.h"
#include "Innovation.h"
#include "core/ReflectSerializer.h"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace NeuroEvo {

const char* toString(NodeKind kind)
{
    switch (kind) {
        case NodeKind::Sensor:
            return "sensor";
        case NodeKind::Neuron:
            return "neuron";
        case NodeKind::Actuator:
            return "actuator";
        case NodeKind::Bias:
            return "bias";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, NodeKind kind)
{
    j = toString(kind);
}

void from_json(const nlohmann::json& j, NodeKind& kind)
{
    const auto name = j.get<std::string>();
    for (const NodeKind candidate :
         { NodeKind::Sensor, NodeKind::Neuron, NodeKind::Actuator, NodeKind::Bias }) {
        if (name == toString(candidate)) {
            kind = candidate;
            return;
        }
    }
    throw std::runtime_error("Unknown node kind: " + name);
}

const NodeGene* Genotype::findNode(NodeId nodeId) const
{
    const auto it = std::lower_bound(
        nodes.begin(), nodes.end(), nodeInnovation(nodeId), [](const NodeGene& node, Innovation value) {
            return node.innovation < value;
        });
    if (it != nodes.end() && it->id == nodeId) {
        return &*it;
    }
    return nullptr;
}

const ConnectionGene* Genotype::findConnection(NodeId source, int sourceIndex, NodeId target) const
{
    const Innovation innovation = connectionInnovation(source, sourceIndex, target);
    const auto it = std::lower_bound(
        connections.begin(),
        connections.end(),
        innovation,
        [](const ConnectionGene& connection, Innovation value) {
            return connection.innovation < value;
        });
    if (it != connections.end() && it->innovation == innovation) {
        return &*it;
    }
    return nullptr;
}

ConnectionGene* Genotype::findConnection(NodeId source, int sourceIndex, NodeId target)
{
    return const_cast<ConnectionGene*>(
        static_cast<const Genotype&>(*this).findConnection(source, sourceIndex, target));
}

bool Genotype::isBiasConnection(const ConnectionGene& connection) const
{
    return connection.sourceId == biasNodeId();
}

int Genotype::outputWidth(NodeId nodeId) const
{
    for (const auto& sensor : sensors) {
        if (sensor.id == nodeId) {
            return sensor.vectorLength;
        }
    }
    return 1;
}

std::vector<NodeId> Genotype::neuronIds() const
{
    std::vector<NodeId> ids;
    for (const auto& node : nodes) {
        if (node.kind == NodeKind::Neuron) {
            ids.push_back(node.id);
        }
    }
    return ids;
}

bool Genotype::reaches(NodeId from, NodeId to) const
{
    if (from == to) {
        return true;
    }

    std::unordered_map<NodeId, std::vector<NodeId>> successors;
    for (const auto& connection : connections) {
        if (!connection.recurrent) {
            successors[connection.sourceId].push_back(connection.targetId);
        }
    }

    std::vector<NodeId> stack{ from };
    std::unordered_set<NodeId> visited{ from };
    while (!stack.empty()) {
        const NodeId current = stack.back();
        stack.pop_back();
        const auto it = successors.find(current);
        if (it == successors.end()) {
            continue;
        }
        for (const NodeId next : it->second) {
            if (next == to) {
                return true;
            }
            if (visited.insert(next).second) {
                stack.push_back(next);
            }
        }
    }
    return false;
}

int Genotype::activeInputCount(NodeId neuronId) const
{
    int count = 0;
    for (const auto& connection : connections) {
        if (connection.targetId == neuronId && connection.enabled && !connection.recurrent
            && !isBiasConnection(connection)) {
            count++;
        }
    }
    return count;
}

void Genotype::addNode(const NodeGene& node)
{
    const auto it = std::lower_bound(
        nodes.begin(), nodes.end(), node.innovation, [](const NodeGene& existing, Innovation value) {
            return existing.innovation < value;
        });
    nodes.insert(it, node);
}

void Genotype::addConnection(const ConnectionGene& connection)
{
    const auto it = std::lower_bound(
        connections.begin(),
        connections.end(),
        connection.innovation,
        [](const ConnectionGene& existing, Innovation value) { return existing.innovation < value; });
    connections.insert(it, connection);
}

void Genotype::sortGenes()
{
    std::sort(nodes.begin(), nodes.end(), [](const NodeGene& a, const NodeGene& b) {
        return a.innovation < b.innovation;
    });
    std::sort(
        connections.begin(), connections.end(), [](const ConnectionGene& a, const ConnectionGene& b) {
            return a.innovation < b.innovation;
        });
}

void Genotype::resetEvaluation()
{
    fitness = 0.0;
    adjustedFitness = 0.0;
    evaluated = false;
    evaluationFailed = false;
}

NodeGene makeNodeGene(NodeId id, NodeKind kind, ActivationFunction activation, int layer)
{
    return NodeGene{
        .id = id,
        .kind = kind,
        .activation = activation,
        .layer = layer,
        .innovation = nodeInnovation(id),
    };
}

ConnectionGene makeConnectionGene(
    NodeId source, int sourceIndex, NodeId target, double weight, bool recurrent)
{
    return ConnectionGene{
        .sourceId = source,
        .sourceIndex = sourceIndex,
        .targetId = target,
        .weight = weight,
        .enabled = true,
        .recurrent = recurrent,
        .innovation = connectionInnovation(source, sourceIndex, target),
    };
}

void to_json(nlohmann::json& j, const NodeGene& node)
{
    j = ReflectSerializer::to_json(node);
}

void from_json(const nlohmann::json& j, NodeGene& node)
{
    node = ReflectSerializer::from_json<NodeGene>(j);
}

void to_json(nlohmann::json& j, const ConnectionGene& connection)
{
    j = ReflectSerializer::to_json(connection);
}

void from_json(const nlohmann::json& j, ConnectionGene& connection)
{
    connection = ReflectSerializer::from_json<ConnectionGene>(j);
}

void to_json(nlohmann::json& j, const SensorRef& sensor)
{
    j = ReflectSerializer::to_json(sensor);
}

void from_json(const nlohmann::json& j, SensorRef& sensor)
{
    sensor = ReflectSerializer::from_json<SensorRef>(j);
}

void to_json(nlohmann::json& j, const ActuatorRef& actuator)
{
    j = ReflectSerializer::to_json(actuator);
}

void from_json(const nlohmann::json& j, ActuatorRef& actuator)
{
    actuator = ReflectSerializer::from_json<ActuatorRef>(j);
}

} // namespace NeuroEvo
