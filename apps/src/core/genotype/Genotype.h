#pragma once

#include "ActivationFunction.h"
#include "GenotypeIds.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include <zpp_bits.h>

namespace NeuroEvo {

enum class NodeKind : uint8_t { Sensor, Neuron, Actuator, Bias };

const char* toString(NodeKind kind);
void to_json(nlohmann::json& j, NodeKind kind);
void from_json(const nlohmann::json& j, NodeKind& kind);

struct NodeGene {
    NodeId id;
    NodeKind kind = NodeKind::Neuron;
    ActivationFunction activation = ActivationFunction::Tanh;
    int layer = 0;
    Innovation innovation = 0;

    bool operator==(const NodeGene&) const = default;

    using serialize = zpp::bits::members<5>;
};

/**
 * Weighted link from element `sourceIndex` of the source's output vector to a
 * target neuron. Scalar sources (neurons, bias) always use index 0.
 */
struct ConnectionGene {
    NodeId sourceId;
    int sourceIndex = 0;
    NodeId targetId;
    double weight = 0.0;
    bool enabled = true;
    bool recurrent = false;
    Innovation innovation = 0;

    bool operator==(const ConnectionGene&) const = default;

    using serialize = zpp::bits::members<7>;
};

struct SensorRef {
    NodeId id;
    std::string name;
    int vectorLength = 0;

    bool operator==(const SensorRef&) const = default;

    using serialize = zpp::bits::members<3>;
};

struct ActuatorRef {
    NodeId id;
    std::string name;
    int vectorLength = 0;
    std::vector<NodeId> fanInIds; // Output neurons, in actuator vector order.

    bool operator==(const ActuatorRef&) const = default;

    using serialize = zpp::bits::members<4>;
};

/**
 * One candidate network. A plain value: operators copy it and return new
 * genotypes rather than editing shared state.
 *
 * Invariants kept by every operator:
 * - nodes and connections are sorted by innovation number;
 * - every neuron has exactly one connection from the bias node (its bias);
 * - no two enabled connections share (source, sourceIndex, target);
 * - connections with recurrent == false form a DAG.
 */
struct Genotype {
    GenotypeId id;
    std::vector<NodeGene> nodes;
    std::vector<ConnectionGene> connections;
    std::vector<SensorRef> sensors;
    std::vector<ActuatorRef> actuators;

    double fitness = 0.0;
    double adjustedFitness = 0.0;
    std::optional<SpeciesId> speciesId;
    int generationCreated = 0;
    bool evaluated = false;
    bool evaluationFailed = false;

    const NodeGene* findNode(NodeId nodeId) const;
    const ConnectionGene* findConnection(NodeId source, int sourceIndex, NodeId target) const;
    ConnectionGene* findConnection(NodeId source, int sourceIndex, NodeId target);

    bool hasNode(NodeId nodeId) const { return findNode(nodeId) != nullptr; }
    bool isBiasConnection(const ConnectionGene& connection) const;

    // Width of a node's output vector: sensor vector length, otherwise 1.
    int outputWidth(NodeId nodeId) const;

    std::vector<NodeId> neuronIds() const;

    // True if `to` can be reached from `from` along non-recurrent connections
    // (enabled or disabled).
    bool reaches(NodeId from, NodeId to) const;

    // Enabled, non-recurrent, non-bias inputs of a neuron.
    int activeInputCount(NodeId neuronId) const;

    void addNode(const NodeGene& node);
    void addConnection(const ConnectionGene& connection);
    void sortGenes();

    // Forget evaluation results; used when a new individual is derived.
    void resetEvaluation();
};

NodeGene makeNodeGene(NodeId id, NodeKind kind, ActivationFunction activation, int layer);
ConnectionGene makeConnectionGene(
    NodeId source, int sourceIndex, NodeId target, double weight, bool recurrent = false);

void to_json(nlohmann::json& j, const NodeGene& node);
void from_json(const nlohmann::json& j, NodeGene& node);
void to_json(nlohmann::json& j, const ConnectionGene& connection);
void from_json(const nlohmann::json& j, ConnectionGene& connection);
void to_json(nlohmann::json& j, const SensorRef& sensor);
void from_json(const nlohmann::json& j, SensorRef& sensor);
void to_json(nlohmann::json& j, const ActuatorRef& actuator);
void from_json(const nlohmann::json& j, ActuatorRef& actuator);

} // namespace NeuroEvo
