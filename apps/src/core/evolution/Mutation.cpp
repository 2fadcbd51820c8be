#include "Mutation.h"

#include "core/LoggingChannels.h"
#include "core/genotype/Genotype.h"
#include "core/genotype/Innovation.h"

#include <unordered_set>

namespace NeuroEvo {

namespace {

struct ConnectionSite {
    NodeId source;
    int sourceIndex;
    NodeId target;
};

template <typename T>
const T& pickOne(const std::vector<T>& items, std::mt19937& rng)
{
    std::uniform_int_distribution<size_t> dist(0, items.size() - 1);
    return items[dist(rng)];
}

} // namespace

void mutateWeights(
    Genotype& genotype, const MutationConfig& config, std::mt19937& rng, MutationStats* stats)
{
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_real_distribution<double> perturbation(
        -config.perturbationMagnitude, config.perturbationMagnitude);
    std::uniform_real_distribution<double> fresh(-config.weightRange, config.weightRange);

    for (auto& connection : genotype.connections) {
        if (!connection.enabled) {
            continue;
        }
        if (coin(rng) >= config.weightMutationRate) {
            continue;
        }
        if (coin(rng) < config.weightPerturbationRate) {
            connection.weight += perturbation(rng);
            if (stats) {
                stats->weightPerturbations++;
            }
        }
        else {
            connection.weight = fresh(rng);
            if (stats) {
                stats->weightResets++;
            }
        }
    }
}

bool mutateAddNode(Genotype& genotype, const MutationConfig& config, std::mt19937& rng)
{
    std::vector<size_t> candidates;
    for (size_t i = 0; i < genotype.connections.size(); ++i) {
        const auto& connection = genotype.connections[i];
        if (!connection.enabled || connection.recurrent || genotype.isBiasConnection(connection)) {
            continue;
        }
        const NodeId split =
            splitNeuronId(connection.sourceId, connection.sourceIndex, connection.targetId);
        // Already split here; the node may exist alone (inherited by crossover).
        if (genotype.findConnection(connection.sourceId, connection.sourceIndex, split)
            || genotype.findConnection(split, 0, connection.targetId)) {
            continue;
        }
        if (genotype.hasNode(split)
            && (genotype.reaches(split, connection.sourceId)
                || genotype.reaches(connection.targetId, split))) {
            continue;
        }
        candidates.push_back(i);
    }
    if (candidates.empty()) {
        return false;
    }

    ConnectionGene& original = genotype.connections[pickOne(candidates, rng)];
    original.enabled = false;
    const ConnectionGene split = original;

    const NodeId neuronId = splitNeuronId(split.sourceId, split.sourceIndex, split.targetId);
    const NodeGene* sourceNode = genotype.findNode(split.sourceId);
    const int layer = sourceNode ? sourceNode->layer : 0;

    if (!genotype.hasNode(neuronId)) {
        genotype.addNode(makeNodeGene(neuronId, NodeKind::Neuron, config.addNodeActivation, layer));
    }
    genotype.addConnection(makeConnectionGene(split.sourceId, split.sourceIndex, neuronId, 1.0));
    genotype.addConnection(makeConnectionGene(neuronId, 0, split.targetId, split.weight));
    if (!genotype.findConnection(biasNodeId(), 0, neuronId)) {
        genotype.addConnection(makeConnectionGene(biasNodeId(), 0, neuronId, 0.0));
    }

    LOG_TRACE(Evolution, "Genotype {}: split {} with neuron {}", genotype.id, split.innovation, neuronId);
    return true;
}

bool mutateAddConnection(
    Genotype& genotype, const MutationConfig& config, std::mt19937& rng, bool* recurrent)
{
    std::vector<std::pair<NodeId, int>> sources;
    std::vector<NodeId> targets;
    for (const auto& node : genotype.nodes) {
        if (node.kind == NodeKind::Neuron) {
            sources.emplace_back(node.id, 0);
            targets.push_back(node.id);
        }
    }
    for (const auto& sensor : genotype.sensors) {
        for (int element = 0; element < sensor.vectorLength; ++element) {
            sources.emplace_back(sensor.id, element);
        }
    }

    std::vector<ConnectionSite> sites;
    for (const auto& [source, sourceIndex] : sources) {
        for (const NodeId target : targets) {
            if (!genotype.findConnection(source, sourceIndex, target)) {
                sites.push_back({ .source = source, .sourceIndex = sourceIndex, .target = target });
            }
        }
    }
    if (sites.empty()) {
        return false;
    }

    const ConnectionSite& site = pickOne(sites, rng);
    std::uniform_real_distribution<double> weightDist(-config.weightRange, config.weightRange);
    const double weight = weightDist(rng);

    // Closing a loop keeps the DAG intact by marking the new edge recurrent.
    const bool closesCycle = genotype.reaches(site.target, site.source);
    genotype.addConnection(
        makeConnectionGene(site.source, site.sourceIndex, site.target, weight, closesCycle));
    if (recurrent) {
        *recurrent = closesCycle;
    }
    return true;
}

bool mutateToggleConnection(Genotype& genotype, std::mt19937& rng)
{
    std::vector<size_t> candidates;
    for (size_t i = 0; i < genotype.connections.size(); ++i) {
        const auto& connection = genotype.connections[i];
        if (genotype.isBiasConnection(connection)) {
            continue;
        }
        if (connection.enabled && !connection.recurrent
            && genotype.activeInputCount(connection.targetId) <= 1) {
            continue;
        }
        candidates.push_back(i);
    }
    if (candidates.empty()) {
        return false;
    }

    // Innovation numbers are unique per site, so re-enabling cannot create a
    // duplicate enabled gene.
    ConnectionGene& connection = genotype.connections[pickOne(candidates, rng)];
    connection.enabled = !connection.enabled;
    return true;
}

Genotype mutate(
    const Genotype& parent, const MutationConfig& config, std::mt19937& rng, MutationStats* stats)
{
    if (stats) {
        *stats = MutationStats{};
    }

    Genotype child = parent;
    child.resetEvaluation();

    std::uniform_real_distribution<double> coin(0.0, 1.0);

    mutateWeights(child, config, rng, stats);

    if (coin(rng) < config.addNodeRate && mutateAddNode(child, config, rng) && stats) {
        stats->nodesAdded++;
    }

    if (coin(rng) < config.addConnectionRate) {
        bool recurrent = false;
        if (mutateAddConnection(child, config, rng, &recurrent) && stats) {
            stats->connectionsAdded++;
            if (recurrent) {
                stats->recurrentConnectionsAdded++;
            }
        }
    }

    if (coin(rng) < config.toggleRate && mutateToggleConnection(child, rng) && stats) {
        stats->connectionsToggled++;
    }

    return child;
}

} // namespace NeuroEvo
