#include "Crossover.h"
#include "Compatibility.h"

#include "core/genotype/Genotype.h"
#include "core/genotype/Innovation.h"

namespace NeuroEvo {

Genotype crossover(
    const Genotype& a,
    const Genotype& b,
    GenotypeId childId,
    const CrossoverConfig& config,
    std::mt19937& rng)
{
    const bool aIsFitter = a.fitness >= b.fitness;
    const Genotype& fitter = aIsFitter ? a : b;
    const Genotype& other = aIsFitter ? b : a;

    Genotype child;
    child.id = childId;
    child.sensors = fitter.sensors;
    child.actuators = fitter.actuators;
    child.speciesId = fitter.speciesId;
    child.generationCreated = fitter.generationCreated + 1;

    child.nodes = fitter.nodes;
    for (const auto& node : other.nodes) {
        if (!fitter.hasNode(node.id)) {
            child.addNode(node);
        }
    }

    std::bernoulli_distribution pickFitter(0.5);
    const GeneAlignment alignment = alignGenes(fitter, other);

    for (const auto& match : alignment.matching) {
        // Alignment was taken with the fitter genotype first.
        ConnectionGene gene = *match.a;
        if (config.blendMatchingWeights) {
            gene.weight = 0.5 * (match.a->weight + match.b->weight);
            gene.enabled = pickFitter(rng) ? match.a->enabled : match.b->enabled;
        }
        else {
            const ConnectionGene& chosen = pickFitter(rng) ? *match.a : *match.b;
            gene.weight = chosen.weight;
            gene.enabled = chosen.enabled;
        }
        // Recurrence depends on the surrounding topology, which is the fitter's.
        gene.recurrent = match.a->recurrent;
        child.connections.push_back(gene);
    }
    for (const ConnectionGene* gene : alignment.disjointA) {
        child.connections.push_back(*gene);
    }
    for (const ConnectionGene* gene : alignment.excessA) {
        child.connections.push_back(*gene);
    }

    // Nodes inherited only from the other parent get a neutral bias so the
    // one-bias-per-neuron invariant holds; they stay unexpressed until wired.
    const NodeId bias = biasNodeId();
    for (const auto& node : child.nodes) {
        if (node.kind == NodeKind::Neuron && !fitter.hasNode(node.id)) {
            child.connections.push_back(makeConnectionGene(bias, 0, node.id, 0.0));
        }
    }

    child.sortGenes();

    // A neuron must keep at least one enabled input; fall back to the fitter
    // parent's enabled flags where the other parent silenced all of them.
    for (const auto& node : child.nodes) {
        if (node.kind != NodeKind::Neuron || !fitter.hasNode(node.id)) {
            continue;
        }
        if (child.activeInputCount(node.id) > 0 || fitter.activeInputCount(node.id) == 0) {
            continue;
        }
        for (auto& connection : child.connections) {
            if (connection.targetId != node.id || child.isBiasConnection(connection)) {
                continue;
            }
            const ConnectionGene* original = fitter.findConnection(
                connection.sourceId, connection.sourceIndex, connection.targetId);
            if (original) {
                connection.enabled = original->enabled;
            }
        }
    }

    return child;
}

} // namespace NeuroEvo
