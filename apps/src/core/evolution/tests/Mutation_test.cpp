#include "core/cortex/InterfaceRegistry.h"
#include "core/cortex/Phenotype.h"
#include "core/evolution/EvolutionConfig.h"
#include "core/evolution/Mutation.h"
#include "core/genotype/GenotypeConstructor.h"
#include "core/genotype/Innovation.h"

#include <gtest/gtest.h>
#include <set>

using namespace NeuroEvo;

class MutationTest : public ::testing::Test {
protected:
    Genotype makeGenotype(std::vector<int> hiddenLayerDensities = { 3 })
    {
        auto result = constructGenotype(
            GenotypeId{ 1 },
            GenotypeSpec{ .hiddenLayerDensities = std::move(hiddenLayerDensities) },
            InterfaceRegistry::withDefaults(),
            rng);
        EXPECT_TRUE(result.isValue());
        return result.value();
    }

    static MutationConfig quietConfig()
    {
        return MutationConfig{
            .weightMutationRate = 0.0,
            .addNodeRate = 0.0,
            .addConnectionRate = 0.0,
            .toggleRate = 0.0,
        };
    }

    std::mt19937 rng{ 42 };
};

TEST_F(MutationTest, SameSeedProducesIdenticalChildren)
{
    const Genotype parent = makeGenotype();
    const MutationConfig config{
        .weightMutationRate = 0.9,
        .addNodeRate = 1.0,
        .addConnectionRate = 1.0,
        .toggleRate = 1.0,
    };

    std::mt19937 rngA{ 7 };
    std::mt19937 rngB{ 7 };
    Genotype childA = parent;
    Genotype childB = parent;
    for (int i = 0; i < 10; ++i) {
        childA = mutate(childA, config, rngA);
        childB = mutate(childB, config, rngB);
    }

    EXPECT_EQ(childA.nodes, childB.nodes);
    EXPECT_EQ(childA.connections, childB.connections);
}

TEST_F(MutationTest, ZeroRatesLeaveGenesUntouched)
{
    const Genotype parent = makeGenotype();

    MutationStats stats;
    const Genotype child = mutate(parent, quietConfig(), rng, &stats);

    EXPECT_EQ(child.nodes, parent.nodes);
    EXPECT_EQ(child.connections, parent.connections);
    EXPECT_EQ(stats.totalChanges(), 0);
}

TEST_F(MutationTest, ChildIsUnevaluatedWithParentId)
{
    Genotype parent = makeGenotype();
    parent.fitness = 3.0;
    parent.evaluated = true;

    const Genotype child = mutate(parent, MutationConfig{}, rng);

    EXPECT_EQ(child.id, parent.id);
    EXPECT_FALSE(child.evaluated);
    EXPECT_DOUBLE_EQ(child.fitness, 0.0);
}

TEST_F(MutationTest, WeightMutationOnlyTouchesEnabledConnections)
{
    Genotype genotype = makeGenotype();
    genotype.connections.front().enabled = false;
    const double disabledWeight = genotype.connections.front().weight;
    MutationConfig config = quietConfig();
    config.weightMutationRate = 1.0;

    MutationStats stats;
    mutateWeights(genotype, config, rng, &stats);

    EXPECT_DOUBLE_EQ(genotype.connections.front().weight, disabledWeight);
    EXPECT_EQ(
        stats.weightPerturbations + stats.weightResets,
        static_cast<int>(genotype.connections.size()) - 1);
}

TEST_F(MutationTest, AddNodeSplitsAnEnabledConnection)
{
    const Genotype parent = makeGenotype();
    Genotype genotype = parent;

    ASSERT_TRUE(mutateAddNode(genotype, MutationConfig{}, rng));

    EXPECT_EQ(genotype.nodes.size(), parent.nodes.size() + 1);
    EXPECT_EQ(genotype.connections.size(), parent.connections.size() + 3);

    const ConnectionGene* split = nullptr;
    for (const auto& connection : genotype.connections) {
        if (!connection.enabled) {
            ASSERT_EQ(split, nullptr) << "more than one connection disabled";
            split = &connection;
        }
    }
    ASSERT_NE(split, nullptr);
    EXPECT_FALSE(genotype.isBiasConnection(*split));

    const NodeId neuron = splitNeuronId(split->sourceId, split->sourceIndex, split->targetId);
    const NodeGene* node = genotype.findNode(neuron);
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->activation, ActivationFunction::Sigmoid);

    const ConnectionGene* in = genotype.findConnection(split->sourceId, split->sourceIndex, neuron);
    const ConnectionGene* out = genotype.findConnection(neuron, 0, split->targetId);
    const ConnectionGene* bias = genotype.findConnection(biasNodeId(), 0, neuron);
    ASSERT_NE(in, nullptr);
    ASSERT_NE(out, nullptr);
    ASSERT_NE(bias, nullptr);
    EXPECT_DOUBLE_EQ(in->weight, 1.0);
    EXPECT_DOUBLE_EQ(out->weight, split->weight);
    EXPECT_DOUBLE_EQ(bias->weight, 0.0);

    EXPECT_TRUE(Cortex::buildPhenotype(genotype).isValue());
}

TEST_F(MutationTest, RepeatedAddNodeKeepsGenotypeExpressible)
{
    Genotype genotype = makeGenotype();
    for (int i = 0; i < 25; ++i) {
        mutateAddNode(genotype, MutationConfig{}, rng);
    }

    auto phenotype = Cortex::buildPhenotype(genotype);
    EXPECT_TRUE(phenotype.isValue()) << phenotype.errorValue();
}

TEST_F(MutationTest, AddConnectionFillsEverySiteOnce)
{
    Genotype genotype = makeGenotype();

    int added = 0;
    int recurrentAdded = 0;
    bool recurrent = false;
    while (mutateAddConnection(genotype, MutationConfig{}, rng, &recurrent)) {
        added++;
        if (recurrent) {
            recurrentAdded++;
        }
        ASSERT_LT(added, 100);
    }

    // 4 neurons + 2 sensor elements as sources, 4 neurons as targets, 9 taken.
    EXPECT_EQ(added, 6 * 4 - 9);
    EXPECT_GT(recurrentAdded, 0);

    std::set<Innovation> innovations;
    for (const auto& connection : genotype.connections) {
        EXPECT_TRUE(innovations.insert(connection.innovation).second);
    }

    // Output back to a hidden neuron must be recurrent, and recurrent edges
    // never break the build.
    const NodeId hidden = layerNeuronId(1, 0);
    const NodeId output = layerNeuronId(2, 0);
    const ConnectionGene* backEdge = genotype.findConnection(output, 0, hidden);
    ASSERT_NE(backEdge, nullptr);
    EXPECT_TRUE(backEdge->recurrent);
    EXPECT_TRUE(genotype.findConnection(output, 0, output)->recurrent);
    EXPECT_TRUE(Cortex::buildPhenotype(genotype).isValue());
}

TEST_F(MutationTest, ToggleNeverSilencesANeuron)
{
    Genotype genotype = makeGenotype({});
    const NodeId output = genotype.actuators.front().fanInIds.front();

    for (int i = 0; i < 200; ++i) {
        mutateToggleConnection(genotype, rng);
        EXPECT_GE(genotype.activeInputCount(output), 1);
    }
}

TEST_F(MutationTest, ToggleSkipsBiasConnections)
{
    Genotype genotype = makeGenotype();

    for (int i = 0; i < 200; ++i) {
        mutateToggleConnection(genotype, rng);
    }

    for (const auto& connection : genotype.connections) {
        if (genotype.isBiasConnection(connection)) {
            EXPECT_TRUE(connection.enabled);
        }
    }
}
