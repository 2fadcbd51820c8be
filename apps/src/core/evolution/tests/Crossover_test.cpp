#include "core/cortex/InterfaceRegistry.h"
#include "core/cortex/Phenotype.h"
#include "core/evolution/Compatibility.h"
#include "core/evolution/Crossover.h"
#include "core/evolution/Mutation.h"
#include "core/genotype/GenotypeConstructor.h"
#include "core/genotype/Innovation.h"

#include <gtest/gtest.h>

using namespace NeuroEvo;

class CrossoverTest : public ::testing::Test {
protected:
    Genotype makeGenotype(GenotypeId id)
    {
        auto result = constructGenotype(
            id, GenotypeSpec{ .hiddenLayerDensities = { 3 } }, InterfaceRegistry::withDefaults(), rng);
        EXPECT_TRUE(result.isValue());
        return result.value();
    }

    Genotype grow(Genotype genotype, int structuralMutations)
    {
        for (int i = 0; i < structuralMutations; ++i) {
            mutateAddNode(genotype, MutationConfig{}, rng);
            mutateAddConnection(genotype, MutationConfig{}, rng);
        }
        return genotype;
    }

    std::mt19937 rng{ 42 };
    CompatibilityConfig compatibility;
};

TEST_F(CrossoverTest, ChildGeneCountIsBoundedByParents)
{
    for (int trial = 0; trial < 20; ++trial) {
        Genotype a = grow(makeGenotype(GenotypeId{ 1 }), 3);
        Genotype b = grow(makeGenotype(GenotypeId{ 2 }), 2);
        a.fitness = 2.0;
        b.fitness = 1.0;

        const Genotype child = crossover(a, b, GenotypeId{ 3 }, CrossoverConfig{}, rng);

        EXPECT_GE(child.connections.size(), a.connections.size());
        EXPECT_LE(child.connections.size(), a.connections.size() + b.connections.size());
    }
}

TEST_F(CrossoverTest, StructureComesFromFitterParent)
{
    Genotype a = grow(makeGenotype(GenotypeId{ 1 }), 1);
    Genotype b = grow(makeGenotype(GenotypeId{ 2 }), 4);
    a.fitness = 1.0;
    b.fitness = 5.0;

    const Genotype child = crossover(a, b, GenotypeId{ 9 }, CrossoverConfig{}, rng);

    const GeneAlignment alignment = alignGenes(b, a);
    for (const ConnectionGene* gene : alignment.disjointA) {
        EXPECT_NE(child.findConnection(gene->sourceId, gene->sourceIndex, gene->targetId), nullptr);
    }
    for (const ConnectionGene* gene : alignment.excessA) {
        EXPECT_NE(child.findConnection(gene->sourceId, gene->sourceIndex, gene->targetId), nullptr);
    }
    for (const ConnectionGene* gene : alignment.disjointB) {
        EXPECT_EQ(child.findConnection(gene->sourceId, gene->sourceIndex, gene->targetId), nullptr);
    }
    for (const ConnectionGene* gene : alignment.excessB) {
        EXPECT_EQ(child.findConnection(gene->sourceId, gene->sourceIndex, gene->targetId), nullptr);
    }

    EXPECT_EQ(child.id, GenotypeId{ 9 });
    EXPECT_FALSE(child.evaluated);
    EXPECT_EQ(child.sensors, b.sensors);
}

TEST_F(CrossoverTest, MatchingWeightsComeFromEitherParent)
{
    Genotype a = makeGenotype(GenotypeId{ 1 });
    Genotype b = makeGenotype(GenotypeId{ 2 });
    a.fitness = 1.0;
    b.fitness = 1.0;

    const Genotype child = crossover(a, b, GenotypeId{ 3 }, CrossoverConfig{}, rng);

    ASSERT_EQ(child.connections.size(), a.connections.size());
    int fromA = 0;
    int fromB = 0;
    for (size_t i = 0; i < child.connections.size(); ++i) {
        const double weight = child.connections[i].weight;
        if (weight == a.connections[i].weight) {
            fromA++;
        }
        else if (weight == b.connections[i].weight) {
            fromB++;
        }
        else {
            ADD_FAILURE() << "weight from neither parent";
        }
    }
    EXPECT_GT(fromA, 0);
    EXPECT_GT(fromB, 0);
}

TEST_F(CrossoverTest, BlendingAveragesMatchingWeights)
{
    Genotype a = makeGenotype(GenotypeId{ 1 });
    Genotype b = makeGenotype(GenotypeId{ 2 });

    const Genotype child =
        crossover(a, b, GenotypeId{ 3 }, CrossoverConfig{ .blendMatchingWeights = true }, rng);

    for (size_t i = 0; i < child.connections.size(); ++i) {
        EXPECT_DOUBLE_EQ(
            child.connections[i].weight,
            0.5 * (a.connections[i].weight + b.connections[i].weight));
    }
}

TEST_F(CrossoverTest, ChildOfGrownParentsIsExpressible)
{
    for (int trial = 0; trial < 10; ++trial) {
        Genotype a = grow(makeGenotype(GenotypeId{ 1 }), 4);
        Genotype b = grow(makeGenotype(GenotypeId{ 2 }), 4);

        const Genotype child = crossover(a, b, GenotypeId{ 3 }, CrossoverConfig{}, rng);

        for (const NodeId neuron : child.neuronIds()) {
            EXPECT_NE(child.findConnection(biasNodeId(), 0, neuron), nullptr);
        }
        auto phenotype = Cortex::buildPhenotype(child);
        EXPECT_TRUE(phenotype.isValue()) << phenotype.errorValue();
    }
}

TEST_F(CrossoverTest, IdenticalGenotypesHaveZeroDistance)
{
    const Genotype a = makeGenotype(GenotypeId{ 1 });

    EXPECT_DOUBLE_EQ(compatibilityDistance(a, a, compatibility), 0.0);
}

TEST_F(CrossoverTest, DistanceIsSymmetric)
{
    const Genotype a = grow(makeGenotype(GenotypeId{ 1 }), 3);
    const Genotype b = grow(makeGenotype(GenotypeId{ 2 }), 1);

    EXPECT_DOUBLE_EQ(
        compatibilityDistance(a, b, compatibility), compatibilityDistance(b, a, compatibility));
    EXPECT_GT(compatibilityDistance(a, b, compatibility), 0.0);
}

TEST_F(CrossoverTest, SameTopologyDistanceIsWeightTerm)
{
    const Genotype a = makeGenotype(GenotypeId{ 1 });
    const Genotype b = makeGenotype(GenotypeId{ 2 });

    double sum = 0.0;
    for (size_t i = 0; i < a.connections.size(); ++i) {
        sum += std::abs(a.connections[i].weight - b.connections[i].weight);
    }
    const double expected =
        compatibility.weightCoefficient * sum / static_cast<double>(a.connections.size());

    EXPECT_NEAR(compatibilityDistance(a, b, compatibility), expected, 1e-12);
}

TEST_F(CrossoverTest, AlignmentCountsUnsharedGenes)
{
    const Genotype a = makeGenotype(GenotypeId{ 1 });
    Genotype b = a;
    ASSERT_TRUE(mutateAddNode(b, MutationConfig{}, rng));

    const GeneAlignment alignment = alignGenes(a, b);

    EXPECT_EQ(alignment.matching.size(), a.connections.size());
    EXPECT_EQ(alignment.disjointCount() + alignment.excessCount(), 3u);
    EXPECT_TRUE(alignment.disjointA.empty());
    EXPECT_TRUE(alignment.excessA.empty());
}
