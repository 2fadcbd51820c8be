#include "core/cortex/InterfaceRegistry.h"
#include "core/genotype/GenotypeConstructor.h"
#include "core/genotype/Innovation.h"

#include <gtest/gtest.h>
#include <set>

using namespace NeuroEvo;

class GenotypeConstructorTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };
    InterfaceRegistry registry = InterfaceRegistry::withDefaults();
};

TEST_F(GenotypeConstructorTest, DefaultSpecBuildsFullyConnectedLayers)
{
    auto result = constructGenotype(GenotypeId{ 1 }, GenotypeSpec{}, registry, rng);
    ASSERT_TRUE(result.isValue()) << result.errorValue();
    const Genotype& genotype = result.value();

    // Bias, one sensor, three hidden, one output, one actuator.
    EXPECT_EQ(genotype.nodes.size(), 7u);
    // Hidden: 3 x (2 sensor elements + bias). Output: 3 hidden + bias.
    EXPECT_EQ(genotype.connections.size(), 13u);
    ASSERT_EQ(genotype.sensors.size(), 1u);
    EXPECT_EQ(genotype.sensors[0].name, "rng");
    EXPECT_EQ(genotype.sensors[0].vectorLength, 2);
    ASSERT_EQ(genotype.actuators.size(), 1u);
    EXPECT_EQ(genotype.actuators[0].fanInIds.size(), 1u);
    EXPECT_FALSE(genotype.evaluated);
}

TEST_F(GenotypeConstructorTest, WeightsStayWithinInitialRange)
{
    auto result = constructGenotype(GenotypeId{ 1 }, GenotypeSpec{}, registry, rng);
    ASSERT_TRUE(result.isValue());

    for (const auto& connection : result.value().connections) {
        EXPECT_GE(connection.weight, -0.5);
        EXPECT_LE(connection.weight, 0.5);
        EXPECT_TRUE(connection.enabled);
        EXPECT_FALSE(connection.recurrent);
    }
}

TEST_F(GenotypeConstructorTest, EveryNeuronHasExactlyOneBiasConnection)
{
    const GenotypeSpec spec{ .hiddenLayerDensities = { 4, 2 } };
    auto result = constructGenotype(GenotypeId{ 1 }, spec, registry, rng);
    ASSERT_TRUE(result.isValue());
    const Genotype& genotype = result.value();

    for (const NodeId neuron : genotype.neuronIds()) {
        int biasCount = 0;
        for (const auto& connection : genotype.connections) {
            if (connection.targetId == neuron && genotype.isBiasConnection(connection)) {
                biasCount++;
            }
        }
        EXPECT_EQ(biasCount, 1) << "neuron " << neuron;
    }
    EXPECT_EQ(genotype.neuronIds().size(), 7u);
}

TEST_F(GenotypeConstructorTest, GenesAreSortedByInnovation)
{
    auto result = constructGenotype(GenotypeId{ 1 }, GenotypeSpec{}, registry, rng);
    ASSERT_TRUE(result.isValue());
    const Genotype& genotype = result.value();

    for (size_t i = 1; i < genotype.nodes.size(); ++i) {
        EXPECT_LT(genotype.nodes[i - 1].innovation, genotype.nodes[i].innovation);
    }
    for (size_t i = 1; i < genotype.connections.size(); ++i) {
        EXPECT_LT(genotype.connections[i - 1].innovation, genotype.connections[i].innovation);
    }
}

TEST_F(GenotypeConstructorTest, SameStructureGetsSameInnovationsAcrossGenotypes)
{
    auto a = constructGenotype(GenotypeId{ 1 }, GenotypeSpec{}, registry, rng);
    auto b = constructGenotype(GenotypeId{ 2 }, GenotypeSpec{}, registry, rng);
    ASSERT_TRUE(a.isValue());
    ASSERT_TRUE(b.isValue());

    ASSERT_EQ(a.value().connections.size(), b.value().connections.size());
    for (size_t i = 0; i < a.value().connections.size(); ++i) {
        EXPECT_EQ(a.value().connections[i].innovation, b.value().connections[i].innovation);
    }
}

TEST_F(GenotypeConstructorTest, ActuatorFanInMatchesVectorLength)
{
    registry.registerActuator("wheels", 3, [](const std::vector<double>&) {});
    const GenotypeSpec spec{ .actuators = { "pts", "wheels" } };

    auto result = constructGenotype(GenotypeId{ 1 }, spec, registry, rng);
    ASSERT_TRUE(result.isValue());
    const Genotype& genotype = result.value();

    ASSERT_EQ(genotype.actuators.size(), 2u);
    EXPECT_EQ(genotype.actuators[0].fanInIds.size(), 1u);
    EXPECT_EQ(genotype.actuators[1].fanInIds.size(), 3u);

    std::set<NodeId> fanIn;
    for (const auto& actuator : genotype.actuators) {
        fanIn.insert(actuator.fanInIds.begin(), actuator.fanInIds.end());
    }
    EXPECT_EQ(fanIn.size(), 4u);
}

TEST_F(GenotypeConstructorTest, UnknownSensorIsAnError)
{
    const GenotypeSpec spec{ .sensors = { "sonar" } };

    auto result = constructGenotype(GenotypeId{ 1 }, spec, registry, rng);

    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("sonar"), std::string::npos);
}

TEST_F(GenotypeConstructorTest, UnknownActuatorIsAnError)
{
    const GenotypeSpec spec{ .actuators = { "laser" } };

    auto result = resolveLayout(spec, registry);

    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("laser"), std::string::npos);
}

TEST_F(GenotypeConstructorTest, NonPositiveDensityIsAnError)
{
    const GenotypeSpec spec{ .hiddenLayerDensities = { 2, 0 } };

    EXPECT_TRUE(resolveLayout(spec, registry).isError());
}

TEST(InnovationTest, ConnectionInnovationDependsOnEndpointsAndElement)
{
    const NodeId sensor = sensorNodeId("rng", 0);
    const NodeId neuron = layerNeuronId(1, 0);

    EXPECT_EQ(connectionInnovation(sensor, 0, neuron), connectionInnovation(sensor, 0, neuron));
    EXPECT_NE(connectionInnovation(sensor, 0, neuron), connectionInnovation(sensor, 1, neuron));
    EXPECT_NE(connectionInnovation(sensor, 0, neuron), connectionInnovation(neuron, 0, sensor));
}

TEST(InnovationTest, SplitNeuronIdIsDeterministic)
{
    const NodeId a = layerNeuronId(1, 0);
    const NodeId b = layerNeuronId(2, 0);

    EXPECT_EQ(splitNeuronId(a, 0, b), splitNeuronId(a, 0, b));
    EXPECT_NE(splitNeuronId(a, 0, b), splitNeuronId(b, 0, a));
    EXPECT_NE(splitNeuronId(a, 0, b), layerNeuronId(1, 1));
}
