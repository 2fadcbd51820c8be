#include "core/ConfigLoader.h"
#include "core/evolution/EvolutionConfig.h"
#include "core/genotype/GenotypeConstructor.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace NeuroEvo;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        dir = std::filesystem::temp_directory_path() / "neuroevo_config_test";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        ConfigLoader::setConfigDir(dir.string());
    }

    void TearDown() override
    {
        ConfigLoader::clearConfigDir();
        std::filesystem::remove_all(dir);
    }

    void write(const std::string& name, const std::string& contents)
    {
        std::ofstream out(dir / name);
        out << contents;
    }

    std::filesystem::path dir;
};

TEST_F(ConfigLoaderTest, MissingKeysKeepDefaults)
{
    write("evolution.json", R"({ "populationSize": 80, "mutation": { "addNodeRate": 0.2 } })");

    auto result = ConfigLoader::load<EvolutionConfig>("evolution.json");

    ASSERT_TRUE(result.isValue()) << result.errorValue();
    const EvolutionConfig& config = result.value();
    EXPECT_EQ(config.populationSize, 80);
    EXPECT_DOUBLE_EQ(config.mutation.addNodeRate, 0.2);
    EXPECT_DOUBLE_EQ(config.mutation.addConnectionRate, 0.05);
    EXPECT_EQ(config.tournamentSize, 3);
    EXPECT_FALSE(config.seed.has_value());
}

TEST_F(ConfigLoaderTest, LocalFileOverridesBase)
{
    write("evolution.json", R"({ "populationSize": 80 })");
    write("evolution.json.local", R"({ "populationSize": 12, "seed": 99 })");

    auto result = ConfigLoader::load<EvolutionConfig>("evolution.json");

    ASSERT_TRUE(result.isValue()) << result.errorValue();
    EXPECT_EQ(result.value().populationSize, 12);
    ASSERT_TRUE(result.value().seed.has_value());
    EXPECT_EQ(*result.value().seed, 99u);
}

TEST_F(ConfigLoaderTest, GenotypeSpecUsesActivationNames)
{
    write(
        "genotype.json",
        R"({ "sensors": ["rng"], "hiddenLayerDensities": [4, 2], "hiddenActivation": "relu" })");

    auto result = ConfigLoader::load<GenotypeSpec>("genotype.json");

    ASSERT_TRUE(result.isValue()) << result.errorValue();
    EXPECT_EQ(result.value().hiddenLayerDensities, (std::vector<int>{ 4, 2 }));
    EXPECT_EQ(result.value().hiddenActivation, ActivationFunction::Relu);
    EXPECT_EQ(result.value().actuators, (std::vector<std::string>{ "pts" }));
}

TEST_F(ConfigLoaderTest, UnknownActivationIsAnError)
{
    write("genotype.json", R"({ "hiddenActivation": "softmax" })");

    EXPECT_TRUE(ConfigLoader::load<GenotypeSpec>("genotype.json").isError());
}

TEST_F(ConfigLoaderTest, MalformedJsonIsAnError)
{
    write("evolution.json", "{ populationSize: ");

    EXPECT_TRUE(ConfigLoader::load<EvolutionConfig>("evolution.json").isError());
}

TEST_F(ConfigLoaderTest, MissingFileIsAnError)
{
    EXPECT_TRUE(ConfigLoader::load<EvolutionConfig>("nonexistent.json").isError());
}

TEST_F(ConfigLoaderTest, ConfigRoundTripsThroughJson)
{
    EvolutionConfig config;
    config.populationSize = 33;
    config.compatibility.weightCoefficient = 0.9;
    config.mutation.addNodeActivation = ActivationFunction::Gaussian;

    const nlohmann::json j = config;
    const EvolutionConfig restored = j.get<EvolutionConfig>();

    EXPECT_EQ(restored.populationSize, 33);
    EXPECT_DOUBLE_EQ(restored.compatibility.weightCoefficient, 0.9);
    EXPECT_EQ(restored.mutation.addNodeActivation, ActivationFunction::Gaussian);
}
