#include "core/evolution/EvaluationResult.h"
#include "core/evolution/XorEvaluator.h"

#include <gtest/gtest.h>

using namespace NeuroEvo;

class XorEvaluatorTest : public ::testing::Test {
protected:
    Genotype makeGenotype()
    {
        auto result =
            constructGenotype(GenotypeId{ 1 }, xorGenotypeSpec(), xorLayoutRegistry(), rng);
        EXPECT_TRUE(result.isValue());
        return result.value();
    }

    std::mt19937 rng{ 42 };
    XorEvaluator evaluator;
};

TEST_F(XorEvaluatorTest, ScoreIsWithinRange)
{
    const double score = evaluator(makeGenotype());

    EXPECT_GE(score, 0.0);
    EXPECT_LE(score, 4.0);
}

TEST_F(XorEvaluatorTest, SameGenotypeScoresTheSame)
{
    const Genotype genotype = makeGenotype();

    EXPECT_DOUBLE_EQ(evaluator(genotype), evaluator(genotype));
}

TEST_F(XorEvaluatorTest, ConstantHalfOutputScoresThree)
{
    // Zero every weight: the sigmoid output is 0.5 for all four cases.
    Genotype genotype = makeGenotype();
    for (auto& connection : genotype.connections) {
        connection.weight = 0.0;
    }

    EXPECT_DOUBLE_EQ(evaluator(genotype), 3.0);
}

TEST_F(XorEvaluatorTest, WrongInterfaceIsAFailedEvaluation)
{
    auto result = constructGenotype(
        GenotypeId{ 2 }, GenotypeSpec{}, InterfaceRegistry::withDefaults(), rng);
    ASSERT_TRUE(result.isValue());

    const EvaluationResult evaluation =
        evaluateGenotype(result.value(), evaluator.fitnessFunction());

    EXPECT_TRUE(evaluation.failed);
    EXPECT_DOUBLE_EQ(evaluation.fitness, 0.0);
    EXPECT_FALSE(evaluation.error.empty());
}
