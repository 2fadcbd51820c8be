#pragma once

#include "EvaluationResult.h"
#include "core/cortex/InterfaceRegistry.h"
#include "core/genotype/GenotypeConstructor.h"

#include <array>
#include <chrono>

namespace NeuroEvo {

/**
 * Reference fitness task: run the genotype through the actor runtime on the
 * four XOR cases, one case per cycle, and score 4 - sum of squared errors
 * (never below 0).
 *
 * Genotypes must use the "xor_inputs" sensor (2 values) and the "xor_output"
 * actuator (1 value); xorGenotypeSpec() returns such a spec.
 */
class XorEvaluator {
public:
    static constexpr const char* kSensorName = "xor_inputs";
    static constexpr const char* kActuatorName = "xor_output";
    static constexpr std::array<std::array<double, 3>, 4> kCases{ {
        { 0.0, 0.0, 0.0 },
        { 0.0, 1.0, 1.0 },
        { 1.0, 0.0, 1.0 },
        { 1.0, 1.0, 0.0 },
    } };

    explicit XorEvaluator(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    double operator()(const Genotype& genotype) const;

    FitnessFunction fitnessFunction() const;

private:
    std::chrono::milliseconds timeout_;
};

GenotypeSpec xorGenotypeSpec();

// Registry holding the XOR interfaces with inert functions, for resolving layouts.
InterfaceRegistry xorLayoutRegistry();

} // namespace NeuroEvo
