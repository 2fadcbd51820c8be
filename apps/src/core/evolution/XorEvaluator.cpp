#include "XorEvaluator.h"

#include "core/cortex/InterfaceRegistry.h"
#include "core/cortex/Network.h"
#include "core/genotype/Genotype.h"

#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace NeuroEvo {

namespace {

struct XorEpisode {
    std::mutex mutex;
    size_t nextCase = 0;
    std::vector<double> outputs;
};

} // namespace

XorEvaluator::XorEvaluator(std::chrono::milliseconds timeout) : timeout_(timeout)
{}

double XorEvaluator::operator()(const Genotype& genotype) const
{
    auto episode = std::make_shared<XorEpisode>();

    InterfaceRegistry registry;
    registry.registerSensor(kSensorName, 2, [episode]() {
        std::lock_guard<std::mutex> lock(episode->mutex);
        const auto& row = kCases[episode->nextCase % kCases.size()];
        episode->nextCase++;
        return std::vector<double>{ row[0], row[1] };
    });
    registry.registerActuator(kActuatorName, 1, [episode](const std::vector<double>& output) {
        std::lock_guard<std::mutex> lock(episode->mutex);
        episode->outputs.push_back(output.at(0));
    });

    auto run = Cortex::runEpisode(genotype, registry, static_cast<int>(kCases.size()), timeout_);
    if (run.isError()) {
        throw std::runtime_error("xor episode failed: " + run.errorValue());
    }

    std::lock_guard<std::mutex> lock(episode->mutex);
    if (episode->outputs.size() != kCases.size()) {
        throw std::runtime_error("xor episode produced too few outputs");
    }

    double sumSquaredError = 0.0;
    for (size_t i = 0; i < kCases.size(); ++i) {
        const double error = episode->outputs[i] - kCases[i][2];
        sumSquaredError += error * error;
    }
    return std::max(0.0, 4.0 - sumSquaredError);
}

FitnessFunction XorEvaluator::fitnessFunction() const
{
    return [evaluator = *this](const Genotype& genotype) { return evaluator(genotype); };
}

GenotypeSpec xorGenotypeSpec()
{
    return GenotypeSpec{ .sensors = { XorEvaluator::kSensorName },
                         .actuators = { XorEvaluator::kActuatorName },
                         .hiddenLayerDensities = { 2 },
                         .outputActivation = ActivationFunction::Sigmoid };
}

InterfaceRegistry xorLayoutRegistry()
{
    InterfaceRegistry registry;
    registry.registerSensor(XorEvaluator::kSensorName, 2, []() {
        return std::vector<double>{ 0.0, 0.0 };
    });
    registry.registerActuator(XorEvaluator::kActuatorName, 1, [](const std::vector<double>&) {});
    return registry;
}

} // namespace NeuroEvo
