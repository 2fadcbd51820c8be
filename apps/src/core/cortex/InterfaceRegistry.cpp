#include "InterfaceRegistry.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <random>
#include <spdlog/fmt/ranges.h>

namespace NeuroEvo {

InterfaceRegistry InterfaceRegistry::withDefaults()
{
    InterfaceRegistry registry;

    registry.registerSensor("rng", 2, []() {
        thread_local std::mt19937 rng{ std::random_device{}() };
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return std::vector<double>{ dist(rng), dist(rng) };
    });

    registry.registerActuator("pts", 1, [](const std::vector<double>& output) {
        LOG_INFO(Cortex, "pts: [{}]", fmt::join(output, ", "));
    });

    return registry;
}

void InterfaceRegistry::registerSensor(
    const std::string& name, int vectorLength, SensorFunction signal)
{
    NEUROEVO_ASSERT(!name.empty(), "Sensor interface must have a name");
    NEUROEVO_ASSERT(vectorLength > 0, "Sensor vector length must be positive");
    sensors_[name] = SensorInterface{
        .name = name,
        .vectorLength = vectorLength,
        .signal = std::move(signal),
    };
}

void InterfaceRegistry::registerActuator(
    const std::string& name, int vectorLength, ActuatorFunction consume)
{
    NEUROEVO_ASSERT(!name.empty(), "Actuator interface must have a name");
    NEUROEVO_ASSERT(vectorLength > 0, "Actuator vector length must be positive");
    actuators_[name] = ActuatorInterface{
        .name = name,
        .vectorLength = vectorLength,
        .consume = std::move(consume),
    };
}

const SensorInterface* InterfaceRegistry::findSensor(const std::string& name) const
{
    const auto it = sensors_.find(name);
    return it == sensors_.end() ? nullptr : &it->second;
}

const ActuatorInterface* InterfaceRegistry::findActuator(const std::string& name) const
{
    const auto it = actuators_.find(name);
    return it == actuators_.end() ? nullptr : &it->second;
}

} // namespace NeuroEvo
