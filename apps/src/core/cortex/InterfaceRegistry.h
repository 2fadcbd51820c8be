#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace NeuroEvo {

// Produces one sample per sense-think-act cycle.
using SensorFunction = std::function<std::vector<double>()>;

// Consumes the reassembled output vector once per cycle.
using ActuatorFunction = std::function<void(const std::vector<double>&)>;

struct SensorInterface {
    std::string name;
    int vectorLength = 0;
    SensorFunction signal;
};

struct ActuatorInterface {
    std::string name;
    int vectorLength = 0;
    ActuatorFunction consume;
};

/**
 * Name to function table for sensors and actuators.
 *
 * Genotypes refer to their interfaces by name. The registry turns those names
 * into callable functions once, when a network is built. Functions are called
 * from actor threads; a registry shared across parallel evaluations must hold
 * thread-safe functions.
 */
class InterfaceRegistry {
public:
    // Registry with the built-in "rng" sensor and "pts" actuator.
    static InterfaceRegistry withDefaults();

    void registerSensor(const std::string& name, int vectorLength, SensorFunction signal);
    void registerActuator(const std::string& name, int vectorLength, ActuatorFunction consume);

    const SensorInterface* findSensor(const std::string& name) const;
    const ActuatorInterface* findActuator(const std::string& name) const;

private:
    std::map<std::string, SensorInterface> sensors_;
    std::map<std::string, ActuatorInterface> actuators_;
};

} // namespace NeuroEvo
