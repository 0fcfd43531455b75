#ifndef SIMULATION_CLASSES_H
#define SIMULATION_CLASSES_H

#include "consumption_simulator.hpp"
#include "silo_simulator.hpp"
#include "instance_registry.hpp"
#include <chrono>

/**
 * @brief Reads ConsumptionSimulator arguments: [{power, gas, water}].
 * @throw std::invalid_argument if a value is missing, negative or not a number.
 */
AnnualConsumption parseConsumptionArgs(const YAML::Node& args);

/**
 * @brief Reads SiloSimulator arguments: [] or [{capacity?, timeToEmpty?}].
 * @throw std::invalid_argument if a present value is not a positive number.
 */
SiloParams parseSiloArgs(const YAML::Node& args);

/**
 * @brief Registers ConsumptionSimulator and SiloSimulator with the registry.
 *
 * Instances built by these factories start ticking right away.
 */
void registerSimulationClasses(InstanceRegistry& registry, std::chrono::milliseconds tick_interval);

#endif // SIMULATION_CLASSES_H
