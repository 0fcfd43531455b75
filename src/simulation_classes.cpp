#include "simulation_classes.hpp"
#include <cmath>
#include <stdexcept>

namespace {

// The first element of the argument sequence carries the options map.
YAML::Node optionsOf(const YAML::Node& args) {
    if (!args || args.IsNull()) return YAML::Node();
    if (!args.IsSequence()) {
        throw std::invalid_argument("arguments must be a sequence");
    }
    if (args.size() == 0) return YAML::Node();
    YAML::Node options = args[0];
    if (!options.IsMap()) {
        throw std::invalid_argument("first argument must be a map");
    }
    return options;
}

double readNumber(const YAML::Node& options, const std::string& key) {
    double value;
    try {
        value = options[key].as<double>();
    } catch (const YAML::Exception&) {
        throw std::invalid_argument("\"" + key + "\" must be a number");
    }
    if (!std::isfinite(value)) {
        throw std::invalid_argument("\"" + key + "\" must be finite");
    }
    return value;
}

double readAnnual(const YAML::Node& options, const std::string& key) {
    if (!options.IsMap() || !options[key]) {
        throw std::invalid_argument("missing annual consumption \"" + key + "\"");
    }
    double value = readNumber(options, key);
    if (value < 0) {
        throw std::invalid_argument("\"" + key + "\" must not be negative");
    }
    return value;
}

} // namespace

AnnualConsumption parseConsumptionArgs(const YAML::Node& args) {
    const YAML::Node options = optionsOf(args);
    AnnualConsumption annual{};
    annual.power = readAnnual(options, "power");
    annual.gas = readAnnual(options, "gas");
    annual.water = readAnnual(options, "water");
    return annual;
}

SiloParams parseSiloArgs(const YAML::Node& args) {
    const YAML::Node options = optionsOf(args);
    SiloParams params;
    if (!options.IsMap()) return params;

    if (options["capacity"]) {
        params.capacity = readNumber(options, "capacity");
        if (params.capacity <= 0) {
            throw std::invalid_argument("\"capacity\" must be positive");
        }
    }
    if (options["timeToEmpty"]) {
        params.time_to_empty = readNumber(options, "timeToEmpty");
        if (params.time_to_empty <= 0) {
            throw std::invalid_argument("\"timeToEmpty\" must be positive");
        }
    }
    return params;
}

void registerSimulationClasses(InstanceRegistry& registry, std::chrono::milliseconds tick_interval) {
    registry.registerClass("ConsumptionSimulator", [tick_interval](const YAML::Node& args) {
        auto instance = std::make_shared<ConsumptionSimulator>(parseConsumptionArgs(args), tick_interval);
        instance->start();
        return std::static_pointer_cast<SimulatedInstance>(instance);
    });

    registry.registerClass("SiloSimulator", [tick_interval](const YAML::Node& args) {
        auto instance = std::make_shared<SiloSimulator>(parseSiloArgs(args), tick_interval);
        instance->start();
        return std::static_pointer_cast<SimulatedInstance>(instance);
    });
}
