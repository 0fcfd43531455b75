#include "config_loader.hpp"
#include "log.hpp"
#include <stdexcept>

namespace {

// Reads node[key] as T when present, keeping the default otherwise.
template <typename T>
void readOptional(const YAML::Node& node, const char* key, T& target) {
    if (node && node[key]) {
        try {
            target = node[key].as<T>();
        } catch (const YAML::Exception& e) {
            throw std::runtime_error(std::string("Invalid value for \"") + key + "\": " + e.what());
        }
    }
}

void requireRange(const char* key, long value, long min, long max) {
    if (value < min || value > max) {
        throw std::runtime_error(std::string("\"") + key + "\" must be within " + std::to_string(min) + ".." +
                                 std::to_string(max) + ", got " + std::to_string(value));
    }
}

} // namespace

Config ConfigLoader::loadConfig(const std::string& filename) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Cannot load configuration " + filename + ": " + e.what());
    }
    return fromNode(root);
}

Config ConfigLoader::parseConfig(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Cannot parse configuration: ") + e.what());
    }
    return fromNode(root);
}

Config ConfigLoader::fromNode(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) return config;
    if (!root.IsMap()) {
        throw std::runtime_error("Configuration root must be a map");
    }

    // Load Service Parameters
    const auto& service_node = root["service"];
    readOptional(service_node, "agent_name", config.service.agent_name);
    readOptional(service_node, "tick_interval_ms", config.service.tick_interval_ms);
    readOptional(service_node, "log_level", config.service.log_level);
    requireRange("tick_interval_ms", config.service.tick_interval_ms, 1, 3600 * 1000);
    try {
        parseLogLevel(config.service.log_level);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }

    // Load Persistence Parameters
    const auto& persistence_node = root["persistence"];
    readOptional(persistence_node, "enabled", config.persistence.enabled);
    readOptional(persistence_node, "directory", config.persistence.directory);
    readOptional(persistence_node, "max_restore_attempts", config.persistence.max_restore_attempts);
    readOptional(persistence_node, "retry_backoff_ms", config.persistence.retry_backoff_ms);
    requireRange("max_restore_attempts", config.persistence.max_restore_attempts, 0, 1000000);
    requireRange("retry_backoff_ms", config.persistence.retry_backoff_ms, 0, 3600 * 1000);

    // Load Modbus Parameters
    const auto& modbus_node = root["modbus"];
    readOptional(modbus_node, "enabled", config.modbus.enabled);
    readOptional(modbus_node, "listen_address", config.modbus.listen_address);
    readOptional(modbus_node, "port", config.modbus.port);
    readOptional(modbus_node, "unit_id", config.modbus.unit_id);
    readOptional(modbus_node, "max_slots", config.modbus.max_slots);
    requireRange("port", config.modbus.port, 1, 65535);
    requireRange("unit_id", config.modbus.unit_id, 0, 247);
    requireRange("max_slots", config.modbus.max_slots, 1, 10000 / 32);

    // Load Bootstrap Instances
    const auto& instance_nodes = root["instances"];
    if (instance_nodes) {
        if (!instance_nodes.IsSequence()) {
            throw std::runtime_error("\"instances\" must be a sequence");
        }
        for (size_t index = 0; index < instance_nodes.size(); ++index) {
            const YAML::Node node = instance_nodes[index];
            InstanceSeed seed;
            readOptional(node, "class", seed.class_name);
            if (seed.class_name.empty()) {
                throw std::runtime_error("Every entry of \"instances\" needs a \"class\"");
            }
            readOptional(node, "id", seed.id);
            if (seed.id.empty()) {
                // Stable across restarts, so a restored seed is not created twice.
                seed.id = seed.class_name + "-" + std::to_string(index + 1);
            }
            seed.args = node["args"] ? YAML::Clone(node["args"]) : YAML::Node(YAML::NodeType::Sequence);
            config.instances.push_back(seed);
        }
    }
    return config;
}
