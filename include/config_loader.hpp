#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "process_sim.hpp"
#include <string>

/**
 * @class ConfigLoader
 * @brief Parses the YAML configuration file to populate the Config structure.
 *
 * This class uses the yaml-cpp library to read the service, persistence and
 * Modbus settings and the instances to create at startup. Missing keys keep
 * their defaults.
 */
class ConfigLoader {
public:
    /**
     * @brief Loads and parses the YAML configuration file.
     * @param filename The path to the YAML configuration file.
     * @return A Config object populated with data from the file.
     * @throw std::runtime_error if the file cannot be opened, parsed or validated.
     */
    static Config loadConfig(const std::string& filename);

    /**
     * @brief Parses configuration from YAML text.
     * @throw std::runtime_error if the text cannot be parsed or validated.
     */
    static Config parseConfig(const std::string& yaml_text);

private:
    static Config fromNode(const YAML::Node& root);
};

#endif // CONFIG_LOADER_H
