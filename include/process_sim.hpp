#ifndef PROCESS_SIM_H
#define PROCESS_SIM_H

#include <cstdint>
#include <string>
#include <vector>
#include <variant>

#include <yaml-cpp/yaml.h>

/// @brief Defines the access type for a Modbus register.
enum class RegisterAccess {
    RO, ///< Read Only
    RW  ///< Read Write
};

/// @brief Defines the data type for a Modbus register.
enum class RegisterType {
    U16,
    U32,
    S32,
    U64
};

using RegisterValue = std::variant<uint16_t, uint32_t, int32_t, uint64_t>;

/// @brief Number of 16-bit Modbus words a register of the given type occupies.
inline size_t registerWidth(RegisterType type) {
    switch (type) {
        case RegisterType::U16: return 1;
        case RegisterType::U32: return 2;
        case RegisterType::S32: return 2;
        case RegisterType::U64: return 4;
    }
    return 1;
}

/**
 * @struct TelemetryPoint
 * @brief One published value of a simulated instance, relative to its slot.
 */
struct TelemetryPoint {
    uint16_t offset;
    RegisterType type;
    RegisterValue value;
};

/**
 * @struct ServiceParams
 * @brief Process-wide settings.
 */
struct ServiceParams {
    std::string agent_name = "Process Simulations";
    int tick_interval_ms = 1000;
    std::string log_level = "info";
};

/**
 * @struct PersistenceParams
 * @brief Controls where instance records live and how restore retries.
 */
struct PersistenceParams {
    bool enabled = true;
    std::string directory; // empty: <tmp>/<agent_name>
    int max_restore_attempts = 10;
    int retry_backoff_ms = 500;
};

/**
 * @struct ModbusParams
 * @brief Holds parameters of the Modbus TCP telemetry gateway.
 */
struct ModbusParams {
    bool enabled = true;
    std::string listen_address = "127.0.0.1";
    int port = 1502;
    int unit_id = 3;
    int max_slots = 64;
};

/**
 * @struct InstanceSeed
 * @brief An instance created at startup unless one with the same id was restored.
 */
struct InstanceSeed {
    std::string class_name;
    std::string id; // empty: generated
    YAML::Node args;
};

/**
 * @struct Config
 * @brief Top-level structure to hold the entire parsed configuration.
 */
struct Config {
    ServiceParams service;
    PersistenceParams persistence;
    ModbusParams modbus;
    std::vector<InstanceSeed> instances;
};

#endif // PROCESS_SIM_H
