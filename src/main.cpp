#include "process_sim.hpp"
#include "config_loader.hpp"
#include "log.hpp"
#include "instance_registry.hpp"
#include "simulation_classes.hpp"
#include "record_store.hpp"
#include "file_record_store.hpp"
#include "instance_persistor.hpp"
#include "register_map.hpp"
#include "telemetry_gateway.hpp"
#include "modbus_server.hpp"
#include "sim_errors.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>

namespace {

const char* kModule = "main";

std::atomic<bool> g_shutdown_requested(false);

/**
 * @brief Signal handler for graceful shutdown (e.g., on Ctrl+C).
 */
void signal_handler(int) {
    g_shutdown_requested = true;
}

std::shared_ptr<RecordStore> openRecordStore(const Config& config) {
    if (!config.persistence.enabled) {
        logWarn(kModule, "Persistence disabled, instances will not survive a restart");
        return std::make_shared<InMemoryRecordStore>();
    }

    std::filesystem::path directory = config.persistence.directory;
    if (directory.empty()) {
        std::error_code ec;
        std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
        directory = (ec ? std::filesystem::path("/tmp") : tmp) / config.service.agent_name;
    }

    try {
        auto store = std::make_shared<FileRecordStore>(directory);
        logInfo(kModule, "Persisting to: " + store->directory().string());
        return store;
    } catch (const StoreError& e) {
        logError(kModule, std::string("Could not open record store, continuing unpersisted: ") + e.what());
        return std::make_shared<InMemoryRecordStore>();
    }
}

void createSeedInstances(InstanceRegistry& registry, const Config& config) {
    for (const auto& seed : config.instances) {
        if (!registry.hasClass(seed.class_name)) {
            logError(kModule, "Configured instance " + seed.id + " names unknown class " + seed.class_name);
            continue;
        }
        if (registry.contains(seed.id)) {
            logInfo(kModule, "Instance " + seed.id + " was restored, not creating it again");
            continue;
        }
        try {
            registry.create(seed.class_name, seed.args, seed.id);
        } catch (const InstanceError& e) {
            logError(kModule, std::string("Could not create configured instance: ") + e.what());
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    // --- 1. Load Configuration ---
    std::string config_file = "process_sim.yaml";
    if (argc > 1) {
        config_file = argv[1];
    }

    Config config;
    try {
        config = ConfigLoader::loadConfig(config_file);
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return 1;
    }
    setLogLevel(parseLogLevel(config.service.log_level));
    logInfo(kModule, "Configuration loaded from: " + config_file);

    // --- 2. Register Simulation Classes ---
    InstanceRegistry registry;
    registerSimulationClasses(registry, std::chrono::milliseconds(config.service.tick_interval_ms));

    // --- 3. Expose Instances over Modbus ---
    auto register_map = std::make_shared<RegisterMap>();
    TelemetryGateway gateway(registry, register_map, static_cast<size_t>(config.modbus.max_slots));
    gateway.attach();

    // --- 4. Restore Persisted Instances ---
    PersistorOptions options;
    options.max_restore_attempts = config.persistence.max_restore_attempts;
    options.retry_backoff = std::chrono::milliseconds(config.persistence.retry_backoff_ms);
    InstancePersistor persistor(registry, openRecordStore(config), options);
    persistor.restore();

    createSeedInstances(registry, config);
    logInfo(kModule, std::to_string(registry.size()) + " instance(s) running");

    // --- 5. Start Modbus Server ---
    ModbusServer modbus_server(register_map, config.modbus.unit_id);
    if (config.modbus.enabled && !modbus_server.start(config.modbus.listen_address, config.modbus.port)) {
        logError(kModule, "Failed to start Modbus server, simulations keep running without it");
    }

    // --- 6. Wait for Shutdown ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    logInfo(kModule, "Process simulations are running. Press Ctrl+C to exit.");

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    logInfo(kModule, "Shutting down gracefully...");
    modbus_server.stop();
    persistor.detach();
    gateway.detach();
    registry.removeAll();
    return 0;
}
